#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace wdi {

// ============================================================================
// Data Structures
// ============================================================================

/**
 * @brief Configuration for the remote graph-query service
 */
struct GraphQueryConfig {
    std::string endpoint_url = "https://query.wikidata.org/sparql";  ///< SPARQL endpoint
    std::string user_agent = "wdingest/1.0 (knowledge-graph dump ingestion)";
    int timeout_seconds = 300;              ///< Request timeout
    bool verbose = false;                   ///< Log every query
};

/**
 * @brief One identifier reachable from the query roots
 */
struct GraphNode {
    std::string id;                         ///< Entity identifier, e.g. "Q43229"
    std::string label;                      ///< Human-readable label (may be empty)
};

/**
 * @brief Which way to follow the edge property
 *
 * Forward: root --P--> x (ancestors for P279).
 * Backward: x --P--> root (descendants for P279).
 */
enum class TraversalDirection {
    Forward,
    Backward
};

/**
 * @brief Transport, HTTP status or decode failure of a graph query
 */
class GraphQueryError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief The service rejected the query with HTTP 429
 *
 * Kept distinct from GraphQueryError so callers retry only in this case.
 */
class RateLimitedError : public GraphQueryError {
public:
    using GraphQueryError::GraphQueryError;
};

// ============================================================================
// Graph Query Client Interface
// ============================================================================

/**
 * @brief Abstract client for transitive reachability queries
 */
class GraphQueryClient {
public:
    virtual ~GraphQueryClient() = default;

    /**
     * @brief All identifiers reachable from `roots` by zero or more hops along `property`
     *
     * The roots themselves are part of the result (zero hops).
     *
     * @param roots Root identifiers, e.g. {"Q43229"}
     * @param property Edge property, e.g. "P279"
     * @param direction Follow the edge forward or backward
     * @throws RateLimitedError when the service throttles the request
     * @throws GraphQueryError on any other failure
     */
    virtual std::vector<GraphNode> reachable(
        const std::vector<std::string>& roots,
        const std::string& property,
        TraversalDirection direction
    ) = 0;

    /**
     * @brief Client name for logging
     */
    virtual std::string get_name() const = 0;
};

// ============================================================================
// SPARQL Client
// ============================================================================

/**
 * @brief GraphQueryClient over a SPARQL 1.1 endpoint (Wikidata Query Service)
 */
class SparqlGraphClient : public GraphQueryClient {
public:
    explicit SparqlGraphClient(const GraphQueryConfig& config);

    std::vector<GraphNode> reachable(
        const std::vector<std::string>& roots,
        const std::string& property,
        TraversalDirection direction
    ) override;

    std::string get_name() const override { return "SPARQL " + config_.endpoint_url; }

    /**
     * @brief Build the property-path query for a reachability request
     *
     * Forward queries ask the label service for English labels; backward
     * queries (taxonomy closures, often very large) return identifiers only.
     *
     * @throws GraphQueryError if an identifier is not a plain entity id
     */
    static std::string build_query(
        const std::vector<std::string>& roots,
        const std::string& property,
        TraversalDirection direction
    );

    /**
     * @brief Decode a SPARQL JSON result document
     *
     * Bindings whose ?item is not an entity IRI are skipped.
     *
     * @throws GraphQueryError if the document is not valid SPARQL JSON
     */
    static std::vector<GraphNode> parse_response(const std::string& body);

private:
    GraphQueryConfig config_;

    std::string http_get(const std::string& query);
};

// ============================================================================
// Utility Functions
// ============================================================================

/**
 * @brief True for identifiers like "Q5" or "P279"
 */
bool is_entity_id(const std::string& id);

/**
 * @brief Last path segment of an entity IRI, or "" if it is not an entity IRI
 *
 * "http://www.wikidata.org/entity/Q5" -> "Q5"
 */
std::string entity_id_from_iri(const std::string& iri);

} // namespace wdi
