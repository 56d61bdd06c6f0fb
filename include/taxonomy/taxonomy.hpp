#pragma once

#include "query/graph_client.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_set>
#include <vector>

namespace wdi {

/**
 * @brief Well-known Wikidata identifiers used by classification
 */
namespace ids {
    inline const std::string HUMAN = "Q5";
    inline const std::string INSTANCE_OF = "P31";
    inline const std::string SUBCLASS_OF = "P279";
    inline const std::string OCCUPATION = "P106";
}

// ============================================================================
// Taxonomy Definition
// ============================================================================

/**
 * @brief One named category set: closure(roots) minus the closures of excludes
 */
struct TaxonomySpec {
    std::string name;
    std::vector<std::string> roots;
    std::vector<std::string> excludes;
};

/**
 * @brief The base taxonomy used for NER tagging
 *
 * organization: Q43229 minus country, city, capital, administrative territorial
 *   entity, family, sports league, venue.
 * location: Q2221906 minus food, educational institution, government agency,
 *   international organization, time zone.
 */
std::vector<TaxonomySpec> default_taxonomy_specs();

// ============================================================================
// Taxonomy
// ============================================================================

/**
 * @brief Immutable named sets of category identifiers
 *
 * Built once at startup and shared read-only by all workers.
 */
class Taxonomy {
public:
    static constexpr const char* ORGANIZATION = "organization";
    static constexpr const char* LOCATION = "location";

    Taxonomy() = default;
    explicit Taxonomy(std::map<std::string, std::unordered_set<std::string>> sets);

    bool contains(const std::string& set_name, const std::string& id) const;
    bool is_location(const std::string& id) const { return contains(LOCATION, id); }
    bool is_organization(const std::string& id) const { return contains(ORGANIZATION, id); }

    /**
     * @brief Members of a named set (empty if the set is unknown)
     */
    const std::unordered_set<std::string>& members(const std::string& set_name) const;

    std::vector<std::string> names() const;
    size_t size(const std::string& set_name) const { return members(set_name).size(); }

    nlohmann::json to_json() const;
    static Taxonomy from_json(const nlohmann::json& j);

    void save_to_json(const std::string& path) const;
    static Taxonomy load_from_json(const std::string& path);

private:
    std::map<std::string, std::unordered_set<std::string>> sets_;
};

// ============================================================================
// Taxonomy Resolver
// ============================================================================

/**
 * @brief Retry budget for rate-limited graph queries
 */
struct RetryPolicy {
    int max_attempts = 3;
    std::chrono::milliseconds delay{5000};
};

/**
 * @brief Outcome of one superclass-chain lookup
 */
struct SuperclassResult {
    std::vector<std::string> ids;           ///< Type itself followed by its ancestors
    bool success = false;
    int attempts = 0;
    std::string error_message;
};

/**
 * @brief Resolves taxonomy closures and superclass chains through a GraphQueryClient
 *
 * Rate-limited queries are retried with a fixed delay up to the retry budget;
 * any other failure gives up at once.
 */
class TaxonomyResolver {
public:
    TaxonomyResolver(GraphQueryClient& client, const RetryPolicy& policy);

    /**
     * @brief Subclass closure of `roots` minus `exclude`
     *
     * Issues one backward P279 query. A failed query yields an empty set and a
     * warning; the run continues with reduced recall.
     */
    std::unordered_set<std::string> closure(
        const std::vector<std::string>& roots,
        const std::unordered_set<std::string>& exclude = {}
    );

    /**
     * @brief closure(roots) minus the union of closure(r) for every r in exclude_roots
     *
     * Each sub-query is fault-isolated.
     */
    std::unordered_set<std::string> resolve_or_empty(
        const std::vector<std::string>& roots,
        const std::vector<std::string>& exclude_roots
    );

    /**
     * @brief Build an immutable Taxonomy from its definitions
     */
    Taxonomy build(const std::vector<TaxonomySpec>& specs);

    /**
     * @brief Transitive superclass chain of one type (forward P279*)
     *
     * Never throws; a failed lookup returns success=false and no ids.
     */
    SuperclassResult superclasses(const std::string& type_id);

    uint64_t queries_issued() const { return queries_issued_.load(); }

private:
    GraphQueryClient& client_;
    RetryPolicy policy_;
    std::atomic<uint64_t> queries_issued_{0};

    std::vector<GraphNode> query_with_retry(
        const std::vector<std::string>& roots,
        TraversalDirection direction,
        int& attempts
    );
};

} // namespace wdi
