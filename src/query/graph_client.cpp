#include "query/graph_client.hpp"
#include "util/logger.hpp"
#include <nlohmann/json.hpp>
#include <curl/curl.h>
#include <cctype>
#include <sstream>

using json = nlohmann::json;

namespace wdi {

// ============================================================================
// Helper Functions for HTTP Requests
// ============================================================================

namespace {

// CURL write callback
size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t total_size = size * nmemb;
    userp->append(static_cast<char*>(contents), total_size);
    return total_size;
}

std::string url_escape(CURL* curl, const std::string& value) {
    char* escaped = curl_easy_escape(curl, value.c_str(), static_cast<int>(value.size()));
    if (!escaped) {
        throw GraphQueryError("Failed to URL-encode query");
    }
    std::string result(escaped);
    curl_free(escaped);
    return result;
}

const char* SPARQL_PREFIXES =
    "PREFIX wd: <http://www.wikidata.org/entity/>\n"
    "PREFIX wdt: <http://www.wikidata.org/prop/direct/>\n"
    "PREFIX wikibase: <http://wikiba.se/ontology#>\n"
    "PREFIX bd: <http://www.bigdata.com/rdf#>\n";

} // anonymous namespace

// ============================================================================
// SparqlGraphClient
// ============================================================================

SparqlGraphClient::SparqlGraphClient(const GraphQueryConfig& config) : config_(config) {}

std::string SparqlGraphClient::build_query(
    const std::vector<std::string>& roots,
    const std::string& property,
    TraversalDirection direction
) {
    if (roots.empty()) {
        throw GraphQueryError("Reachability query needs at least one root");
    }
    if (!is_entity_id(property) || property[0] != 'P') {
        throw GraphQueryError("Invalid edge property: " + property);
    }

    std::ostringstream values;
    for (const auto& root : roots) {
        if (!is_entity_id(root)) {
            throw GraphQueryError("Invalid root identifier: " + root);
        }
        values << " wd:" << root;
    }

    std::ostringstream q;
    q << SPARQL_PREFIXES;
    if (direction == TraversalDirection::Forward) {
        q << "SELECT DISTINCT ?item ?itemLabel WHERE {\n"
          << "  VALUES ?root {" << values.str() << " }\n"
          << "  ?root (wdt:" << property << ")* ?item .\n"
          << "  SERVICE wikibase:label { bd:serviceParam wikibase:language \"[AUTO_LANGUAGE],en\". }\n"
          << "}";
    } else {
        q << "SELECT DISTINCT ?item WHERE {\n"
          << "  VALUES ?root {" << values.str() << " }\n"
          << "  ?item (wdt:" << property << ")* ?root .\n"
          << "}";
    }
    return q.str();
}

std::vector<GraphNode> SparqlGraphClient::parse_response(const std::string& body) {
    std::vector<GraphNode> nodes;

    json j;
    try {
        j = json::parse(body);
    } catch (const json::parse_error& e) {
        throw GraphQueryError(std::string("Failed to decode SPARQL response: ") + e.what());
    }

    if (!j.contains("results") || !j["results"].contains("bindings") ||
        !j["results"]["bindings"].is_array()) {
        throw GraphQueryError("SPARQL response has no results.bindings array");
    }

    for (const auto& binding : j["results"]["bindings"]) {
        if (!binding.contains("item")) continue;
        const auto& item = binding["item"];
        if (!item.contains("value") || !item["value"].is_string()) continue;

        GraphNode node;
        node.id = entity_id_from_iri(item["value"].get<std::string>());
        if (node.id.empty()) continue;

        if (binding.contains("itemLabel") && binding["itemLabel"].contains("value")) {
            node.label = binding["itemLabel"]["value"].get<std::string>();
        }
        nodes.push_back(std::move(node));
    }

    return nodes;
}

std::string SparqlGraphClient::http_get(const std::string& query) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw GraphQueryError("Failed to initialize CURL");
    }

    std::string url;
    try {
        url = config_.endpoint_url + "?format=json&query=" + url_escape(curl, query);
    } catch (...) {
        curl_easy_cleanup(curl);
        throw;
    }

    std::string response;
    struct curl_slist* header_list = nullptr;
    header_list = curl_slist_append(header_list, "Accept: application/sparql-results+json");

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(config_.timeout_seconds));
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);

    curl_slist_free_all(header_list);

    if (res != CURLE_OK) {
        std::string error = curl_easy_strerror(res);
        curl_easy_cleanup(curl);
        throw GraphQueryError("CURL request failed: " + error);
    }

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    curl_easy_cleanup(curl);

    if (http_code == 429) {
        throw RateLimitedError("HTTP 429 Too Many Requests from " + config_.endpoint_url);
    }
    if (http_code < 200 || http_code >= 300) {
        throw GraphQueryError(
            "HTTP request failed with code " + std::to_string(http_code) +
            ": " + response.substr(0, 512)
        );
    }

    return response;
}

std::vector<GraphNode> SparqlGraphClient::reachable(
    const std::vector<std::string>& roots,
    const std::string& property,
    TraversalDirection direction
) {
    std::string query = build_query(roots, property, direction);

    if (config_.verbose) {
        Logger::debug("SPARQL " + std::string(direction == TraversalDirection::Forward ? "forward" : "backward") +
                      " " + property + "* from " + std::to_string(roots.size()) + " root(s)");
    }

    return parse_response(http_get(query));
}

// ============================================================================
// Utility Functions
// ============================================================================

bool is_entity_id(const std::string& id) {
    if (id.size() < 2) return false;
    if (id[0] != 'Q' && id[0] != 'P' && id[0] != 'L') return false;
    for (size_t i = 1; i < id.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(id[i]))) return false;
    }
    return true;
}

std::string entity_id_from_iri(const std::string& iri) {
    auto slash = iri.rfind('/');
    std::string tail = (slash == std::string::npos) ? iri : iri.substr(slash + 1);
    return is_entity_id(tail) ? tail : std::string();
}

} // namespace wdi
