#include "taxonomy/taxonomy.hpp"
#include "util/logger.hpp"
#include <algorithm>
#include <fstream>
#include <thread>

using json = nlohmann::json;

namespace wdi {

std::vector<TaxonomySpec> default_taxonomy_specs() {
    return {
        {
            Taxonomy::ORGANIZATION,
            {"Q43229"},
            {"Q6256", "Q515", "Q5119", "Q15916867", "Q8436", "Q623109", "Q17350442"}
        },
        {
            Taxonomy::LOCATION,
            {"Q2221906"},
            {"Q2095", "Q2385804", "Q327333", "Q484652", "Q12143"}
        }
    };
}

// ============================================================================
// Taxonomy
// ============================================================================

Taxonomy::Taxonomy(std::map<std::string, std::unordered_set<std::string>> sets)
    : sets_(std::move(sets)) {}

bool Taxonomy::contains(const std::string& set_name, const std::string& id) const {
    auto it = sets_.find(set_name);
    return it != sets_.end() && it->second.count(id) > 0;
}

const std::unordered_set<std::string>& Taxonomy::members(const std::string& set_name) const {
    static const std::unordered_set<std::string> empty;
    auto it = sets_.find(set_name);
    return it != sets_.end() ? it->second : empty;
}

std::vector<std::string> Taxonomy::names() const {
    std::vector<std::string> result;
    for (const auto& [name, _] : sets_) {
        result.push_back(name);
    }
    return result;
}

json Taxonomy::to_json() const {
    json j = json::object();
    for (const auto& [name, ids] : sets_) {
        std::vector<std::string> sorted(ids.begin(), ids.end());
        std::sort(sorted.begin(), sorted.end());
        j[name] = sorted;
    }
    return j;
}

Taxonomy Taxonomy::from_json(const json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("Taxonomy JSON must be an object of name -> [ids]");
    }
    std::map<std::string, std::unordered_set<std::string>> sets;
    for (auto& [name, ids] : j.items()) {
        auto& target = sets[name];
        for (const auto& id : ids) {
            target.insert(id.get<std::string>());
        }
    }
    return Taxonomy(std::move(sets));
}

void Taxonomy::save_to_json(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open taxonomy file for writing: " + path);
    }
    file << to_json().dump(2);
}

Taxonomy Taxonomy::load_from_json(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open taxonomy file: " + path);
    }
    json j;
    file >> j;
    return from_json(j);
}

// ============================================================================
// TaxonomyResolver
// ============================================================================

TaxonomyResolver::TaxonomyResolver(GraphQueryClient& client, const RetryPolicy& policy)
    : client_(client), policy_(policy) {}

std::vector<GraphNode> TaxonomyResolver::query_with_retry(
    const std::vector<std::string>& roots,
    TraversalDirection direction,
    int& attempts
) {
    int max_attempts = std::max(1, policy_.max_attempts);
    attempts = 0;

    while (true) {
        attempts++;
        queries_issued_++;
        try {
            return client_.reachable(roots, ids::SUBCLASS_OF, direction);
        } catch (const RateLimitedError& e) {
            if (attempts >= max_attempts) {
                throw;
            }
            Logger::warn(std::string("Rate limit hit, retrying in ") +
                         std::to_string(policy_.delay.count()) + " ms (attempt " +
                         std::to_string(attempts) + "/" + std::to_string(max_attempts) + ")");
            std::this_thread::sleep_for(policy_.delay);
        }
    }
}

std::unordered_set<std::string> TaxonomyResolver::closure(
    const std::vector<std::string>& roots,
    const std::unordered_set<std::string>& exclude
) {
    std::unordered_set<std::string> result;

    try {
        int attempts = 0;
        for (auto& node : query_with_retry(roots, TraversalDirection::Backward, attempts)) {
            if (exclude.count(node.id) == 0) {
                result.insert(std::move(node.id));
            }
        }
    } catch (const std::exception& e) {
        std::string joined;
        for (const auto& r : roots) {
            joined += (joined.empty() ? "" : ",") + r;
        }
        Logger::warn("Subclass closure of " + joined + " unavailable, using empty set: " + e.what());
        result.clear();
    }

    return result;
}

std::unordered_set<std::string> TaxonomyResolver::resolve_or_empty(
    const std::vector<std::string>& roots,
    const std::vector<std::string>& exclude_roots
) {
    std::unordered_set<std::string> excluded;
    for (const auto& root : exclude_roots) {
        auto sub = closure({root});
        excluded.insert(sub.begin(), sub.end());
    }
    return closure(roots, excluded);
}

Taxonomy TaxonomyResolver::build(const std::vector<TaxonomySpec>& specs) {
    std::map<std::string, std::unordered_set<std::string>> sets;
    for (const auto& spec : specs) {
        Logger::step("Resolving taxonomy '" + spec.name + "'");
        sets[spec.name] = resolve_or_empty(spec.roots, spec.excludes);
        Logger::info("  " + spec.name + ": " + std::to_string(sets[spec.name].size()) + " classes");
    }
    return Taxonomy(std::move(sets));
}

SuperclassResult TaxonomyResolver::superclasses(const std::string& type_id) {
    SuperclassResult result;

    try {
        auto nodes = query_with_retry({type_id}, TraversalDirection::Forward, result.attempts);
        std::unordered_set<std::string> seen;
        for (auto& node : nodes) {
            if (seen.insert(node.id).second) {
                result.ids.push_back(std::move(node.id));
            }
        }
        result.success = true;
    } catch (const std::exception& e) {
        result.success = false;
        result.ids.clear();
        result.error_message = e.what();
        Logger::debug("Superclass lookup for " + type_id + " failed: " + e.what());
    }

    return result;
}

} // namespace wdi
