#pragma once

#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace wdi {

// ============================================================================
// Enumerations
// ============================================================================

/**
 * @brief Coarse kind of an entity
 */
enum class EntityCategory {
    Entity,
    Type,
    Predicate
};

/**
 * @brief Named-entity tag derived from instance-of claims
 */
enum class NerTag {
    PERS,
    LOC,
    ORG,
    OTHERS
};

/**
 * @brief Category under which a literal claim value is filed
 */
enum class LiteralKind {
    STRING,
    NUMBER,
    DATETIME,
    GEOSHAPE,
    MATH,
    MUSICAL_NOTATION,
    TABULAR_DATA
};

std::string to_string(EntityCategory category);
std::string to_string(NerTag tag);
std::string to_string(LiteralKind kind);

/**
 * @brief All literal kinds, in declaration order
 */
const std::vector<LiteralKind>& all_literal_kinds();

// ============================================================================
// Raw Entity
// ============================================================================

/**
 * @brief A dump line that decoded as JSON but is not a usable entity
 */
class EntityFormatError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief One claim (mainsnak) of an entity
 */
struct Claim {
    std::string datatype;                         ///< mainsnak.datatype, e.g. "wikibase-item"
    std::optional<nlohmann::json> value;          ///< mainsnak.datavalue.value, absent for somevalue/novalue

    bool has_value() const { return value.has_value(); }
};

/**
 * @brief An entity as decoded from one dump line
 */
struct RawEntity {
    std::string id;                                              ///< "Q42", "P31", ...
    std::string type;                                            ///< "item" or "property"
    std::map<std::string, std::string> labels;                   ///< language -> label
    std::map<std::string, std::vector<std::string>> aliases;     ///< language -> aliases (as found)
    std::map<std::string, std::string> descriptions;             ///< language -> description
    size_t sitelink_count = 0;
    std::string enwiki_title;                                    ///< Title of the enwiki sitelink, if any
    std::map<std::string, std::vector<Claim>> claims;            ///< predicate -> claims

    /**
     * @brief Extract an entity from a decoded dump document
     *
     * @throws EntityFormatError if the document has no string "id"
     * @throws nlohmann::json::exception on structurally invalid fields
     */
    static RawEntity from_json(const nlohmann::json& j);

    bool has_claim(const std::string& predicate) const { return claims.count(predicate) > 0; }
};

// ============================================================================
// Derived Records
// ============================================================================

/**
 * @brief Core metadata of one entity
 */
struct ItemRecord {
    int64_t id_entity = 0;                                        ///< Stream position of the source line
    std::string entity;
    std::string description;                                      ///< English description
    std::map<std::string, std::string> labels;
    std::map<std::string, std::vector<std::string>> aliases;      ///< Deduplicated per language
    std::map<std::string, std::vector<std::string>> types;        ///< {"P31": instance-of and occupation targets}
    std::vector<std::string> explicit_types;                      ///< instance-of targets
    std::vector<std::string> extended_types;                      ///< Union of their superclass chains
    int popularity = 1;                                           ///< Sitelink count, at least 1
    EntityCategory category = EntityCategory::Entity;
    std::vector<NerTag> ner_types;                                ///< Distinct tags, first-seen order
    std::map<std::string, std::string> urls;                      ///< wikidata / wikipedia / dbpedia

    nlohmann::json to_json() const;
};

/**
 * @brief Object-valued relations: related entity -> linking predicates
 */
struct ObjectRecord {
    int64_t id_entity = 0;
    std::string entity;
    std::map<std::string, std::set<std::string>> objects;

    nlohmann::json to_json() const;
};

/**
 * @brief Literal-valued relations: kind -> predicate -> values
 *
 * Every literal kind is present, possibly with an empty map.
 */
struct LiteralRecord {
    int64_t id_entity = 0;
    std::string entity;
    std::map<LiteralKind, std::map<std::string, std::vector<nlohmann::json>>> literals;

    LiteralRecord();

    bool empty() const;
    nlohmann::json to_json() const;
};

/**
 * @brief Explicit instance-of/occupation set, stored for independent lookup
 */
struct TypeRecord {
    int64_t id_entity = 0;
    std::string entity;
    std::map<std::string, std::vector<std::string>> types;

    nlohmann::json to_json() const;
};

/**
 * @brief A per-entity processing failure
 */
struct ErrorRecord {
    std::string entity;                     ///< Empty when the identifier is unknown
    std::string error;                      ///< Exception message
    std::string context;                    ///< Stage, exception kind and stream position

    nlohmann::json to_json() const;
};

/**
 * @brief All records derived from one entity
 */
struct EntityRecords {
    ItemRecord item;
    ObjectRecord objects;
    LiteralRecord literals;
    TypeRecord types;
};

} // namespace wdi
