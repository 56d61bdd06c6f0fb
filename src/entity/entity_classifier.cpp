#include "entity/entity_classifier.hpp"
#include <algorithm>
#include <set>
#include <unordered_set>

using json = nlohmann::json;

namespace wdi {

namespace {

const std::unordered_set<std::string> SKIPPED_DATATYPES = {
    "wikibase-lexeme",
    "wikibase-form",
    "wikibase-sense"
};

std::string replace_spaces(std::string value) {
    std::replace(value.begin(), value.end(), ' ', '_');
    return value;
}

std::vector<std::string> deduplicate(const std::vector<std::string>& values) {
    std::vector<std::string> result;
    std::unordered_set<std::string> seen;
    for (const auto& v : values) {
        if (seen.insert(v).second) {
            result.push_back(v);
        }
    }
    return result;
}

} // anonymous namespace

EntityClassifier::EntityClassifier(const Taxonomy& taxonomy, SuperclassCache& superclasses)
    : taxonomy_(taxonomy), superclasses_(superclasses) {}

// ============================================================================
// Classification
// ============================================================================

EntityCategory EntityClassifier::categorize(const RawEntity& entity) {
    if (!entity.id.empty() && entity.id[0] == 'P') {
        return EntityCategory::Predicate;
    }
    if (entity.has_claim(ids::SUBCLASS_OF)) {
        return EntityCategory::Type;
    }
    return EntityCategory::Entity;
}

NerTag EntityClassifier::tag_for(const std::string& type_id) const {
    if (type_id == ids::HUMAN) return NerTag::PERS;
    if (taxonomy_.is_location(type_id)) return NerTag::LOC;
    if (taxonomy_.is_organization(type_id)) return NerTag::ORG;
    return NerTag::OTHERS;
}

std::vector<NerTag> EntityClassifier::ner_tags(const RawEntity& entity) const {
    std::vector<NerTag> tags;
    auto it = entity.claims.find(ids::INSTANCE_OF);
    if (it == entity.claims.end()) {
        return tags;
    }
    for (const auto& claim : it->second) {
        // novalue/somevalue instance-of still counts as an unknown class
        NerTag tag = NerTag::OTHERS;
        if (claim.has_value() && claim.value->is_object()) {
            tag = tag_for(referenced_id(*claim.value));
        }
        if (std::find(tags.begin(), tags.end(), tag) == tags.end()) {
            tags.push_back(tag);
        }
    }
    return tags;
}

std::vector<std::string> EntityClassifier::declared_types(const RawEntity& entity) {
    std::vector<std::string> result;
    auto it = entity.claims.find(ids::INSTANCE_OF);
    if (it == entity.claims.end()) {
        return result;
    }
    for (const auto& claim : it->second) {
        if (!claim.has_value() || !claim.value->is_object()) continue;
        std::string id = referenced_id(*claim.value);
        if (!id.empty()) {
            result.push_back(id);
        }
    }
    return result;
}

std::vector<std::string> EntityClassifier::extended_types(const std::vector<std::string>& declared) const {
    std::set<std::string> closure;
    for (const auto& type_id : declared) {
        auto chain = superclasses_.get(type_id);
        closure.insert(chain.begin(), chain.end());
    }
    return std::vector<std::string>(closure.begin(), closure.end());
}

// ============================================================================
// Claim Decomposition
// ============================================================================

std::string EntityClassifier::referenced_id(const json& value) {
    if (value.contains("id") && value["id"].is_string()) {
        return value["id"].get<std::string>();
    }
    // Older dumps only carry the numeric id
    if (value.contains("numeric-id")) {
        std::string prefix = (value.value("entity-type", "item") == "property") ? "P" : "Q";
        return prefix + std::to_string(value["numeric-id"].get<int64_t>());
    }
    return "";
}

bool EntityClassifier::should_skip(const Claim& claim) {
    return !claim.has_value() || SKIPPED_DATATYPES.count(claim.datatype) > 0;
}

bool EntityClassifier::is_object_datatype(const std::string& datatype) {
    return datatype == "wikibase-item" || datatype == "wikibase-property";
}

LiteralKind EntityClassifier::literal_kind_for(const std::string& datatype) {
    if (datatype == "quantity") return LiteralKind::NUMBER;
    if (datatype == "time") return LiteralKind::DATETIME;
    if (datatype == "geo-shape") return LiteralKind::GEOSHAPE;
    if (datatype == "math") return LiteralKind::MATH;
    if (datatype == "musical-notation") return LiteralKind::MUSICAL_NOTATION;
    if (datatype == "tabular-data") return LiteralKind::TABULAR_DATA;
    return LiteralKind::STRING;
}

json EntityClassifier::literal_value(const std::string& datatype, const json& value) {
    if (datatype == "globe-coordinate") {
        return value.at("latitude").dump() + "," + value.at("longitude").dump();
    }
    if (datatype == "quantity") return value.at("amount");
    if (datatype == "monolingualtext") return value.at("text");
    if (datatype == "time") return value.at("time");
    return value;
}

EntityRecords EntityClassifier::classify(const json& document, int64_t sequence_index) const {
    RawEntity entity = RawEntity::from_json(document);

    EntityRecords records;
    ItemRecord& item = records.item;
    ObjectRecord& objects = records.objects;
    LiteralRecord& literals = records.literals;
    TypeRecord& types = records.types;

    item.id_entity = objects.id_entity = literals.id_entity = types.id_entity = sequence_index;
    item.entity = objects.entity = literals.entity = types.entity = entity.id;

    auto& type_list = types.types[ids::INSTANCE_OF];

    for (const auto& [predicate, claims] : entity.claims) {
        for (const auto& claim : claims) {
            if (should_skip(claim)) continue;

            if (is_object_datatype(claim.datatype)) {
                std::string target = referenced_id(*claim.value);
                if (target.empty()) {
                    throw EntityFormatError("Claim " + predicate + " references no entity id");
                }
                // Instance-of and occupation targets live in the type record only
                if (predicate == ids::INSTANCE_OF || predicate == ids::OCCUPATION) {
                    type_list.push_back(target);
                } else {
                    objects.objects[target].insert(predicate);
                }
            } else {
                literals.literals[literal_kind_for(claim.datatype)][predicate].push_back(
                    literal_value(claim.datatype, *claim.value)
                );
            }
        }
    }

    item.description = entity.descriptions.count("en") ? entity.descriptions.at("en") : "";
    item.labels = entity.labels;
    for (const auto& [lang, list] : entity.aliases) {
        item.aliases[lang] = deduplicate(list);
    }
    item.types = types.types;
    item.popularity = entity.sitelink_count > 0 ? static_cast<int>(entity.sitelink_count) : 1;
    item.category = categorize(entity);
    item.ner_types = ner_tags(entity);
    item.explicit_types = declared_types(entity);
    item.extended_types = extended_types(item.explicit_types);

    item.urls["wikidata"] = "http://www.wikidata.org/wiki/" + entity.id;
    if (!entity.enwiki_title.empty()) {
        std::string title = replace_spaces(entity.enwiki_title);
        item.urls["wikipedia"] = "http://en.wikipedia.org/wiki/" + title;
        item.urls["dbpedia"] = "http://dbpedia.org/resource/" + title;
    }

    return records;
}

} // namespace wdi
