#include "entity/entity.hpp"

using json = nlohmann::json;

namespace wdi {

// ============================================================================
// Enumerations
// ============================================================================

std::string to_string(EntityCategory category) {
    switch (category) {
        case EntityCategory::Entity: return "entity";
        case EntityCategory::Type: return "type";
        case EntityCategory::Predicate: return "predicate";
    }
    return "entity";
}

std::string to_string(NerTag tag) {
    switch (tag) {
        case NerTag::PERS: return "PERS";
        case NerTag::LOC: return "LOC";
        case NerTag::ORG: return "ORG";
        case NerTag::OTHERS: return "OTHERS";
    }
    return "OTHERS";
}

std::string to_string(LiteralKind kind) {
    switch (kind) {
        case LiteralKind::STRING: return "STRING";
        case LiteralKind::NUMBER: return "NUMBER";
        case LiteralKind::DATETIME: return "DATETIME";
        case LiteralKind::GEOSHAPE: return "GEOSHAPE";
        case LiteralKind::MATH: return "MATH";
        case LiteralKind::MUSICAL_NOTATION: return "MUSICAL_NOTATION";
        case LiteralKind::TABULAR_DATA: return "TABULAR_DATA";
    }
    return "STRING";
}

const std::vector<LiteralKind>& all_literal_kinds() {
    static const std::vector<LiteralKind> kinds = {
        LiteralKind::STRING,
        LiteralKind::NUMBER,
        LiteralKind::DATETIME,
        LiteralKind::GEOSHAPE,
        LiteralKind::MATH,
        LiteralKind::MUSICAL_NOTATION,
        LiteralKind::TABULAR_DATA
    };
    return kinds;
}

// ============================================================================
// RawEntity
// ============================================================================

RawEntity RawEntity::from_json(const json& j) {
    if (!j.is_object() || !j.contains("id") || !j["id"].is_string()) {
        throw EntityFormatError("Entity document has no string 'id'");
    }

    RawEntity entity;
    entity.id = j["id"].get<std::string>();
    entity.type = j.value("type", "");

    if (j.contains("labels")) {
        for (auto& [lang, label] : j["labels"].items()) {
            entity.labels[lang] = label.at("value").get<std::string>();
        }
    }

    if (j.contains("aliases")) {
        for (auto& [lang, list] : j["aliases"].items()) {
            auto& target = entity.aliases[lang];
            for (const auto& alias : list) {
                target.push_back(alias.at("value").get<std::string>());
            }
        }
    }

    if (j.contains("descriptions")) {
        for (auto& [lang, description] : j["descriptions"].items()) {
            entity.descriptions[lang] = description.at("value").get<std::string>();
        }
    }

    if (j.contains("sitelinks") && j["sitelinks"].is_object()) {
        const auto& sitelinks = j["sitelinks"];
        entity.sitelink_count = sitelinks.size();
        if (sitelinks.contains("enwiki") && sitelinks["enwiki"].contains("title")) {
            entity.enwiki_title = sitelinks["enwiki"]["title"].get<std::string>();
        }
    }

    if (j.contains("claims")) {
        for (auto& [predicate, list] : j["claims"].items()) {
            auto& target = entity.claims[predicate];
            for (const auto& statement : list) {
                const json& snak = statement.contains("mainsnak") ? statement["mainsnak"] : statement;

                Claim claim;
                claim.datatype = snak.at("datatype").get<std::string>();
                if (snak.contains("datavalue") && snak["datavalue"].contains("value")) {
                    claim.value = snak["datavalue"]["value"];
                }
                target.push_back(std::move(claim));
            }
        }
    }

    return entity;
}

// ============================================================================
// Records
// ============================================================================

json ItemRecord::to_json() const {
    json j;
    j["id_entity"] = id_entity;
    j["entity"] = entity;
    j["description"] = description;
    j["labels"] = labels;
    j["aliases"] = aliases;
    j["types"] = types;
    j["popularity"] = popularity;
    j["category"] = to_string(category);

    json ner = json::array();
    for (auto tag : ner_types) {
        ner.push_back(to_string(tag));
    }
    j["NERtype"] = ner;

    j["URLs"] = urls;
    j["extended_WDtypes"] = extended_types;
    j["explicit_WDtypes"] = explicit_types;
    return j;
}

json ObjectRecord::to_json() const {
    json j;
    j["id_entity"] = id_entity;
    j["entity"] = entity;

    json obj = json::object();
    for (const auto& [target, predicates] : objects) {
        obj[target] = std::vector<std::string>(predicates.begin(), predicates.end());
    }
    j["objects"] = obj;
    return j;
}

LiteralRecord::LiteralRecord() {
    for (auto kind : all_literal_kinds()) {
        literals[kind];
    }
}

bool LiteralRecord::empty() const {
    for (const auto& [kind, by_predicate] : literals) {
        if (!by_predicate.empty()) return false;
    }
    return true;
}

json LiteralRecord::to_json() const {
    json j;
    j["id_entity"] = id_entity;
    j["entity"] = entity;

    json lit = json::object();
    for (const auto& [kind, by_predicate] : literals) {
        json values = json::object();
        for (const auto& [predicate, list] : by_predicate) {
            values[predicate] = list;
        }
        lit[to_string(kind)] = values;
    }
    j["literals"] = lit;
    return j;
}

json TypeRecord::to_json() const {
    json j;
    j["id_entity"] = id_entity;
    j["entity"] = entity;
    j["types"] = types;
    return j;
}

json ErrorRecord::to_json() const {
    json j;
    j["entity"] = entity.empty() ? json(nullptr) : json(entity);
    j["error"] = error;
    j["context"] = context;
    return j;
}

} // namespace wdi
