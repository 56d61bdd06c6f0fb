#pragma once

#include "entity/entity.hpp"
#include "taxonomy/superclass_cache.hpp"
#include "taxonomy/taxonomy.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace wdi {

/**
 * @brief Turns one decoded entity into its item, object, literal and type records
 *
 * Stateless apart from the shared, read-only Taxonomy and the run-wide
 * SuperclassCache, so a single instance is used by every worker.
 */
class EntityClassifier {
public:
    EntityClassifier(const Taxonomy& taxonomy, SuperclassCache& superclasses);

    /**
     * @brief Derive all records for one entity document
     *
     * @param document Decoded dump line
     * @param sequence_index Stream position of the line
     * @throws EntityFormatError or nlohmann::json::exception if the document is not a usable entity
     */
    EntityRecords classify(const nlohmann::json& document, int64_t sequence_index) const;

    /**
     * @brief predicate if the id is in the property namespace, type if it has a
     *        subclass-of claim, entity otherwise
     */
    static EntityCategory categorize(const RawEntity& entity);

    /**
     * @brief Distinct NER tags of every valued instance-of claim
     */
    std::vector<NerTag> ner_tags(const RawEntity& entity) const;

    /**
     * @brief Targets of valued instance-of claims, in claim order
     */
    static std::vector<std::string> declared_types(const RawEntity& entity);

    /**
     * @brief Sorted union of the superclass chains of `declared`
     */
    std::vector<std::string> extended_types(const std::vector<std::string>& declared) const;

    /**
     * @brief Referenced entity id of a wikibase-item / wikibase-property value
     */
    static std::string referenced_id(const nlohmann::json& value);

    /**
     * @brief True for claims carrying no value or of a lexeme/form/sense datatype
     */
    static bool should_skip(const Claim& claim);

    static bool is_object_datatype(const std::string& datatype);
    static LiteralKind literal_kind_for(const std::string& datatype);

    /**
     * @brief Scalar stored for a literal claim
     *
     * quantity -> amount, time -> time, monolingualtext -> text,
     * globe-coordinate -> "lat,lon", anything else -> the raw value.
     */
    static nlohmann::json literal_value(const std::string& datatype, const nlohmann::json& value);

private:
    const Taxonomy& taxonomy_;
    SuperclassCache& superclasses_;

    NerTag tag_for(const std::string& type_id) const;
};

} // namespace wdi
