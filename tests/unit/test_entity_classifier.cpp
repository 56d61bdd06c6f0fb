#include <gtest/gtest.h>
#include "entity/entity_classifier.hpp"
#include "test_support.hpp"
#include <algorithm>
#include <atomic>
#include <set>

using namespace wdi;
using json = nlohmann::json;
using wdi::testing_support::make_claim;
using wdi::testing_support::make_entity;

class EntityClassifierTest : public ::testing::Test {
protected:
    Taxonomy taxonomy{{
        {Taxonomy::LOCATION, {"Q2221906", "Q515", "Q486972"}},
        {Taxonomy::ORGANIZATION, {"Q43229", "Q783794", "Q4830453"}}
    }};
    std::atomic<int> lookups{0};
    SuperclassCache cache{[this](const std::string& type_id) {
        lookups++;
        if (type_id == "Q5") return std::vector<std::string>{"Q5", "Q215627", "Q154954"};
        if (type_id == "Q515") return std::vector<std::string>{"Q515", "Q486972", "Q2221906"};
        return std::vector<std::string>{type_id};
    }};
    EntityClassifier classifier{taxonomy, cache};
};

// ==========================================
// Testable Properties
// ==========================================

TEST_F(EntityClassifierTest, NoInstanceOfMeansNoTagsAndNoExtendedTypes) {
    json doc = make_entity("Q1");
    EntityRecords records = classifier.classify(doc, 0);

    EXPECT_TRUE(records.item.ner_types.empty());
    EXPECT_TRUE(records.item.extended_types.empty());
    EXPECT_TRUE(records.item.explicit_types.empty());
    EXPECT_EQ(lookups.load(), 0);
}

TEST_F(EntityClassifierTest, HumanIsTaggedPersonOnly) {
    EntityRecords records = classifier.classify(make_entity("Q42", {"Q5"}), 7);
    EXPECT_EQ(records.item.ner_types, (std::vector<NerTag>{NerTag::PERS}));
}

TEST_F(EntityClassifierTest, HumanRoundTrip) {
    EntityRecords records = classifier.classify(make_entity("Q42", {"Q5"}), 3);

    json item = records.item.to_json();
    EXPECT_EQ(item["category"], "entity");
    EXPECT_EQ(item["NERtype"], json::array({"PERS"}));
    EXPECT_EQ(item["types"], json({{"P31", {"Q5"}}}));

    EXPECT_EQ(records.objects.to_json()["objects"], json::object());
    EXPECT_TRUE(records.literals.empty());
    json literals = records.literals.to_json()["literals"];
    EXPECT_EQ(literals.size(), 7u);
    for (auto& [kind, values] : literals.items()) {
        EXPECT_TRUE(values.empty()) << kind;
    }
    EXPECT_EQ(records.types.to_json()["types"], json({{"P31", {"Q5"}}}));
}

TEST_F(EntityClassifierTest, TagsAccumulateDistinct) {
    json doc = make_entity("Q64", {"Q5", "Q515", "Q783794", "Q999999", "Q5", "Q486972"});
    EntityRecords records = classifier.classify(doc, 0);

    EXPECT_EQ(records.item.ner_types,
              (std::vector<NerTag>{NerTag::PERS, NerTag::LOC, NerTag::ORG, NerTag::OTHERS}));
}

TEST_F(EntityClassifierTest, LocationWinsOverOrganization) {
    Taxonomy overlapping({
        {Taxonomy::LOCATION, {"Q1"}},
        {Taxonomy::ORGANIZATION, {"Q1"}}
    });
    EntityClassifier c(overlapping, cache);

    EntityRecords records = c.classify(make_entity("Q2", {"Q1"}), 0);
    EXPECT_EQ(records.item.ner_types, (std::vector<NerTag>{NerTag::LOC}));
}

TEST_F(EntityClassifierTest, LexemeClaimsAreAlwaysSkipped) {
    json doc = make_entity("Q3");
    doc["claims"]["P5137"] = json::array({
        make_claim("P5137", "wikibase-lexeme", {{"entity-type", "lexeme"}, {"id", "L7"}}),
        make_claim("P5137", "wikibase-form", {{"entity-type", "form"}, {"id", "L7-F1"}}),
        make_claim("P5137", "wikibase-sense", {{"entity-type", "sense"}, {"id", "L7-S1"}})
    });

    EntityRecords records = classifier.classify(doc, 0);
    EXPECT_TRUE(records.objects.objects.empty());
    EXPECT_TRUE(records.literals.empty());
}

TEST_F(EntityClassifierTest, ClaimsWithoutValueAreSkipped) {
    json doc = make_entity("Q3");
    doc["claims"]["P570"] = json::array({
        {{"mainsnak", {{"snaktype", "somevalue"}, {"property", "P570"}, {"datatype", "time"}}}}
    });
    doc["claims"]["P31"] = json::array({
        {{"mainsnak", {{"snaktype", "novalue"}, {"property", "P31"}, {"datatype", "wikibase-item"}}}}
    });

    EntityRecords records = classifier.classify(doc, 0);
    EXPECT_TRUE(records.literals.empty());
    EXPECT_EQ(records.types.types.at("P31").size(), 0u);
    EXPECT_TRUE(records.item.extended_types.empty());
}

TEST_F(EntityClassifierTest, ValuelessInstanceOfIsTaggedOthers) {
    json doc = make_entity("Q4");
    doc["claims"]["P31"] = json::array({
        {{"mainsnak", {{"snaktype", "novalue"}, {"property", "P31"}, {"datatype", "wikibase-item"}}}}
    });

    EntityRecords records = classifier.classify(doc, 0);
    EXPECT_EQ(records.item.ner_types, std::vector<NerTag>{NerTag::OTHERS});
    EXPECT_TRUE(records.item.explicit_types.empty());
    EXPECT_TRUE(records.item.extended_types.empty());
    EXPECT_EQ(lookups.load(), 0);

    doc["claims"]["P31"].push_back(make_claim("P31", "wikibase-item", {{"id", "Q5"}}));
    records = classifier.classify(doc, 1);
    EXPECT_EQ(records.item.ner_types, (std::vector<NerTag>{NerTag::OTHERS, NerTag::PERS}));
}

// ==========================================
// Category
// ==========================================

TEST_F(EntityClassifierTest, PropertyIdsArePredicates) {
    json doc = make_entity("P31");
    doc["claims"]["P279"] = json::array({make_claim("P279", "wikibase-item", {{"id", "Q1"}})});

    EXPECT_EQ(classifier.classify(doc, 0).item.category, EntityCategory::Predicate);
}

TEST_F(EntityClassifierTest, SubclassClaimMakesAType) {
    json doc = make_entity("Q515");
    doc["claims"]["P279"] = json::array({make_claim("P279", "wikibase-item", {{"id", "Q486972"}})});

    EntityRecords records = classifier.classify(doc, 0);
    EXPECT_EQ(records.item.category, EntityCategory::Type);
    EXPECT_EQ(records.item.to_json()["category"], "type");
}

// ==========================================
// Claim Decomposition
// ==========================================

TEST_F(EntityClassifierTest, ObjectClaimsGroupPredicatesByTarget) {
    json doc = make_entity("Q64", {"Q515"});
    doc["claims"]["P17"] = json::array({make_claim("P17", "wikibase-item", {{"id", "Q183"}})});
    doc["claims"]["P1376"] = json::array({make_claim("P1376", "wikibase-item", {{"id", "Q183"}})});
    doc["claims"]["P1343"] = json::array({make_claim("P1343", "wikibase-property", {{"id", "P18"}})});

    EntityRecords records = classifier.classify(doc, 0);
    const auto& objects = records.objects.objects;

    ASSERT_EQ(objects.size(), 2u);
    EXPECT_EQ(objects.at("Q183"), (std::set<std::string>{"P17", "P1376"}));
    EXPECT_EQ(objects.at("P18"), (std::set<std::string>{"P1343"}));
    EXPECT_EQ(objects.count("Q515"), 0u);
}

TEST_F(EntityClassifierTest, OccupationJoinsDeclaredTypeSet) {
    json doc = make_entity("Q42", {"Q5"});
    doc["claims"]["P106"] = json::array({
        make_claim("P106", "wikibase-item", {{"id", "Q36180"}}),
        make_claim("P106", "wikibase-item", {{"id", "Q6625963"}})
    });

    EntityRecords records = classifier.classify(doc, 0);

    std::vector<std::string> expected = {"Q6625963", "Q36180", "Q5"};
    auto got = records.types.types.at("P31");
    std::sort(got.begin(), got.end());
    std::sort(expected.begin(), expected.end());
    EXPECT_EQ(got, expected);
    EXPECT_EQ(records.item.types, records.types.types);

    // Only instance-of drives tags and explicit types
    EXPECT_EQ(records.item.ner_types, (std::vector<NerTag>{NerTag::PERS}));
    EXPECT_EQ(records.item.explicit_types, (std::vector<std::string>{"Q5"}));
}

TEST_F(EntityClassifierTest, LiteralsAreFiledByDatatype) {
    json doc = make_entity("Q64");
    doc["claims"]["P1082"] = json::array({make_claim("P1082", "quantity", {{"amount", "+3645000"}, {"unit", "1"}})});
    doc["claims"]["P571"] = json::array({make_claim("P571", "time", {{"time", "+1237-01-01T00:00:00Z"}, {"precision", 9}})});
    doc["claims"]["P625"] = json::array({make_claim("P625", "globe-coordinate", {{"latitude", 52.5}, {"longitude", 13.25}})});
    doc["claims"]["P1448"] = json::array({make_claim("P1448", "monolingualtext", {{"text", "Berlin"}, {"language", "de"}})});
    doc["claims"]["P214"] = json::array({make_claim("P214", "external-id", "141916283")});
    doc["claims"]["P3896"] = json::array({make_claim("P3896", "geo-shape", "Data:Berlin.map")});
    doc["claims"]["P2534"] = json::array({make_claim("P2534", "math", "E=mc^2")});
    doc["claims"]["P6883"] = json::array({make_claim("P6883", "musical-notation", "c d e")});
    doc["claims"]["P4179"] = json::array({make_claim("P4179", "tabular-data", "Data:Pop.tab")});

    EntityRecords records = classifier.classify(doc, 0);
    const auto& lit = records.literals.literals;

    EXPECT_EQ(lit.at(LiteralKind::NUMBER).at("P1082"), (std::vector<json>{"+3645000"}));
    EXPECT_EQ(lit.at(LiteralKind::DATETIME).at("P571"), (std::vector<json>{"+1237-01-01T00:00:00Z"}));
    EXPECT_EQ(lit.at(LiteralKind::STRING).at("P625"), (std::vector<json>{"52.5,13.25"}));
    EXPECT_EQ(lit.at(LiteralKind::STRING).at("P1448"), (std::vector<json>{"Berlin"}));
    EXPECT_EQ(lit.at(LiteralKind::STRING).at("P214"), (std::vector<json>{"141916283"}));
    EXPECT_EQ(lit.at(LiteralKind::GEOSHAPE).at("P3896"), (std::vector<json>{"Data:Berlin.map"}));
    EXPECT_EQ(lit.at(LiteralKind::MATH).at("P2534"), (std::vector<json>{"E=mc^2"}));
    EXPECT_EQ(lit.at(LiteralKind::MUSICAL_NOTATION).at("P6883"), (std::vector<json>{"c d e"}));
    EXPECT_EQ(lit.at(LiteralKind::TABULAR_DATA).at("P4179"), (std::vector<json>{"Data:Pop.tab"}));
}

TEST_F(EntityClassifierTest, NumericIdOnlyReferencesAreResolved) {
    json doc = make_entity("Q42");
    doc["claims"]["P31"] = json::array({make_claim("P31", "wikibase-item", {{"entity-type", "item"}, {"numeric-id", 5}})});

    EntityRecords records = classifier.classify(doc, 0);
    EXPECT_EQ(records.item.explicit_types, (std::vector<std::string>{"Q5"}));
    EXPECT_EQ(records.item.ner_types, (std::vector<NerTag>{NerTag::PERS}));
}

// ==========================================
// Item Metadata
// ==========================================

TEST_F(EntityClassifierTest, ExtendedTypesUnionSuperclassChains) {
    EntityRecords records = classifier.classify(make_entity("Q1", {"Q5", "Q515"}), 0);

    EXPECT_EQ(records.item.extended_types,
              (std::vector<std::string>{"Q154954", "Q215627", "Q2221906", "Q486972", "Q5", "Q515"}));
}

TEST_F(EntityClassifierTest, SharedTypeIsLookedUpOnce) {
    for (int i = 0; i < 25; ++i) {
        classifier.classify(make_entity("Q" + std::to_string(100 + i), {"Q5"}), i);
    }
    EXPECT_EQ(lookups.load(), 1);
}

TEST_F(EntityClassifierTest, MetadataFields) {
    json doc = make_entity("Q90", {"Q515"});
    doc["descriptions"] = {{"en", {{"language", "en"}, {"value", "capital of France"}}},
                           {"fr", {{"language", "fr"}, {"value", "capitale de la France"}}}};
    doc["aliases"] = {{"en", json::array({
        {{"language", "en"}, {"value", "City of Light"}},
        {{"language", "en"}, {"value", "City of Light"}},
        {{"language", "en"}, {"value", "Paris, France"}}
    })}};
    doc["sitelinks"] = {
        {"enwiki", {{"site", "enwiki"}, {"title", "Paris, France"}}},
        {"frwiki", {{"site", "frwiki"}, {"title", "Paris"}}}
    };

    EntityRecords records = classifier.classify(doc, 12);
    const ItemRecord& item = records.item;

    EXPECT_EQ(item.description, "capital of France");
    EXPECT_EQ(item.labels.at("en"), "Q90 label");
    EXPECT_EQ(item.aliases.at("en"), (std::vector<std::string>{"City of Light", "Paris, France"}));
    EXPECT_EQ(item.popularity, 2);
    EXPECT_EQ(item.urls.at("wikidata"), "http://www.wikidata.org/wiki/Q90");
    EXPECT_EQ(item.urls.at("wikipedia"), "http://en.wikipedia.org/wiki/Paris,_France");
    EXPECT_EQ(item.urls.at("dbpedia"), "http://dbpedia.org/resource/Paris,_France");
}

TEST_F(EntityClassifierTest, MissingEnwikiIsNotAnError) {
    EntityRecords records = classifier.classify(make_entity("Q7"), 0);

    EXPECT_EQ(records.item.popularity, 1);
    EXPECT_EQ(records.item.urls.size(), 1u);
    EXPECT_EQ(records.item.urls.count("wikidata"), 1u);
}

TEST_F(EntityClassifierTest, AllRecordsShareIdentity) {
    EntityRecords records = classifier.classify(make_entity("Q42", {"Q5"}), 41);

    for (const json& doc : {records.item.to_json(), records.objects.to_json(),
                            records.literals.to_json(), records.types.to_json()}) {
        EXPECT_EQ(doc["entity"], "Q42");
        EXPECT_EQ(doc["id_entity"], 41);
    }
}

// ==========================================
// Failures
// ==========================================

TEST_F(EntityClassifierTest, DocumentWithoutIdIsRejected) {
    EXPECT_THROW(classifier.classify(json::object(), 0), EntityFormatError);
    EXPECT_THROW(classifier.classify(json::array({1, 2}), 0), EntityFormatError);
}

TEST_F(EntityClassifierTest, StructurallyBrokenClaimThrows) {
    json doc = make_entity("Q5");
    doc["claims"]["P31"] = json::array({{{"mainsnak", {{"property", "P31"}}}}});

    EXPECT_THROW(classifier.classify(doc, 0), json::exception);
}

TEST_F(EntityClassifierTest, ObjectClaimWithoutTargetThrows) {
    json doc = make_entity("Q5");
    doc["claims"]["P17"] = json::array({make_claim("P17", "wikibase-item", {{"entity-type", "item"}})});

    EXPECT_THROW(classifier.classify(doc, 0), EntityFormatError);
}
