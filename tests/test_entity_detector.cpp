#include <catch2/catch_test_macros.hpp>
#include "core/error.hpp"
#include "detector/entity_detector.hpp"
#include "mocks/mock_entity_recognizer.hpp"

#include <string>

using namespace privgate;
using namespace privgate::testing;

TEST_CASE("Entity label mapping", "[entity]") {
    CHECK(map_entity_label("PERSON") == DetectorType::PERSON);
    CHECK(map_entity_label("per") == DetectorType::PERSON);
    CHECK(map_entity_label("ORG") == DetectorType::ORGANIZATION);
    CHECK(map_entity_label("Gpe") == DetectorType::GEO_POLITICAL_ENTITY);
    CHECK(map_entity_label("LOC") == DetectorType::LOCATION);

    CHECK_FALSE(map_entity_label("DATE").has_value());
    CHECK_FALSE(map_entity_label("").has_value());
}

TEST_CASE("EntityDetector maps recognized entities to spans", "[entity]") {
    const std::string text = "Jane Doe joined Acme Corp on Monday";
    const EntityDetector detector(std::make_shared<MockEntityRecognizer>(
        std::vector<MockEntityRecognizer::Phrase>{
            {"PERSON", "Jane Doe"},
            {"ORG", "Acme Corp"},
            {"DATE", "Monday"},
        }));

    CHECK(detector.name() == "entity:mock-ner");

    const auto spans = detector.detect(text);
    REQUIRE(spans.size() == 2);
    CHECK(spans[0].type == DetectorType::PERSON);
    CHECK(spans[0].start == 0);
    CHECK(spans[0].end == 8);
    CHECK(spans[1].type == DetectorType::ORGANIZATION);
    CHECK(spans[1].text == "Acme Corp");
}

TEST_CASE("EntityDetector on empty text does not call the recognizer", "[entity]") {
    const EntityDetector detector(std::make_shared<UnavailableEntityRecognizer>());
    CHECK(detector.detect("").empty());
}

TEST_CASE("EntityDetector propagates recognizer unavailability", "[entity]") {
    const EntityDetector detector(std::make_shared<UnavailableEntityRecognizer>());
    CHECK_THROWS_AS(detector.detect("Jane Doe"), DetectorUnavailableError);
}

TEST_CASE("EntityModel holds one process-wide recognizer", "[entity][model]") {
    auto& model = EntityModel::instance();
    model.reset();
    REQUIRE_FALSE(model.is_initialized());

    SECTION("Detector without a recognizer finds nothing") {
        const EntityDetector detector;
        CHECK(detector.name() == "entity:none");
        CHECK(detector.detect("Jane Doe").empty());
    }

    SECTION("Initialize once") {
        auto first = std::make_shared<MockEntityRecognizer>(
            std::vector<MockEntityRecognizer::Phrase>{{"PERSON", "Jane"}});
        auto second = std::make_shared<UnavailableEntityRecognizer>();

        CHECK(model.initialize(first));
        CHECK_FALSE(model.initialize(second));
        CHECK(model.get() == first);

        const EntityDetector detector;
        const auto spans = detector.detect("Hi Jane");
        REQUIRE(spans.size() == 1);
        CHECK(spans[0].start == 3);
    }

    SECTION("Explicit recognizer wins over the shared one") {
        REQUIRE(model.initialize(std::make_shared<UnavailableEntityRecognizer>()));
        const EntityDetector detector(std::make_shared<MockEntityRecognizer>(
            std::vector<MockEntityRecognizer::Phrase>{{"GPE", "Paris"}}));
        CHECK(detector.detect("Paris").size() == 1);
    }

    model.reset();
}
