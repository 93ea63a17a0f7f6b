#include <catch2/catch_test_macros.hpp>
#include "detector/gazetteer_recognizer.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

using namespace privgate;

TEST_CASE("Gazetteer: phrase matching", "[gazetteer]") {
    const GazetteerEntityRecognizer recognizer({
        {"ORG", "Acme Corp"},
        {"ORG", "Acme"},
        {"GPE", "Paris"},
    });
    CHECK(recognizer.entry_count() == 3);
    CHECK(recognizer.name() == "gazetteer");

    SECTION("Longest phrase wins at a position") {
        const auto found = recognizer.recognize("Acme Corp opened in Paris.");
        REQUIRE(found.size() == 2);
        CHECK(found[0].label == "ORG");
        CHECK(found[0].text == "Acme Corp");
        CHECK(found[0].start == 0);
        CHECK(found[0].end == 9);
        CHECK(found[1].label == "GPE");
        CHECK(found[1].start == 20);
        CHECK(found[1].end == 25);
    }

    SECTION("Whole words only") {
        CHECK(recognizer.recognize("Parisian cuisine at Acmeville").empty());
    }

    SECTION("Case-sensitive") {
        CHECK(recognizer.recognize("paris").empty());
    }

    SECTION("Repeated phrase") {
        const auto found = recognizer.recognize("Paris, Paris");
        REQUIRE(found.size() == 2);
        CHECK(found[1].start == 7);
    }
}

TEST_CASE("Gazetteer: empty phrases are ignored", "[gazetteer]") {
    const GazetteerEntityRecognizer recognizer({{"PERSON", ""}, {"GPE", "Rome"}});
    CHECK(recognizer.entry_count() == 1);
    CHECK(recognizer.recognize("Rome").size() == 1);
}

TEST_CASE("Gazetteer: name heuristic", "[gazetteer]") {
    SECTION("Off by default") {
        const GazetteerEntityRecognizer recognizer({});
        CHECK(recognizer.recognize("Jane Doe called").empty());
    }

    SECTION("Adds capitalized name pairs") {
        const GazetteerEntityRecognizer recognizer({}, true);
        const auto found = recognizer.recognize("then Jane Doe called");
        REQUIRE(found.size() == 1);
        CHECK(found[0].label == "PERSON");
        CHECK(found[0].text == "Jane Doe");
        CHECK(found[0].start == 5);
    }

    SECTION("Long capitalized token does not hide a later name") {
        const GazetteerEntityRecognizer recognizer({}, true);
        const std::string blob = "Q" + std::string(1 << 20, 'q');
        const auto found = recognizer.recognize(blob + " met Jane Doe");
        REQUIRE(found.size() == 1);
        CHECK(found[0].text == "Jane Doe");
        CHECK(found[0].start == blob.size() + 5);
    }

    SECTION("Never overlaps a phrase match") {
        const GazetteerEntityRecognizer recognizer({{"ORG", "Acme Corp"}}, true);
        const auto found = recognizer.recognize("Acme Corp hired Jane Doe");
        REQUIRE(found.size() == 2);
        CHECK(found[0].label == "ORG");
        CHECK(found[1].label == "PERSON");
        CHECK(found[1].text == "Jane Doe");
    }
}

TEST_CASE("Gazetteer: load from TOML file", "[gazetteer]") {
    const std::string path = "/tmp/privgate_test_gazetteer.toml";

    SECTION("Valid file") {
        {
            std::ofstream out(path);
            out << "PERSON = [\"Jane Doe\", \"John Smith\"]\n"
                << "ORG = [\"Globex\"]\n"
                << "note = \"ignored, not an array\"\n";
        }
        const auto entries = GazetteerEntityRecognizer::load_file(path);
        REQUIRE(entries.size() == 3);

        const GazetteerEntityRecognizer recognizer(entries);
        const auto found = recognizer.recognize("John Smith works at Globex");
        REQUIRE(found.size() == 2);
        CHECK(found[0].label == "PERSON");
        CHECK(found[1].label == "ORG");
    }

    SECTION("Malformed file") {
        {
            std::ofstream out(path);
            out << "PERSON = [\"unterminated\n";
        }
        CHECK_THROWS_AS(GazetteerEntityRecognizer::load_file(path), std::runtime_error);
    }

    SECTION("Missing file") {
        CHECK_THROWS_AS(GazetteerEntityRecognizer::load_file("/nonexistent/gazetteer.toml"),
                        std::runtime_error);
    }

    std::filesystem::remove(path);
}
