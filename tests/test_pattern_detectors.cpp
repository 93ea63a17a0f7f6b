#include <catch2/catch_test_macros.hpp>
#include "detector/pattern_detector.hpp"

#include <string>

using namespace privgate;

namespace {

PatternDetectorOptions only_none() {
    PatternDetectorOptions o;
    o.email = false;
    o.url = false;
    o.credit_card = false;
    o.national_id = false;
    o.long_number = false;
    return o;
}

std::vector<Span> run_all(const PatternDetectorOptions& opts, std::string_view text) {
    std::vector<Span> out;
    for (const auto& d : make_pattern_detectors(opts)) {
        auto spans = d->detect(text);
        out.insert(out.end(), spans.begin(), spans.end());
    }
    return out;
}

} // anonymous namespace

// ============================================================================
// Factory
// ============================================================================

TEST_CASE("make_pattern_detectors honors toggles", "[detector][pattern]") {
    CHECK(make_pattern_detectors(PatternDetectorOptions{}).size() == 5);
    CHECK(make_pattern_detectors(only_none()).empty());

    auto opts = only_none();
    opts.email = true;
    const auto detectors = make_pattern_detectors(opts);
    REQUIRE(detectors.size() == 1);
    CHECK(detectors[0]->name() == "regex:email");
}

// ============================================================================
// Individual patterns
// ============================================================================

TEST_CASE("Email pattern", "[detector][pattern]") {
    auto opts = only_none();
    opts.email = true;

    SECTION("Finds address with byte offsets") {
        const std::string text = "Contact me at jane@example.com or later.";
        const auto spans = run_all(opts, text);
        REQUIRE(spans.size() == 1);
        CHECK(spans[0].type == DetectorType::EMAIL);
        CHECK(spans[0].start == 14);
        CHECK(spans[0].end == 30);
        CHECK(spans[0].text == "jane@example.com");
        CHECK(text.substr(spans[0].start, spans[0].length()) == spans[0].text);
    }

    SECTION("Multiple addresses") {
        const auto spans = run_all(opts, "a.b@x.org, c+d@y.co.uk");
        REQUIRE(spans.size() == 2);
        CHECK(spans[0].text == "a.b@x.org");
        CHECK(spans[1].text == "c+d@y.co.uk");
    }

    SECTION("No match without a domain suffix") {
        CHECK(run_all(opts, "user@localhost").empty());
    }
}

TEST_CASE("URL pattern", "[detector][pattern]") {
    auto opts = only_none();
    opts.url = true;

    const auto spans = run_all(opts, "see https://example.com/path for info");
    REQUIRE(spans.size() == 1);
    CHECK(spans[0].type == DetectorType::URL);
    CHECK(spans[0].text == "https://example.com/path");
    CHECK(spans[0].start == 4);

    const auto www = run_all(opts, "Visit WWW.Example.com today");
    REQUIRE(www.size() == 1);
    CHECK(www[0].text == "WWW.Example.com");
}

TEST_CASE("Credit card pattern", "[detector][pattern]") {
    auto opts = only_none();
    opts.credit_card = true;

    SECTION("Grouped digits") {
        const auto spans = run_all(opts, "card 4111 1111 1111 1111 ok");
        REQUIRE(spans.size() == 1);
        CHECK(spans[0].type == DetectorType::CREDIT_CARD);
        CHECK(spans[0].text == "4111 1111 1111 1111");
        CHECK(spans[0].start == 5);
        CHECK(spans[0].end == 24);
    }

    SECTION("Too few digits") {
        CHECK(run_all(opts, "code 1234 5678").empty());
    }

    SECTION("Luhn check filters invalid numbers") {
        opts.luhn_check = true;
        CHECK(run_all(opts, "card 4111 1111 1111 1111").size() == 1);
        CHECK(run_all(opts, "card 4111 1111 1111 1112").empty());
    }
}

TEST_CASE("National ID pattern", "[detector][pattern]") {
    auto opts = only_none();
    opts.national_id = true;

    const auto spans = run_all(opts, "SSN 123-45-6789.");
    REQUIRE(spans.size() == 1);
    CHECK(spans[0].type == DetectorType::NATIONAL_ID);
    CHECK(spans[0].start == 4);
    CHECK(spans[0].end == 15);

    SECTION("Structural validation") {
        opts.validate_ssn = true;
        CHECK(run_all(opts, "SSN 123-45-6789").size() == 1);
        CHECK(run_all(opts, "SSN 000-45-6789").empty());
        CHECK(run_all(opts, "SSN 666-45-6789").empty());
        CHECK(run_all(opts, "SSN 123-00-6789").empty());
    }
}

TEST_CASE("Long number pattern", "[detector][pattern]") {
    auto opts = only_none();
    opts.long_number = true;

    const auto spans = run_all(opts, "acct 123456789012 end");
    REQUIRE(spans.size() == 1);
    CHECK(spans[0].type == DetectorType::LONG_NUMBER);
    CHECK(spans[0].text == "123456789012");

    CHECK(run_all(opts, "order 12345678").empty());
}

TEST_CASE("Pattern detectors on empty input", "[detector][pattern]") {
    CHECK(run_all(PatternDetectorOptions{}, "").empty());
}

TEST_CASE("Pattern detectors handle megabyte-long tokens", "[detector][pattern]") {
    const std::string blob(1 << 20, 'a');

    SECTION("Single token without personal data") {
        std::vector<Span> spans;
        REQUIRE_NOTHROW(spans = run_all(PatternDetectorOptions{}, blob));
        CHECK(spans.empty());
    }

    SECTION("Address after the token is still found") {
        const std::string text = blob + " contact bob@example.com";
        const auto spans = run_all(PatternDetectorOptions{}, text);
        REQUIRE(spans.size() == 1);
        CHECK(spans[0].type == DetectorType::EMAIL);
        CHECK(spans[0].start == blob.size() + 9);
        CHECK(spans[0].text == "bob@example.com");
    }

    SECTION("Local part longer than an address allows") {
        auto opts = only_none();
        opts.email = true;
        CHECK(run_all(opts, blob + "@x.com").empty());
    }

    SECTION("URL with a huge path keeps its host") {
        auto opts = only_none();
        opts.url = true;
        const auto spans = run_all(opts, "see https://example.com/" + blob);
        REQUIRE(spans.size() == 1);
        CHECK(spans[0].type == DetectorType::URL);
        CHECK(spans[0].start == 4);
        CHECK(spans[0].text == "https://example.com/");
    }

    SECTION("Digit followed by a long separator run") {
        auto opts = only_none();
        opts.credit_card = true;
        CHECK(run_all(opts, "4" + std::string(1 << 20, ' ') + "1").empty());
    }
}

// ============================================================================
// Validators
// ============================================================================

TEST_CASE("Luhn validation", "[detector][validation]") {
    CHECK(validation::luhn_validate("4111111111111111"));
    CHECK(validation::luhn_validate("4111-1111-1111-1111"));
    CHECK(validation::luhn_validate("5500 0000 0000 0004"));
    CHECK_FALSE(validation::luhn_validate("4111111111111112"));
    CHECK_FALSE(validation::luhn_validate("1234"));
}

TEST_CASE("SSN validation", "[detector][validation]") {
    CHECK(validation::validate_ssn("123-45-6789"));
    CHECK_FALSE(validation::validate_ssn("900-45-6789"));
    CHECK_FALSE(validation::validate_ssn("123-45-0000"));
    CHECK_FALSE(validation::validate_ssn("12-345-678"));
}
