#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "normalizer.hpp"

using namespace paperscout;
using json = nlohmann::json;
using Catch::Matchers::ContainsSubstring;

static json two_flat_hits() {
    return json::array({
        {{"paper_id", "p1"}, {"text", "first passage"}, {"score", 2.1}},
        {{"paper_id", "p2"}, {"text", "second passage"}, {"score", 1.4}}
    });
}

// ── classify ─────────────────────────────────────────────────────

TEST_CASE("classify: each observed shape", "[normalizer]") {
    REQUIRE(std::holds_alternative<raw::HitList>(classify(json::array())));
    REQUIRE(std::holds_alternative<raw::EncodedText>(classify("[]")));
    REQUIRE(std::holds_alternative<raw::ErrorPayload>(classify({{"error", "x"}})));
    REQUIRE(std::holds_alternative<raw::Wrapper>(classify(json::array({"[]"}))));
    REQUIRE(std::holds_alternative<raw::Wrapper>(classify({{"text", "[]"}})));
    REQUIRE(std::holds_alternative<raw::Wrapper>(
        classify({{"content", json::array({{{"type", "text"}, {"text", "[]"}}})}})));
    REQUIRE(std::holds_alternative<raw::Unrecognized>(classify(42)));
    REQUIRE(std::holds_alternative<raw::Unrecognized>(classify(nullptr)));
    REQUIRE(std::holds_alternative<raw::Unrecognized>(classify({{"foo", 1}})));
}

TEST_CASE("classify: a list of one hit is a hit list, not a wrapper", "[normalizer]") {
    json one = json::array({{{"paper_id", "p1"}, {"text", "t"}}});
    REQUIRE(std::holds_alternative<raw::HitList>(classify(one)));
}

// ── The three documented shapes ──────────────────────────────────

TEST_CASE("normalize: bare list keeps order and scores", "[normalizer]") {
    auto r = normalize(two_flat_hits());
    REQUIRE_FALSE(r.error.has_value());
    REQUIRE(r.warnings.empty());
    REQUIRE(r.hits.size() == 2);
    REQUIRE(r.hits[0].paper_id == "p1");
    REQUIRE(r.hits[0].text == "first passage");
    REQUIRE(r.hits[0].score == 2.1);
    REQUIRE(r.hits[1].paper_id == "p2");
    REQUIRE(r.hits[1].score == 1.4);
}

TEST_CASE("normalize: JSON string encoding a list matches the bare list", "[normalizer]") {
    auto bare = normalize(two_flat_hits());
    auto encoded = normalize(two_flat_hits().dump());
    REQUIRE(encoded.hits.size() == bare.hits.size());
    for (size_t i = 0; i < bare.hits.size(); i++) {
        REQUIRE(encoded.hits[i].paper_id == bare.hits[i].paper_id);
        REQUIRE(encoded.hits[i].text == bare.hits[i].text);
        REQUIRE(encoded.hits[i].score == bare.hits[i].score);
    }
}

TEST_CASE("normalize: error payload yields no hits and reports the error", "[normalizer]") {
    auto r = normalize(R"({"error": "index missing"})");
    REQUIRE(r.hits.empty());
    REQUIRE(r.error == std::optional<std::string>("index missing"));

    auto obj = normalize({{"error", {{"message", "nested"}}}});
    REQUIRE(obj.hits.empty());
    REQUIRE(obj.error == std::optional<std::string>("nested"));
}

TEST_CASE("normalize: descending order from the backend is not re-sorted", "[normalizer]") {
    json hits = json::array({
        {{"text", "a"}, {"score", 0.5}},
        {{"text", "b"}, {"score", 3.0}},
        {{"text", "c"}, {"score", 1.0}}
    });
    auto r = normalize(hits);
    REQUIRE(r.hits.size() == 3);
    REQUIRE(r.hits[0].text == "a");
    REQUIRE(r.hits[1].text == "b");
    REQUIRE(r.hits[2].text == "c");
}

// ── Wrappers ─────────────────────────────────────────────────────

TEST_CASE("normalize: list-of-one string wrapper", "[normalizer]") {
    auto r = normalize(json::array({two_flat_hits().dump()}));
    REQUIRE(r.hits.size() == 2);
}

TEST_CASE("normalize: content envelope", "[normalizer]") {
    json env = {{"content", json::array({{{"type", "text"}, {"text", two_flat_hits().dump()}}})}};
    auto r = normalize(env);
    REQUIRE(r.hits.size() == 2);
    REQUIRE(r.hits[1].paper_id == "p2");
}

TEST_CASE("normalize: content envelope flagged isError", "[normalizer]") {
    json env = {{"isError", true},
                {"content", json::array({{{"type", "text"}, {"text", "backend down"}}})}};
    auto r = normalize(env);
    REQUIRE(r.hits.empty());
    REQUIRE(r.error == std::optional<std::string>("backend down"));
}

TEST_CASE("normalize: object with text field", "[normalizer]") {
    auto r = normalize({{"text", two_flat_hits().dump()}});
    REQUIRE(r.hits.size() == 2);
}

// ── Malformed input never raises ─────────────────────────────────

TEST_CASE("normalize: malformed shapes yield empty lists", "[normalizer]") {
    for (const json& v : {json("[{broken"), json("{\"a\":"), json(3.5), json(nullptr),
                          json({{"unexpected", true}}), json("[[[[[[\"deep\"]]]]]]")}) {
        NormalizedResult r;
        REQUIRE_NOTHROW(r = normalize(v));
        REQUIRE(r.hits.empty());
    }
}

TEST_CASE("normalize: unparseable JSON text becomes the error", "[normalizer]") {
    auto r = normalize("[{broken");
    REQUIRE(r.hits.empty());
    REQUIRE(r.error == std::optional<std::string>("[{broken"));
}

TEST_CASE("normalize: plain prose is an opaque message", "[normalizer]") {
    auto r = normalize("Error performing search: connection refused");
    REQUIRE(r.hits.empty());
    REQUIRE(r.error.has_value());
    REQUIRE_THAT(*r.error, ContainsSubstring("connection refused"));
}

TEST_CASE("normalize: JSON object without error is empty, not an error", "[normalizer]") {
    auto r = normalize(R"({"took": 3})");
    REQUIRE(r.hits.empty());
    REQUIRE_FALSE(r.error.has_value());
}

TEST_CASE("normalize: wrappers nested too deeply give up", "[normalizer]") {
    json v = two_flat_hits().dump();
    for (int i = 0; i < 8; i++) v = json::array({v.dump()});
    auto r = normalize(v);
    REQUIRE(r.hits.empty());
}

// ── Element extraction ───────────────────────────────────────────

TEST_CASE("extract_hit: _source wrapper reads _score and _id", "[normalizer]") {
    json hit = {{"_id", "doc-9"}, {"_score", 7.25},
                {"_source", {{"full_text", "body"}}}};
    std::string warning;
    auto h = extract_hit(hit, warning);
    REQUIRE(h.has_value());
    REQUIRE(h->text == "body");
    REQUIRE(h->score == 7.25);
    REQUIRE(h->paper_id == "doc-9");
}

TEST_CASE("extract_hit: _source paper_id wins over _id", "[normalizer]") {
    json hit = {{"_id", "doc-9"}, {"_score", 1.0},
                {"_source", {{"paper_id", "2101.00001"}, {"full_text", "body"}}}};
    std::string warning;
    auto h = extract_hit(hit, warning);
    REQUIRE(h->paper_id == "2101.00001");
}

TEST_CASE("extract_hit: source wrapper reads score", "[normalizer]") {
    json hit = {{"score", 0.8}, {"source", {{"paper_id", "p"}, {"text", "t"}}}};
    std::string warning;
    auto h = extract_hit(hit, warning);
    REQUIRE(h.has_value());
    REQUIRE(h->score == 0.8);
    REQUIRE(h->paper_id == "p");
}

TEST_CASE("extract_hit: first matching shape wins", "[normalizer]") {
    json hit = {{"_source", {{"full_text", "from source"}}}, {"full_text", "flat"}};
    std::string warning;
    auto h = extract_hit(hit, warning);
    REQUIRE(h->text == "from source");
}

TEST_CASE("extract_hit: missing score defaults to zero", "[normalizer]") {
    std::string warning;
    auto h = extract_hit({{"full_text", "x"}}, warning);
    REQUIRE(h.has_value());
    REQUIRE(h->score == 0.0);
    REQUIRE(h->paper_id.empty());
}

TEST_CASE("normalize: elements without text are skipped with a warning", "[normalizer]") {
    json hits = json::array({
        {{"paper_id", "p1"}, {"text", "kept"}},
        {{"paper_id", "p2"}},
        {{"paper_id", "p3"}, {"text", ""}},
        "stray string",
        {{"_source", {{"paper_id", "p4"}}}},
        {{"paper_id", "p5"}, {"full_text", "also kept"}, {"score", 0.1}}
    });
    auto r = normalize(hits);
    REQUIRE(r.hits.size() == 2);
    REQUIRE(r.hits[0].paper_id == "p1");
    REQUIRE(r.hits[1].paper_id == "p5");
    REQUIRE(r.warnings.size() == 4);
    REQUIRE_THAT(r.warnings[0], ContainsSubstring("element 2"));
    REQUIRE_FALSE(r.error.has_value());
}
