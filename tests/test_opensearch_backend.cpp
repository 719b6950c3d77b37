#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "mock_http_client.hpp"
#include "backends/opensearch_backend.hpp"

using namespace paperscout;
using json = nlohmann::json;
using Catch::Matchers::ContainsSubstring;

// ── Helpers ──────────────────────────────────────────────────────

class FixedEmbedder : public Embedder {
public:
    Embedding vector = {0.25f, -0.5f, 1.0f};
    std::string error;
    int calls = 0;
    EmbedResult embed_query(const std::string&) override {
        calls++;
        return error.empty() ? EmbedResult::ok(vector) : EmbedResult::fail(error);
    }
    uint32_t dimensions() const override { return static_cast<uint32_t>(vector.size()); }
    std::string embedder_name() const override { return "fixed"; }
};

static OpenSearchBackend::Settings settings() {
    OpenSearchBackend::Settings s;
    s.url = "http://search:9200/";
    s.index = "arxiv_papers";
    return s;
}

static HttpResponse hits_response(const json& hits) {
    return {200, json{{"took", 2}, {"hits", {{"total", {{"value", hits.size()}}}, {"hits", hits}}}}.dump()};
}

// ── Query bodies ─────────────────────────────────────────────────

TEST_CASE("OpenSearchBackend: lexical query is a fuzzy multi_match", "[opensearch]") {
    MockHttpClient http;
    OpenSearchBackend backend(settings(), http, nullptr);
    auto q = backend.lexical_query("web audio", 3);

    REQUIRE(q["size"] == 3);
    REQUIRE(q["_source"] == json::array({"paper_id", "full_text"}));
    const auto& mm = q["query"]["multi_match"];
    REQUIRE(mm["query"] == "web audio");
    REQUIRE(mm["fields"] == json::array({"full_text"}));
    REQUIRE(mm["type"] == "best_fields");
    REQUIRE(mm["fuzziness"] == "AUTO");
}

TEST_CASE("OpenSearchBackend: vector query is nested knn over chunks", "[opensearch]") {
    MockHttpClient http;
    OpenSearchBackend backend(settings(), http, nullptr);
    auto q = backend.vector_query({0.5f, 1.0f}, 4);

    const auto& nested = q["query"]["nested"];
    REQUIRE(nested["path"] == "chunks");
    const auto& knn = nested["query"]["knn"]["chunks.embedding"];
    REQUIRE(knn["k"] == 4);
    REQUIRE(knn["vector"].size() == 2);
}

TEST_CASE("OpenSearchBackend: hybrid query boosts each clause by its weight", "[opensearch]") {
    MockHttpClient http;
    OpenSearchBackend backend(settings(), http, nullptr);
    auto q = backend.hybrid_query("q", {1.0f}, 3, {0.0, 2.5});

    const auto& should = q["query"]["bool"]["should"];
    REQUIRE(should.size() == 2);
    REQUIRE(should[0]["multi_match"]["boost"] == 0.0);
    REQUIRE(should[1]["nested"]["boost"] == 2.5);
}

// ── Searches over HTTP ───────────────────────────────────────────

TEST_CASE("OpenSearchBackend: lexical search posts to the index and returns raw hits", "[opensearch]") {
    MockHttpClient http;
    json hits = json::array({{{"_id", "a"}, {"_score", 3.2}, {"_source", {{"paper_id", "a"}, {"full_text", "x"}}}}});
    http.next_response = hits_response(hits);
    OpenSearchBackend backend(settings(), http, nullptr);

    auto r = backend.lexical_search("x", 3);
    REQUIRE(r.success);
    REQUIRE(r.hits == hits);
    REQUIRE(http.last_method == "POST");
    REQUIRE(http.last_url == "http://search:9200/arxiv_papers/_search");
    REQUIRE(json::parse(http.last_body)["size"] == 3);
}

TEST_CASE("OpenSearchBackend: engine errors become failed results", "[opensearch]") {
    MockHttpClient http;
    OpenSearchBackend backend(settings(), http, nullptr);

    http.next_response = {0, ""};
    REQUIRE(backend.lexical_search("x", 3).error == "search engine unreachable");

    http.next_response = {404, R"({"error":{"type":"index_not_found_exception","reason":"no such index [arxiv_papers]"}})"};
    REQUIRE(backend.lexical_search("x", 3).error == "HTTP 404: no such index [arxiv_papers]");

    http.next_response = {502, "<html>bad gateway</html>"};
    REQUIRE(backend.lexical_search("x", 3).error == "HTTP 502");

    http.next_response = {200, R"({"took":1})"};
    REQUIRE_FALSE(backend.lexical_search("x", 3).success);
}

TEST_CASE("OpenSearchBackend: vector search without an embedder", "[opensearch]") {
    MockHttpClient http;
    OpenSearchBackend backend(settings(), http, nullptr);

    auto r = backend.vector_search("x", 3);
    REQUIRE_FALSE(r.success);
    REQUIRE(r.error == "no embedding provider configured");
    REQUIRE(http.call_count == 0);
}

TEST_CASE("OpenSearchBackend: empty embedding fails before querying", "[opensearch]") {
    MockHttpClient http;
    FixedEmbedder embedder;
    embedder.vector.clear();
    OpenSearchBackend backend(settings(), http, &embedder);

    auto r = backend.hybrid_search("x", 3, {});
    REQUIRE_FALSE(r.success);
    REQUIRE_THAT(r.error, ContainsSubstring("fixed"));
    REQUIRE(http.call_count == 0);
}

TEST_CASE("OpenSearchBackend: embedder error is reported as the search error", "[opensearch]") {
    MockHttpClient http;
    FixedEmbedder embedder;
    embedder.error = "ollama returned 384 dimensions, the index expects 768";
    OpenSearchBackend backend(settings(), http, &embedder);

    auto r = backend.vector_search("x", 3);
    REQUIRE_FALSE(r.success);
    REQUIRE(r.error == embedder.error);
    REQUIRE(http.call_count == 0);
}

TEST_CASE("OpenSearchBackend: hybrid search embeds and sends weights", "[opensearch]") {
    MockHttpClient http;
    http.next_response = hits_response(json::array());
    FixedEmbedder embedder;
    OpenSearchBackend backend(settings(), http, &embedder);

    auto r = backend.hybrid_search("x", 2, {0.4, 0.6});
    REQUIRE(r.success);
    REQUIRE(embedder.calls == 1);
    auto body = json::parse(http.last_body);
    REQUIRE(body["query"]["bool"]["should"][0]["multi_match"]["boost"] == 0.4);
    REQUIRE(body["query"]["bool"]["should"][1]["nested"]["boost"] == 0.6);
}

// ── Point lookup ─────────────────────────────────────────────────

TEST_CASE("OpenSearchBackend: get_paper reads _source", "[opensearch]") {
    MockHttpClient http;
    http.next_response = {200, R"({"_id":"2101 01","found":true,"_source":{"paper_id":"2101 01","full_text":"body"}})"};
    OpenSearchBackend backend(settings(), http, nullptr);

    auto r = backend.get_paper("2101 01");
    REQUIRE(r.success);
    REQUIRE(r.paper.paper_id == "2101 01");
    REQUIRE(r.paper.full_text == "body");
    REQUIRE(http.last_method == "GET");
    REQUIRE(http.last_url == "http://search:9200/arxiv_papers/_doc/2101%2001");
}

TEST_CASE("OpenSearchBackend: get_paper missing document", "[opensearch]") {
    MockHttpClient http;
    http.next_response = {404, R"({"found":false})"};
    OpenSearchBackend backend(settings(), http, nullptr);

    auto r = backend.get_paper("nope");
    REQUIRE_FALSE(r.success);
    REQUIRE(r.error == "paper not found: nope");
}

TEST_CASE("OpenSearchBackend: get_paper without text field", "[opensearch]") {
    MockHttpClient http;
    http.next_response = {200, R"({"_source":{"paper_id":"p"}})"};
    OpenSearchBackend backend(settings(), http, nullptr);

    auto r = backend.get_paper("p");
    REQUIRE_FALSE(r.success);
    REQUIRE_THAT(r.error, ContainsSubstring("full_text"));
}
