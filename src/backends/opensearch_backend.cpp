#include "opensearch_backend.hpp"
#include "../config.hpp"
#include "../plugin.hpp"
#include <nlohmann/json.hpp>
#include <iostream>

static paperscout::BackendRegistrar reg_opensearch("opensearch",
    [](const paperscout::Config& config, paperscout::HttpClient& http,
       paperscout::Embedder* embedder) {
        paperscout::OpenSearchBackend::Settings s;
        s.url = config.opensearch.url;
        s.index = config.opensearch.index;
        s.text_field = config.opensearch.text_field;
        s.timeout_seconds = static_cast<long>(config.opensearch.timeout_seconds);
        return std::make_unique<paperscout::OpenSearchBackend>(std::move(s), http, embedder);
    });

namespace paperscout {

using json = nlohmann::json;

static const std::vector<Header> kJsonHeaders = {
    {"Content-Type", "application/json"},
    {"Accept", "application/json"}
};

// Pull the most useful message out of an OpenSearch error body
static std::string describe_failure(const HttpResponse& resp) {
    if (resp.status_code == 0) return "search engine unreachable";
    std::string detail = "HTTP " + std::to_string(resp.status_code);
    try {
        auto j = json::parse(resp.body);
        if (j.contains("error")) {
            const auto& err = j["error"];
            if (err.is_object() && err.contains("reason") && err["reason"].is_string()) {
                return detail + ": " + err["reason"].get<std::string>();
            }
            if (err.is_string()) return detail + ": " + err.get<std::string>();
        }
    } catch (const json::parse_error&) {
        // body is not JSON; status alone is the best we have
    }
    return detail;
}

OpenSearchBackend::OpenSearchBackend(Settings settings, HttpClient& http, Embedder* embedder)
    : settings_(std::move(settings)), http_(http), embedder_(embedder) {
    while (!settings_.url.empty() && settings_.url.back() == '/') {
        settings_.url.pop_back();
    }
}

json OpenSearchBackend::multi_match(const std::string& query) const {
    return {
        {"multi_match", {
            {"query", query},
            {"fields", json::array({settings_.text_field})},
            {"type", "best_fields"},
            {"fuzziness", "AUTO"}
        }}
    };
}

json OpenSearchBackend::nested_knn(const Embedding& vector, uint32_t size) const {
    return {
        {"nested", {
            {"path", "chunks"},
            {"query", {
                {"knn", {
                    {"chunks.embedding", {
                        {"vector", vector},
                        {"k", size}
                    }}
                }}
            }}
        }}
    };
}

json OpenSearchBackend::with_source(json query, uint32_t size) const {
    return {
        {"query", std::move(query)},
        {"size", size},
        {"_source", json::array({"paper_id", settings_.text_field})}
    };
}

json OpenSearchBackend::lexical_query(const std::string& query, uint32_t size) const {
    return with_source(multi_match(query), size);
}

json OpenSearchBackend::vector_query(const Embedding& vector, uint32_t size) const {
    return with_source(nested_knn(vector, size), size);
}

json OpenSearchBackend::hybrid_query(const std::string& query, const Embedding& vector,
                                     uint32_t size, const FusionWeights& weights) const {
    json lexical = multi_match(query);
    lexical["multi_match"]["boost"] = weights.lexical_weight;
    json semantic = nested_knn(vector, size);
    semantic["nested"]["boost"] = weights.vector_weight;
    return with_source({{"bool", {{"should", json::array({lexical, semantic})}}}}, size);
}

SearchResult OpenSearchBackend::run_search(const json& body) {
    std::string url = settings_.url + "/" + url_encode(settings_.index) + "/_search";
    auto resp = http_.post(url, body.dump(-1, ' ', false, json::error_handler_t::replace),
                           kJsonHeaders, settings_.timeout_seconds);
    if (!resp.ok()) {
        return SearchResult::fail(describe_failure(resp));
    }

    json j;
    try {
        j = json::parse(resp.body);
    } catch (const json::parse_error& e) {
        return SearchResult::fail(std::string("unreadable search response: ") + e.what());
    }
    if (!j.contains("hits") || !j["hits"].is_object() ||
        !j["hits"].contains("hits") || !j["hits"]["hits"].is_array()) {
        return SearchResult::fail("search response has no hits array");
    }
    return SearchResult::ok(j["hits"]["hits"]);
}

EmbedResult OpenSearchBackend::embed_query(const std::string& query) {
    if (!embedder_) {
        return EmbedResult::fail("no embedding provider configured");
    }
    EmbedResult r = embedder_->embed_query(query);
    if (r.success && r.vector.empty()) {
        return EmbedResult::fail("embedding provider " + embedder_->embedder_name() +
                                 " returned no vector");
    }
    return r;
}

SearchResult OpenSearchBackend::lexical_search(const std::string& query, uint32_t size) {
    return run_search(lexical_query(query, size));
}

SearchResult OpenSearchBackend::vector_search(const std::string& query, uint32_t size) {
    EmbedResult embedded = embed_query(query);
    if (!embedded.success) return SearchResult::fail(embedded.error);
    return run_search(vector_query(embedded.vector, size));
}

SearchResult OpenSearchBackend::hybrid_search(const std::string& query, uint32_t size,
                                              const FusionWeights& weights) {
    EmbedResult embedded = embed_query(query);
    if (!embedded.success) return SearchResult::fail(embedded.error);
    return run_search(hybrid_query(query, embedded.vector, size, weights));
}

PaperResult OpenSearchBackend::get_paper(const std::string& paper_id) {
    PaperResult result;
    std::string url = settings_.url + "/" + url_encode(settings_.index) +
                      "/_doc/" + url_encode(paper_id);
    auto resp = http_.get(url, kJsonHeaders, settings_.timeout_seconds);
    if (resp.status_code == 404) {
        result.error = "paper not found: " + paper_id;
        return result;
    }
    if (!resp.ok()) {
        result.error = describe_failure(resp);
        return result;
    }

    try {
        auto j = json::parse(resp.body);
        const auto& source = j.at("_source");
        result.paper.paper_id = source.value("paper_id", paper_id);
        result.paper.full_text = source.at(settings_.text_field).get<std::string>();
        result.success = true;
    } catch (const json::exception& e) {
        std::cerr << "[opensearch] Unexpected document shape for " << paper_id
                  << ": " << e.what() << "\n";
        result.error = "document " + paper_id + " has no " + settings_.text_field;
    }
    return result;
}

} // namespace paperscout
