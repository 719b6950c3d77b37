#include "http_embedder.hpp"
#include "../config.hpp"
#include <iostream>

namespace paperscout {

using json = nlohmann::json;

static std::string strip_trailing_slashes(std::string url) {
    while (!url.empty() && url.back() == '/') url.pop_back();
    return url;
}

HttpEmbedder::HttpEmbedder(EmbeddingApi api, const EmbeddingConfig& config, HttpClient& http)
    : api_(api)
    , http_(http)
    , api_key_(config.api_key)
    , query_prefix_(config.query_prefix)
    , dimensions_(config.dimensions)
    , timeout_seconds_(config.timeout_seconds)
{
    if (api_ == EmbeddingApi::OpenAi) {
        std::string base = config.base_url.empty() ? "https://api.openai.com/v1" : config.base_url;
        url_ = strip_trailing_slashes(base) + "/embeddings";
        model_ = config.model.empty() ? "text-embedding-3-small" : config.model;
    } else {
        std::string base = config.base_url.empty() ? "http://localhost:11434" : config.base_url;
        url_ = strip_trailing_slashes(base) + "/api/embed";
        model_ = config.model.empty() ? "bge-base-en-v1.5" : config.model;
    }
}

std::string HttpEmbedder::embedder_name() const {
    return api_ == EmbeddingApi::OpenAi ? "openai" : "ollama";
}

json HttpEmbedder::request_body(const std::string& query) const {
    json body = {
        {"model", model_},
        {"input", query_prefix_ + query}
    };
    // OpenAI's v3 models can shorten their output to the index dimension
    if (api_ == EmbeddingApi::OpenAi && dimensions_ > 0) {
        body["dimensions"] = dimensions_;
    }
    return body;
}

EmbedResult HttpEmbedder::embed_query(const std::string& query) {
    std::vector<Header> headers = {
        {"Content-Type", "application/json"}
    };
    if (!api_key_.empty()) {
        headers.push_back({"Authorization", "Bearer " + api_key_});
    }

    auto response = http_.post(url_, request_body(query).dump(), headers, timeout_seconds_);
    if (response.status_code == 0) {
        return EmbedResult::fail(embedder_name() + " embeddings unreachable at " + url_);
    }
    if (!response.ok()) {
        std::cerr << "[embedder] " << embedder_name() << " returned HTTP "
                  << response.status_code << "\n";
        return EmbedResult::fail(embedder_name() + " embeddings error (HTTP " +
                                 std::to_string(response.status_code) + ")");
    }
    return parse_response(response.body);
}

EmbedResult HttpEmbedder::parse_response(const std::string& body) const {
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return EmbedResult::fail(embedder_name() + " embeddings response is not a JSON object");
    }

    const json* values = nullptr;
    if (api_ == EmbeddingApi::OpenAi) {
        if (j.contains("data") && j["data"].is_array() && !j["data"].empty() &&
            j["data"][0].is_object() && j["data"][0].contains("embedding")) {
            values = &j["data"][0]["embedding"];
        }
    } else if (j.contains("embeddings") && j["embeddings"].is_array() &&
               !j["embeddings"].empty()) {
        values = &j["embeddings"][0];
    }
    if (!values || !values->is_array()) {
        return EmbedResult::fail(embedder_name() + " embeddings response has no vector");
    }

    Embedding vector;
    vector.reserve(values->size());
    for (const auto& v : *values) {
        if (!v.is_number()) {
            return EmbedResult::fail(embedder_name() + " vector component " +
                                     std::to_string(vector.size()) + " is not a number");
        }
        vector.push_back(v.get<float>());
    }
    if (vector.empty()) {
        return EmbedResult::fail(embedder_name() + " returned an empty vector");
    }
    if (dimensions_ > 0 && vector.size() != dimensions_) {
        return EmbedResult::fail(embedder_name() + " returned " + std::to_string(vector.size()) +
                                 " dimensions, the index expects " + std::to_string(dimensions_));
    }
    return EmbedResult::ok(std::move(vector));
}

} // namespace paperscout
