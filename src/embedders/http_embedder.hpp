#pragma once
#include "../embedder.hpp"
#include "../http.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace paperscout {

enum class EmbeddingApi {
    OpenAi, // POST <base>/embeddings, vector at data[0].embedding
    Ollama  // POST <base>/api/embed, vector at embeddings[0]
};

// Query embedder for the paper index. The index is built with
// bge-base-en-v1.5 (768 dims), so a vector of any other length is
// rejected here instead of failing inside the knn query.
class HttpEmbedder : public Embedder {
public:
    HttpEmbedder(EmbeddingApi api, const EmbeddingConfig& config, HttpClient& http);

    EmbedResult embed_query(const std::string& query) override;
    uint32_t dimensions() const override { return dimensions_; }
    std::string embedder_name() const override;

    const std::string& url() const { return url_; }
    const std::string& model() const { return model_; }

    nlohmann::json request_body(const std::string& query) const;

private:
    EmbedResult parse_response(const std::string& body) const;

    EmbeddingApi api_;
    HttpClient& http_;
    std::string url_;
    std::string model_;
    std::string api_key_;
    std::string query_prefix_;
    uint32_t dimensions_;
    uint32_t timeout_seconds_;
};

} // namespace paperscout
