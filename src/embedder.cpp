#include "embedder.hpp"
#include "embedders/http_embedder.hpp"
#include "config.hpp"
#include "http.hpp"
#include <iostream>

namespace paperscout {

std::unique_ptr<Embedder> create_embedder(const EmbeddingConfig& config, HttpClient& http) {
    if (config.provider.empty()) return nullptr;

    if (config.provider == "openai") {
        if (config.api_key.empty()) {
            std::cerr << "[embedder] OpenAI embeddings configured but no API key found\n";
            return nullptr;
        }
        return std::make_unique<HttpEmbedder>(EmbeddingApi::OpenAi, config, http);
    }

    if (config.provider == "ollama") {
        return std::make_unique<HttpEmbedder>(EmbeddingApi::Ollama, config, http);
    }

    std::cerr << "[embedder] Unknown embedding provider: " << config.provider << "\n";
    return nullptr;
}

} // namespace paperscout
