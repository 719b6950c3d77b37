#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace paperscout {

struct ServerConfig {
    std::string command = "paperscout-server";
    std::vector<std::string> args;
    uint32_t settle_delay_ms = 1000;      // wait after spawn before initialize
    uint32_t response_timeout_ms = 30000; // per blocking line read
    uint32_t shutdown_grace_ms = 3000;    // SIGTERM -> SIGKILL escalation
    bool forward_stderr = true;
};

struct ClientConfig {
    std::string name = "paperscout";
    std::string version = "1.0.0";
    std::string protocol_version = "2024-11-05";
};

struct SearchConfig {
    uint32_t size = 3;
    double lexical_weight = 0.3;
    double vector_weight = 0.7;
};

struct OpenSearchConfig {
    std::string url = "http://localhost:9200";
    std::string index = "arxiv_papers";
    std::string text_field = "full_text";
    uint32_t timeout_seconds = 60;
};

struct EmbeddingConfig {
    std::string provider = "ollama"; // "ollama", "openai" or "" (disabled)
    std::string base_url;
    std::string model;
    std::string api_key;
    std::string query_prefix;        // prepended to every query before embedding
    uint32_t dimensions = 768;       // knn_vector dimension of the index; 0 skips the check
    uint32_t timeout_seconds = 30;
};

struct LlmConfig {
    std::string base_url = "http://localhost:4000";
    std::string model = "local-llama";
    std::string api_key = "demo-key-123";
    uint32_t max_tokens = 200;
    double temperature = 0.2;
    uint32_t timeout_seconds = 300;
};

struct Config {
    std::string backend = "opensearch";

    ServerConfig server;
    ClientConfig client;
    SearchConfig search;
    OpenSearchConfig opensearch;
    EmbeddingConfig embeddings;
    LlmConfig llm;

    // Load from ~/.paperscout/config.json + env vars
    static Config load();

    // Parse an already-loaded document; unknown or mistyped keys keep defaults
    static Config from_json(const nlohmann::json& j);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Apply environment variable overrides
    void apply_env();
};

// Add keys present in defaults but missing from existing (recursively)
nlohmann::json merge_defaults(const nlohmann::json& existing,
                              const nlohmann::json& defaults);

} // namespace paperscout
