#pragma once
#include <string>
#include <vector>
#include <memory>
#include <cstdint>

namespace paperscout {

using Embedding = std::vector<float>;

class HttpClient;          // forward declare
struct EmbeddingConfig;    // forward declare

struct EmbedResult {
    bool success = false;
    Embedding vector;
    std::string error;

    static EmbedResult ok(Embedding v) { return {true, std::move(v), {}}; }
    static EmbedResult fail(std::string msg) { return {false, {}, std::move(msg)}; }
};

// Turns a search query into the vector the paper index is searched with.
// Only the search backend embeds text; the protocol core never sees vectors.
class Embedder {
public:
    virtual ~Embedder() = default;

    virtual EmbedResult embed_query(const std::string& query) = 0;

    // Dimension every returned vector has; 0 when it is not checked
    virtual uint32_t dimensions() const = 0;

    // Human-readable name (e.g. "openai", "ollama")
    virtual std::string embedder_name() const = 0;
};

// Create an embedder from config. Returns nullptr if embeddings are disabled
// or the configured provider is not recognized.
std::unique_ptr<Embedder> create_embedder(const EmbeddingConfig& config, HttpClient& http);

} // namespace paperscout
