#pragma once
#include "../search_backend.hpp"
#include "../embedder.hpp"
#include "../http.hpp"
#include <string>

namespace paperscout {

// OpenSearch cluster holding one document per paper: paper_id, full_text and
// a nested "chunks" array whose entries carry a knn_vector "embedding".
class OpenSearchBackend : public SearchBackend {
public:
    struct Settings {
        std::string url = "http://localhost:9200";
        std::string index = "arxiv_papers";
        std::string text_field = "full_text";
        long timeout_seconds = 60;
    };

    // embedder may be nullptr; vector and hybrid modes then fail cleanly
    OpenSearchBackend(Settings settings, HttpClient& http, Embedder* embedder);

    SearchResult lexical_search(const std::string& query, uint32_t size) override;
    SearchResult vector_search(const std::string& query, uint32_t size) override;
    SearchResult hybrid_search(const std::string& query, uint32_t size,
                               const FusionWeights& weights) override;
    PaperResult get_paper(const std::string& paper_id) override;

    std::string backend_name() const override { return "opensearch"; }

    // Query bodies, exposed for tests
    nlohmann::json lexical_query(const std::string& query, uint32_t size) const;
    nlohmann::json vector_query(const Embedding& vector, uint32_t size) const;
    nlohmann::json hybrid_query(const std::string& query, const Embedding& vector,
                                uint32_t size, const FusionWeights& weights) const;

private:
    nlohmann::json multi_match(const std::string& query) const;
    nlohmann::json nested_knn(const Embedding& vector, uint32_t size) const;
    nlohmann::json with_source(nlohmann::json query, uint32_t size) const;

    SearchResult run_search(const nlohmann::json& body);
    EmbedResult embed_query(const std::string& query);

    Settings settings_;
    HttpClient& http_;
    Embedder* embedder_;
};

} // namespace paperscout
