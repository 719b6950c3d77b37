#pragma once
#include "search_backend.hpp"
#include <stdexcept>
#include <string>

namespace paperscout {

// Scriptable backend: returns canned results and records what it was asked
class FakeSearchBackend : public SearchBackend {
public:
    SearchResult lexical_result = SearchResult::ok(nlohmann::json::array());
    SearchResult vector_result = SearchResult::ok(nlohmann::json::array());
    SearchResult hybrid_result = SearchResult::ok(nlohmann::json::array());
    PaperResult paper_result;
    std::string throw_message; // non-empty: every call throws runtime_error

    std::string last_query;
    uint32_t last_size = 0;
    FusionWeights last_weights;
    int lexical_calls = 0;
    int vector_calls = 0;
    int hybrid_calls = 0;
    int paper_calls = 0;

    SearchResult lexical_search(const std::string& query, uint32_t size) override {
        lexical_calls++;
        record(query, size);
        return lexical_result;
    }

    SearchResult vector_search(const std::string& query, uint32_t size) override {
        vector_calls++;
        record(query, size);
        return vector_result;
    }

    SearchResult hybrid_search(const std::string& query, uint32_t size,
                               const FusionWeights& weights) override {
        hybrid_calls++;
        record(query, size);
        last_weights = weights;
        return hybrid_result;
    }

    PaperResult get_paper(const std::string& paper_id) override {
        paper_calls++;
        record(paper_id, 0);
        return paper_result;
    }

    std::string backend_name() const override { return "fake"; }

private:
    void record(const std::string& query, uint32_t size) {
        last_query = query;
        last_size = size;
        if (!throw_message.empty()) throw std::runtime_error(throw_message);
    }
};

} // namespace paperscout
