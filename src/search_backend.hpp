#pragma once
#include "fusion.hpp"
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace paperscout {

struct PaperRecord {
    std::string paper_id;
    std::string full_text;
};

// Ranked hits exactly as the engine returned them, already sorted by
// descending relevance. The shape of each hit is engine-specific.
struct SearchResult {
    bool success = false;
    nlohmann::json hits = nlohmann::json::array();
    std::string error;

    static SearchResult ok(nlohmann::json hits) { return {true, std::move(hits), {}}; }
    static SearchResult fail(std::string error) {
        return {false, nlohmann::json::array(), std::move(error)};
    }
};

struct PaperResult {
    bool success = false;
    PaperRecord paper;
    std::string error;
};

// The search engine the tools run against. Implementations report failure
// through the result values; anything they throw is caught at the tool
// server boundary.
class SearchBackend {
public:
    virtual ~SearchBackend() = default;

    virtual SearchResult lexical_search(const std::string& query, uint32_t size) = 0;
    virtual SearchResult vector_search(const std::string& query, uint32_t size) = 0;

    // Fusion happens inside the engine; weights arrive validated and unmodified
    virtual SearchResult hybrid_search(const std::string& query, uint32_t size,
                                       const FusionWeights& weights) = 0;

    virtual PaperResult get_paper(const std::string& paper_id) = 0;

    virtual std::string backend_name() const = 0;
};

} // namespace paperscout
