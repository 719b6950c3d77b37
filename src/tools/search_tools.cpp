#include "search_tools.hpp"
#include "tool_util.hpp"
#include "../plugin.hpp"
#include <nlohmann/json.hpp>

static paperscout::ToolRegistrar reg_bm25("bm25_search",
    [](paperscout::SearchBackend& b) { return std::make_unique<paperscout::Bm25SearchTool>(b); });
static paperscout::ToolRegistrar reg_vector("vector_search",
    [](paperscout::SearchBackend& b) { return std::make_unique<paperscout::VectorSearchTool>(b); });
static paperscout::ToolRegistrar reg_hybrid("hybrid_search",
    [](paperscout::SearchBackend& b) { return std::make_unique<paperscout::HybridSearchTool>(b); });
static paperscout::ToolRegistrar reg_paper("get_paper_details",
    [](paperscout::SearchBackend& b) { return std::make_unique<paperscout::PaperDetailsTool>(b); });

namespace paperscout {

using json = nlohmann::json;

static json query_schema(bool with_weights) {
    json props = {
        {"query", {{"type", "string"}, {"description", "Search query text"}}},
        {"size", {{"type", "integer"},
                  {"description", "Number of results to return (default: 5)"},
                  {"default", kDefaultResultSize}}}
    };
    if (with_weights) {
        props["lexical_weight"] = {{"type", "number"},
                                   {"description", "Weight for BM25 search (default: 0.3)"},
                                   {"default", kDefaultLexicalWeight}};
        props["vector_weight"] = {{"type", "number"},
                                  {"description", "Weight for vector search (default: 0.7)"},
                                  {"default", kDefaultVectorWeight}};
    }
    return {{"type", "object"}, {"properties", props}, {"required", json::array({"query"})}};
}

// Search tools hand back the engine's hit list JSON-encoded as text
static ToolResult to_tool_result(const SearchResult& result, const char* mode) {
    if (!result.success) {
        return ToolResult::fail(std::string(mode) + " search failed: " + result.error);
    }
    return ToolResult::ok(result.hits.dump(-1, ' ', false, json::error_handler_t::replace));
}

// ── bm25_search ──────────────────────────────────────────────────

ToolResult Bm25SearchTool::execute(const json& args) {
    if (auto err = require_string(args, "query")) return *err;
    uint32_t size = 0;
    if (auto err = read_size(args, size)) return *err;

    return to_tool_result(backend_.lexical_search(args["query"].get<std::string>(), size),
                          "BM25");
}

std::string Bm25SearchTool::description() const {
    return "Perform BM25 text search on arXiv papers. Best for exact keyword matching.";
}

json Bm25SearchTool::input_schema() const { return query_schema(false); }

// ── vector_search ────────────────────────────────────────────────

ToolResult VectorSearchTool::execute(const json& args) {
    if (auto err = require_string(args, "query")) return *err;
    uint32_t size = 0;
    if (auto err = read_size(args, size)) return *err;

    return to_tool_result(backend_.vector_search(args["query"].get<std::string>(), size),
                          "Vector");
}

std::string VectorSearchTool::description() const {
    return "Perform semantic vector search on arXiv papers. "
           "Best for understanding meaning and context.";
}

json VectorSearchTool::input_schema() const { return query_schema(false); }

// ── hybrid_search ────────────────────────────────────────────────

ToolResult HybridSearchTool::execute(const json& args) {
    if (auto err = require_string(args, "query")) return *err;
    uint32_t size = 0;
    if (auto err = read_size(args, size)) return *err;

    // Invalid weights never reach the backend
    FusionWeights weights;
    if (auto err = weights_from_args(args, weights)) return ToolResult::fail(*err);

    return to_tool_result(
        backend_.hybrid_search(args["query"].get<std::string>(), size, weights), "Hybrid");
}

std::string HybridSearchTool::description() const {
    return "Perform hybrid search combining BM25 and vector search for optimal results.";
}

json HybridSearchTool::input_schema() const { return query_schema(true); }

// ── get_paper_details ────────────────────────────────────────────

ToolResult PaperDetailsTool::execute(const json& args) {
    if (auto err = require_string(args, "paper_id")) return *err;
    std::string paper_id = args["paper_id"].get<std::string>();

    auto result = backend_.get_paper(paper_id);
    if (!result.success) {
        return ToolResult::fail("Failed to get paper details: " + result.error);
    }

    std::string text = "Paper Details for " + paper_id + ":\n\n";
    text += "Full Text:\n" + result.paper.full_text + "\n";
    return ToolResult::ok(text);
}

std::string PaperDetailsTool::description() const {
    return "Get detailed information about a specific paper by paper ID.";
}

json PaperDetailsTool::input_schema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"paper_id", {{"type", "string"},
                          {"description", "Paper ID of the paper (e.g., 'paper1')"}}}
        }},
        {"required", json::array({"paper_id"})}
    };
}

} // namespace paperscout
