#pragma once
#include "answer_generator.hpp"
#include "fusion.hpp"
#include "normalizer.hpp"
#include "tool_caller.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace paperscout {

enum class SearchMode { Lexical, Vector, Hybrid };

const char* search_mode_label(SearchMode mode); // "BM25", "Dense Vector", "Hybrid"
const char* search_mode_tool(SearchMode mode);  // wire tool name

constexpr const char* kNoResultsAnswer = "No relevant documents found.";

struct ModeOutcome {
    SearchMode mode = SearchMode::Lexical;
    bool success = false;
    std::vector<SearchHit> hits;
    std::vector<std::string> warnings;
    std::string error;
    CallError call_error = CallError::None;
};

enum class QueryStatus { Success, NoResults };

struct QueryReport {
    std::string query;
    QueryStatus status = QueryStatus::NoResults;
    std::array<ModeOutcome, 3> modes; // lexical, vector, hybrid
    std::string context;              // built from hybrid hits, empty otherwise
    std::string answer;
    std::string answer_error;

    const ModeOutcome& outcome(SearchMode mode) const {
        return modes[static_cast<size_t>(mode)];
    }
};

struct QueryOptions {
    uint32_t size = 3;
    FusionWeights weights;
    bool generate_answer = true;
};

// "Query: ...\n\nRelevant Documents:\n\n" followed by one block per hit
std::string build_context(const std::string& query, const std::vector<SearchHit>& hits);

// Runs every search mode for a question through a ToolCaller and assembles
// the passages, the LLM context and the answer. Never throws for search or
// generation failures; they are recorded in the report.
class QueryProcessor {
public:
    QueryProcessor(ToolCaller& caller, AnswerGenerator* generator, QueryOptions options = {});

    QueryReport process(const std::string& query);

private:
    ModeOutcome run_mode(SearchMode mode, const std::string& query);

    ToolCaller& caller_;
    AnswerGenerator* generator_;
    QueryOptions options_;
};

} // namespace paperscout
