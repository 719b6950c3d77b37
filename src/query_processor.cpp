#include "query_processor.hpp"
#include "util.hpp"
#include <iostream>

namespace paperscout {

using json = nlohmann::json;

const char* search_mode_label(SearchMode mode) {
    switch (mode) {
        case SearchMode::Lexical: return "BM25";
        case SearchMode::Vector:  return "Dense Vector";
        case SearchMode::Hybrid:  return "Hybrid";
    }
    return "Unknown";
}

const char* search_mode_tool(SearchMode mode) {
    switch (mode) {
        case SearchMode::Lexical: return "bm25_search";
        case SearchMode::Vector:  return "vector_search";
        case SearchMode::Hybrid:  return "hybrid_search";
    }
    return "";
}

std::string build_context(const std::string& query, const std::vector<SearchHit>& hits) {
    std::string context = "Query: " + query + "\n\nRelevant Documents:\n\n";
    size_t i = 0;
    for (const auto& hit : hits) {
        ++i;
        std::string id = hit.paper_id.empty() ? "Document " + std::to_string(i) : hit.paper_id;
        context += "Document " + std::to_string(i) + ": " + id + "\n";
        context += "Text: " + hit.text + "\n";
        context += "Relevance Score: " + format_fixed(hit.score, 2) + "\n\n";
    }
    return context;
}

QueryProcessor::QueryProcessor(ToolCaller& caller, AnswerGenerator* generator,
                               QueryOptions options)
    : caller_(caller), generator_(generator), options_(options) {}

ModeOutcome QueryProcessor::run_mode(SearchMode mode, const std::string& query) {
    ModeOutcome out;
    out.mode = mode;

    json args = {{"query", query}, {"size", options_.size}};
    if (mode == SearchMode::Hybrid) {
        args["lexical_weight"] = options_.weights.lexical_weight;
        args["vector_weight"] = options_.weights.vector_weight;
    }

    CallResult result = caller_.call_tool(search_mode_tool(mode), args);
    if (!result.success) {
        out.call_error = result.error;
        out.error = result.message;
        std::cerr << "[agent] " << search_mode_label(mode) << " search failed ("
                  << call_error_name(result.error) << "): " << result.message << "\n";
        return out;
    }

    NormalizedResult normalized = normalize(result.value);
    out.hits = std::move(normalized.hits);
    out.warnings = std::move(normalized.warnings);
    if (normalized.error) {
        out.error = *normalized.error;
        std::cerr << "[agent] " << search_mode_label(mode) << " search reported: "
                  << out.error << "\n";
        return out;
    }
    out.success = true;
    return out;
}

QueryReport QueryProcessor::process(const std::string& query) {
    QueryReport report;
    report.query = query;

    for (SearchMode mode : {SearchMode::Lexical, SearchMode::Vector, SearchMode::Hybrid}) {
        report.modes[static_cast<size_t>(mode)] = run_mode(mode, query);
    }

    bool any_hits = false;
    for (const auto& m : report.modes) {
        if (!m.hits.empty()) any_hits = true;
    }
    report.status = any_hits ? QueryStatus::Success : QueryStatus::NoResults;

    const auto& hybrid = report.outcome(SearchMode::Hybrid);
    if (hybrid.hits.empty()) {
        report.answer = kNoResultsAnswer;
        return report;
    }

    report.context = build_context(query, hybrid.hits);
    if (!options_.generate_answer || !generator_) return report;

    AnswerResult answer = generator_->generate(query, report.context);
    if (answer.success) {
        report.answer = std::move(answer.text);
    } else {
        report.answer_error = answer.error;
        std::cerr << "[agent] Answer generation failed: " << answer.error << "\n";
    }
    return report;
}

} // namespace paperscout
