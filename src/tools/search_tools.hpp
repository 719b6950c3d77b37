#pragma once
#include "../tool.hpp"
#include "../search_backend.hpp"

namespace paperscout {

// Keyword ranking with fuzzy term matching
class Bm25SearchTool : public Tool {
public:
    explicit Bm25SearchTool(SearchBackend& backend) : backend_(backend) {}

    ToolResult execute(const nlohmann::json& args) override;
    std::string tool_name() const override { return "bm25_search"; }
    std::string description() const override;
    nlohmann::json input_schema() const override;

private:
    SearchBackend& backend_;
};

// Dense-embedding similarity search
class VectorSearchTool : public Tool {
public:
    explicit VectorSearchTool(SearchBackend& backend) : backend_(backend) {}

    ToolResult execute(const nlohmann::json& args) override;
    std::string tool_name() const override { return "vector_search"; }
    std::string description() const override;
    nlohmann::json input_schema() const override;

private:
    SearchBackend& backend_;
};

class HybridSearchTool : public Tool {
public:
    explicit HybridSearchTool(SearchBackend& backend) : backend_(backend) {}

    ToolResult execute(const nlohmann::json& args) override;
    std::string tool_name() const override { return "hybrid_search"; }
    std::string description() const override;
    nlohmann::json input_schema() const override;

private:
    SearchBackend& backend_;
};

// Point lookup of one paper's full text
class PaperDetailsTool : public Tool {
public:
    explicit PaperDetailsTool(SearchBackend& backend) : backend_(backend) {}

    ToolResult execute(const nlohmann::json& args) override;
    std::string tool_name() const override { return "get_paper_details"; }
    std::string description() const override;
    nlohmann::json input_schema() const override;

private:
    SearchBackend& backend_;
};

} // namespace paperscout
