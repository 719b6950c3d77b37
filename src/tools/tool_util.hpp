#pragma once
#include "../tool.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>

namespace paperscout {

constexpr uint32_t kDefaultResultSize = 5;
constexpr uint32_t kMaxResultSize = 100;

// Check that a required, non-empty string field exists. Returns error ToolResult if missing.
inline std::optional<ToolResult> require_string(const nlohmann::json& args, const char* field) {
    if (!args.is_object() || !args.contains(field) || !args[field].is_string() ||
        args[field].get<std::string>().empty()) {
        return ToolResult::fail(std::string("Missing required parameter: ") + field);
    }
    return std::nullopt;
}

// Optional "size": positive integer, default kDefaultResultSize, capped at kMaxResultSize.
inline std::optional<ToolResult> read_size(const nlohmann::json& args, uint32_t& out) {
    out = kDefaultResultSize;
    if (!args.is_object() || !args.contains("size") || args["size"].is_null()) {
        return std::nullopt;
    }
    const auto& v = args["size"];
    if (!v.is_number_integer() || v.get<int64_t>() <= 0) {
        return ToolResult::fail("size must be a positive integer");
    }
    int64_t n = v.get<int64_t>();
    out = n > kMaxResultSize ? kMaxResultSize : static_cast<uint32_t>(n);
    return std::nullopt;
}

} // namespace paperscout
