#pragma once
#include <string>
#include <memory>
#include <vector>
#include <nlohmann/json.hpp>

namespace paperscout {

// Advertised over tools/list. The host never enforces input_schema.
struct ToolDescriptor {
    std::string name;
    std::string description;
    nlohmann::json input_schema;
};

struct ToolResult {
    bool success;
    nlohmann::json output; // plain string or JSON structure, per tool
    std::string error;

    static ToolResult ok(nlohmann::json output) { return {true, std::move(output), {}}; }
    static ToolResult fail(std::string error) { return {false, nullptr, std::move(error)}; }
};

class Tool {
public:
    virtual ~Tool() = default;
    virtual ToolResult execute(const nlohmann::json& args) = 0;
    virtual std::string tool_name() const = 0;
    virtual std::string description() const = 0;
    virtual nlohmann::json input_schema() const = 0;

    ToolDescriptor descriptor() const {
        return ToolDescriptor{tool_name(), description(), input_schema()};
    }
};

} // namespace paperscout
