#include "tool_registry.hpp"
#include <stdexcept>

namespace paperscout {

ToolRegistry::ToolRegistry(std::vector<std::unique_ptr<Tool>> tools) {
    for (auto& tool : tools) {
        if (!tool) continue;
        std::string name = tool->tool_name();
        if (!tools_.emplace(name, std::move(tool)).second) {
            throw std::invalid_argument("Duplicate tool name: " + name);
        }
    }
}

Tool* ToolRegistry::find(const std::string& name) const {
    auto it = tools_.find(name);
    return it == tools_.end() ? nullptr : it->second.get();
}

std::vector<ToolDescriptor> ToolRegistry::descriptors() const {
    std::vector<ToolDescriptor> out;
    out.reserve(tools_.size());
    for (const auto& [_, tool] : tools_) {
        out.push_back(tool->descriptor());
    }
    return out;
}

std::vector<std::string> ToolRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(tools_.size());
    for (const auto& [name, _] : tools_) {
        out.push_back(name);
    }
    return out;
}

} // namespace paperscout
