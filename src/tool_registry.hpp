#pragma once
#include "tool.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace paperscout {

// Fixed name -> tool table served by the ToolServer. Built once, never
// mutated afterwards, so lookups need no locking.
class ToolRegistry {
public:
    explicit ToolRegistry(std::vector<std::unique_ptr<Tool>> tools);

    ToolRegistry(const ToolRegistry&) = delete;
    ToolRegistry& operator=(const ToolRegistry&) = delete;

    // nullptr when no tool has that name
    Tool* find(const std::string& name) const;

    std::vector<ToolDescriptor> descriptors() const;
    std::vector<std::string> names() const;
    size_t size() const { return tools_.size(); }

private:
    std::map<std::string, std::unique_ptr<Tool>> tools_;
};

} // namespace paperscout
