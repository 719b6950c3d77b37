#include "plugin.hpp"
#include <stdexcept>
#include <algorithm>

namespace paperscout {

PluginRegistry& PluginRegistry::instance() {
    static PluginRegistry registry;
    return registry;
}

void PluginRegistry::register_backend(const std::string& name, BackendFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    backends_[name] = std::move(factory);
}

void PluginRegistry::register_tool(const std::string& name, ToolFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    tools_[name] = std::move(factory);
}

std::unique_ptr<SearchBackend> PluginRegistry::create_backend(const std::string& name,
                                                              const Config& config,
                                                              HttpClient& http,
                                                              Embedder* embedder) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = backends_.find(name);
    if (it == backends_.end()) {
        throw std::invalid_argument("Unknown search backend: " + name);
    }
    return it->second(config, http, embedder);
}

std::vector<std::unique_ptr<Tool>> PluginRegistry::create_all_tools(SearchBackend& backend) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::unique_ptr<Tool>> result;
    result.reserve(tools_.size());
    for (const auto& [name, factory] : tools_) {
        result.push_back(factory(backend));
    }
    return result;
}

std::vector<std::string> PluginRegistry::backend_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(backends_.size());
    for (const auto& [name, _] : backends_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::vector<std::string> PluginRegistry::tool_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(tools_.size());
    for (const auto& [name, _] : tools_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

bool PluginRegistry::has_backend(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return backends_.count(name) > 0;
}

} // namespace paperscout
