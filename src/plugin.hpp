#pragma once
#include "tool.hpp"
#include "search_backend.hpp"
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <unordered_map>
#include <mutex>

namespace paperscout {

struct Config;
class HttpClient;
class Embedder;

// Factory function types
using BackendFactory = std::function<std::unique_ptr<SearchBackend>(
    const Config& config, HttpClient& http, Embedder* embedder)>;

using ToolFactory = std::function<std::unique_ptr<Tool>(SearchBackend& backend)>;

// Central registry for self-registering backends and tools.
// All methods are thread-safe.
class PluginRegistry {
public:
    static PluginRegistry& instance();

    // Registration
    void register_backend(const std::string& name, BackendFactory factory);
    void register_tool(const std::string& name, ToolFactory factory);

    // Creation
    std::unique_ptr<SearchBackend> create_backend(const std::string& name,
                                                  const Config& config,
                                                  HttpClient& http,
                                                  Embedder* embedder) const;

    // One instance of every registered tool, bound to the given backend
    std::vector<std::unique_ptr<Tool>> create_all_tools(SearchBackend& backend) const;

    // Query
    std::vector<std::string> backend_names() const;
    std::vector<std::string> tool_names() const;
    bool has_backend(const std::string& name) const;

private:
    PluginRegistry() = default;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, BackendFactory> backends_;
    std::unordered_map<std::string, ToolFactory> tools_;
};

// ── Self-registrar helpers (used at file scope in each plugin .cpp) ──

struct BackendRegistrar {
    BackendRegistrar(const std::string& name, BackendFactory factory) {
        PluginRegistry::instance().register_backend(name, std::move(factory));
    }
};

struct ToolRegistrar {
    ToolRegistrar(const std::string& name, ToolFactory factory) {
        PluginRegistry::instance().register_tool(name, std::move(factory));
    }
};

} // namespace paperscout
