#include "config.hpp"
#include "embedder.hpp"
#include "http.hpp"
#include "plugin.hpp"
#include "tool_registry.hpp"
#include "tool_server.hpp"
#include <csignal>
#include <cstring>
#include <iostream>

// stdout carries protocol replies only; every diagnostic goes to stderr.

static void print_usage() {
    std::cerr << "Usage: paperscout-server [options]\n"
              << "\n"
              << "Serves the search tools over line-delimited JSON-RPC on stdin/stdout.\n"
              << "\n"
              << "Options:\n"
              << "  --backend NAME       Search backend (default from config: opensearch)\n"
              << "  --index NAME         Index to search\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  OPENSEARCH_URL       Search engine URL (default: http://localhost:9200)\n"
              << "  PAPERSCOUT_INDEX     Index name (default: arxiv_papers)\n"
              << "  OLLAMA_BASE_URL      Base URL for Ollama embeddings\n"
              << "  OPENAI_API_KEY       API key for OpenAI embeddings\n";
}

int main(int argc, char* argv[]) try {
    std::string backend_name;
    std::string index;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--backend") == 0 && i + 1 < argc) {
            backend_name = argv[++i];
        } else if (std::strcmp(argv[i], "--index") == 0 && i + 1 < argc) {
            index = argv[++i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    // The host closes our stdin and may exit before reading a last reply
    std::signal(SIGPIPE, SIG_IGN);

    auto config = paperscout::Config::load();
    if (!backend_name.empty()) config.backend = backend_name;
    if (!index.empty()) config.opensearch.index = index;

    paperscout::SocketHttpClient http_client;
    auto embedder = paperscout::create_embedder(config.embeddings, http_client);
    if (embedder) {
        std::cerr << "[server] Embeddings via " << embedder->embedder_name() << "\n";
    } else {
        std::cerr << "[server] No embedding provider; vector and hybrid search disabled\n";
    }

    std::unique_ptr<paperscout::SearchBackend> backend;
    try {
        backend = paperscout::PluginRegistry::instance().create_backend(
            config.backend, config, http_client, embedder.get());
    } catch (const std::exception& e) {
        std::cerr << "[server] Error creating backend: " << e.what() << "\n";
        return 1;
    }

    paperscout::ToolRegistry registry(
        paperscout::PluginRegistry::instance().create_all_tools(*backend));
    std::cerr << "[server] Serving " << registry.size() << " tools on "
              << backend->backend_name() << "\n";

    paperscout::ToolServer server(registry, std::cout);
    return server.serve(std::cin);
} catch (const std::exception& e) {
    std::cerr << "[server] Fatal error: " << e.what() << '\n';
    return 1;
}
