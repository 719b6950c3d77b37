#include "answer_generator.hpp"
#include "config.hpp"
#include "http.hpp"
#include "query_processor.hpp"
#include "tool_host.hpp"
#include "util.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

static std::atomic<bool> g_interrupted{false};

static void signal_handler(int /*sig*/) {
    g_interrupted.store(true);
}

static constexpr size_t kDisplayChars = 300;
static const char* kDefaultQuery = "when was web audio api first introduced?";

static void print_usage() {
    std::cout << "Usage: paperscout [options]\n"
              << "\n"
              << "Options:\n"
              << "  -q, --query TEXT     Question to research (repeatable)\n"
              << "  --server CMD         Tool server executable (default: paperscout-server)\n"
              << "  --size N             Hits per search mode (default: 3)\n"
              << "  --no-answer          Skip LLM answer generation\n"
              << "  --list-tools         Print the server's tools and exit\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  PAPERSCOUT_SERVER_CMD  Tool server executable\n"
              << "  LLM_BASE_URL         OpenAI-compatible endpoint (default: http://localhost:4000)\n"
              << "  LLM_API_KEY          API key for the LLM endpoint\n"
              << "  LLM_MODEL            Model name (default: local-llama)\n";
}

static void print_mode(const paperscout::ModeOutcome& m) {
    std::cout << "\n" << paperscout::search_mode_label(m.mode) << " Search Results:\n"
              << std::string(30, '-') << "\n";
    if (!m.error.empty()) {
        std::cout << "  Error: " << m.error << "\n";
    }
    if (m.hits.empty()) {
        std::cout << "  No results found.\n";
        return;
    }
    size_t i = 0;
    for (const auto& hit : m.hits) {
        std::cout << "  " << ++i << ". [" << paperscout::format_fixed(hit.score, 2) << "] "
                  << (hit.paper_id.empty() ? "" : hit.paper_id + ": ")
                  << paperscout::truncate_display(hit.text, kDisplayChars) << "\n";
    }
}

static void print_report(const paperscout::QueryReport& report) {
    std::cout << "\nProcessing query: '" << report.query << "'\n"
              << std::string(60, '=') << "\n";
    for (const auto& m : report.modes) print_mode(m);

    if (report.status == paperscout::QueryStatus::NoResults) {
        std::cout << "\n" << paperscout::kNoResultsAnswer << "\n";
        return;
    }
    std::cout << "\nAnswer:\n" << std::string(40, '-') << "\n";
    if (!report.answer_error.empty()) {
        std::cout << "Error: could not get a response from the LLM ("
                  << report.answer_error << ")\n";
    } else if (!report.answer.empty()) {
        std::cout << report.answer << "\n";
    } else {
        std::cout << "(answer generation disabled)\n";
    }
    std::cout << "\n" << std::string(60, '=') << "\n";
}

int main(int argc, char* argv[]) try {
    std::vector<std::string> queries;
    std::string server_cmd;
    long size = 0;
    bool no_answer = false;
    bool list_only = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if ((std::strcmp(argv[i], "-q") == 0 || std::strcmp(argv[i], "--query") == 0) && i + 1 < argc) {
            queries.emplace_back(argv[++i]);
        } else if (std::strcmp(argv[i], "--server") == 0 && i + 1 < argc) {
            server_cmd = argv[++i];
        } else if (std::strcmp(argv[i], "--size") == 0 && i + 1 < argc) {
            size = std::strtol(argv[++i], nullptr, 10);
            if (size <= 0) {
                std::cerr << "--size must be a positive integer\n";
                return 1;
            }
        } else if (std::strcmp(argv[i], "--no-answer") == 0) {
            no_answer = true;
        } else if (std::strcmp(argv[i], "--list-tools") == 0) {
            list_only = true;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }
    if (queries.empty()) queries.emplace_back(kDefaultQuery);

    auto config = paperscout::Config::load();
    if (!server_cmd.empty()) {
        std::vector<std::string> parts;
        for (auto& p : paperscout::split(server_cmd, ' ')) {
            if (!p.empty()) parts.push_back(std::move(p));
        }
        if (parts.empty()) {
            std::cerr << "--server needs a command\n";
            return 1;
        }
        config.server.command = parts.front();
        config.server.args.assign(parts.begin() + 1, parts.end());
    }
    if (size > 0) config.search.size = static_cast<uint32_t>(size);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    paperscout::ToolHost host(paperscout::HostOptions::from_config(config));

    // Signal handlers cannot take the host's locks; a watcher relays them
    std::atomic<bool> done{false};
    std::thread watcher([&] {
        while (!done.load()) {
            if (g_interrupted.load()) {
                std::cerr << "\n[host] Interrupted, stopping server\n";
                host.cancel();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    });
    struct WatcherGuard {
        std::atomic<bool>& done;
        std::thread& t;
        ~WatcherGuard() {
            done = true;
            if (t.joinable()) t.join();
        }
    } guard{done, watcher};

    try {
        host.start();
    } catch (const paperscout::ToolHostError& e) {
        std::cerr << "Failed to start tool server: " << e.what() << "\n";
        return 1;
    }

    if (list_only) {
        auto listed = host.list_tools();
        if (!listed.success) {
            std::cerr << "tools/list failed: " << listed.error << "\n";
            return 1;
        }
        for (const auto& t : listed.tools) {
            std::cout << t.name << "\n    " << t.description << "\n";
        }
        host.shutdown();
        return 0;
    }

    paperscout::SocketHttpClient http_client;
    paperscout::ChatCompletionsAnswerGenerator generator(config.llm, http_client);

    paperscout::QueryOptions options;
    options.size = config.search.size;
    options.weights.lexical_weight = config.search.lexical_weight;
    options.weights.vector_weight = config.search.vector_weight;
    options.generate_answer = !no_answer;

    paperscout::QueryProcessor processor(host, &generator, options);
    int rc = 0;
    for (const auto& q : queries) {
        if (g_interrupted.load()) break;
        print_report(processor.process(q));
        if (host.state() != paperscout::HostState::Ready) {
            std::cerr << "Tool server is no longer running\n";
            rc = 1;
            break;
        }
    }

    host.shutdown();
    return g_interrupted.load() ? 130 : rc;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
