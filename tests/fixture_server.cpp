// Tool server driven by test_tool_host. Serves the real search tools over a
// scripted backend; special queries make it misbehave on purpose.
//
//   --no-handshake    exit after reading initialize, without replying
//   --handshake-error answer initialize with an error
//   --ignore-term     ignore SIGTERM and stdin EOF so shutdown has to escalate
//   --odd-types       valid replies whose name fields are not strings
//
//   query "crash"     exit in the middle of the call
//   query "hang"      never reply
//   query "garbage"   reply with a line that is not JSON
#include "protocol.hpp"
#include "tool_registry.hpp"
#include "tool_server.hpp"
#include "tools/search_tools.hpp"
#include <chrono>
#include <csignal>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <unistd.h>

using namespace paperscout;
using json = nlohmann::json;

namespace {

json audio_hits() {
    return json::array({
        {{"paper_id", "p1"}, {"text", "The Web Audio API was first drafted in 2011."}, {"score", 2.1}},
        {{"paper_id", "p2"}, {"text", "Audio processing graphs in the browser."}, {"score", 1.4}}
    });
}

class FixtureBackend : public SearchBackend {
public:
    SearchResult lexical_search(const std::string& query, uint32_t /*size*/) override {
        if (query == "crash") _exit(3);
        if (query == "audio api") return SearchResult::ok(audio_hits());
        return SearchResult::ok(json::array());
    }

    SearchResult vector_search(const std::string& query, uint32_t size) override {
        return lexical_search(query, size);
    }

    SearchResult hybrid_search(const std::string& /*query*/, uint32_t /*size*/,
                               const FusionWeights& /*weights*/) override {
        throw std::runtime_error("search cluster rejected the hybrid query");
    }

    PaperResult get_paper(const std::string& paper_id) override {
        PaperResult r;
        if (paper_id == "p1") {
            r.success = true;
            r.paper = {"p1", "The Web Audio API was first drafted in 2011."};
        } else {
            r.error = "paper not found: " + paper_id;
        }
        return r;
    }

    std::string backend_name() const override { return "fixture"; }
};

std::string call_query(const IncomingMessage& msg) {
    if (msg.method != methods::ToolsCall || !msg.params.is_object()) return {};
    const auto& args = msg.params.value("arguments", json::object());
    if (!args.is_object() || !args.contains("query") || !args["query"].is_string()) return {};
    return args["query"].get<std::string>();
}

void reply(const Response& resp) {
    std::cout << encode(resp) << '\n' << std::flush;
}

} // namespace

int main(int argc, char* argv[]) {
    bool no_handshake = false;
    bool handshake_error = false;
    bool ignore_term = false;
    bool odd_types = false;
    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--no-handshake") == 0) no_handshake = true;
        else if (std::strcmp(argv[i], "--handshake-error") == 0) handshake_error = true;
        else if (std::strcmp(argv[i], "--ignore-term") == 0) ignore_term = true;
        else if (std::strcmp(argv[i], "--odd-types") == 0) odd_types = true;
    }
    if (ignore_term) std::signal(SIGTERM, SIG_IGN);
    std::signal(SIGPIPE, SIG_IGN);

    FixtureBackend backend;
    std::vector<std::unique_ptr<Tool>> tools;
    tools.push_back(std::make_unique<Bm25SearchTool>(backend));
    tools.push_back(std::make_unique<VectorSearchTool>(backend));
    tools.push_back(std::make_unique<HybridSearchTool>(backend));
    tools.push_back(std::make_unique<PaperDetailsTool>(backend));
    ToolRegistry registry(std::move(tools));
    ToolServer server(registry, std::cout);

    std::cerr << "fixture server up\n";

    int64_t last_id = 0;
    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.empty()) continue;
        IncomingMessage msg = decode_incoming(line);

        if (msg.method == methods::Initialize) {
            if (no_handshake) return 0;
            if (handshake_error) {
                reply(Response::failure(*msg.id, "unsupported protocol version"));
                continue;
            }
        }

        if (msg.id) {
            // Ids must arrive as 1, 2, 3, ... with no gaps
            if (*msg.id != last_id + 1) {
                reply(Response::failure(*msg.id, "id gap: expected " +
                                        std::to_string(last_id + 1)));
                last_id = *msg.id;
                continue;
            }
            last_id = *msg.id;
        }

        if (odd_types && msg.method == methods::Initialize) {
            reply(Response::success(*msg.id, {{"serverInfo", {{"name", 42}}}}));
            continue;
        }
        if (odd_types && msg.method == methods::ToolsList) {
            reply(Response::success(*msg.id, {{"tools", {
                {{"name", 7}, {"description", "numeric name"}},
                {{"name", "bm25_search"}, {"description", {"not", "text"}}}
            }}}));
            continue;
        }

        std::string query = call_query(msg);
        if (query == "hang") {
            while (true) std::this_thread::sleep_for(std::chrono::seconds(1));
        }
        if (query == "garbage") {
            std::cout << "this is not json\n" << std::flush;
            continue;
        }

        auto resp = server.handle_line(line);
        if (resp) reply(*resp);
    }
    while (ignore_term) std::this_thread::sleep_for(std::chrono::seconds(1));
    return 0;
}
