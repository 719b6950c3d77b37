#pragma once
#include "protocol.hpp"
#include "tool_registry.hpp"
#include <istream>
#include <optional>
#include <ostream>
#include <string>

namespace paperscout {

struct ServerInfo {
    std::string name = "paperscout-search";
    std::string version = "1.0.0";
    std::string protocol_version = "2024-11-05";
};

// Serves a ToolRegistry over line-delimited JSON-RPC. Owns nothing but the
// reply stream reference and the initialized flag; one failed tool call
// never ends the serve loop.
class ToolServer {
public:
    ToolServer(const ToolRegistry& registry, std::ostream& out, ServerInfo info = {});

    // Handle one inbound line. Returns the reply to send, or nullopt for
    // notifications. Throws ProtocolError when the line is not a message.
    std::optional<Response> handle_line(const std::string& line);

    // Read lines until EOF, replying on `out`. Returns 0 on EOF and 1 when the
    // input stream is corrupted (unparseable line).
    int serve(std::istream& in);

    bool initialized() const { return initialized_; }

private:
    Response dispatch(int64_t id, const IncomingMessage& msg);
    Response handle_initialize(int64_t id, const nlohmann::json& params);
    Response handle_tools_list(int64_t id) const;
    Response handle_tools_call(int64_t id, const nlohmann::json& params);

    void send(const Response& resp);

    const ToolRegistry& registry_;
    std::ostream& out_;
    ServerInfo info_;
    bool initialized_ = false;
};

} // namespace paperscout
