#include "tool_server.hpp"
#include "util.hpp"
#include <iostream>

namespace paperscout {

using json = nlohmann::json;

ToolServer::ToolServer(const ToolRegistry& registry, std::ostream& out, ServerInfo info)
    : registry_(registry), out_(out), info_(std::move(info)) {}

std::optional<Response> ToolServer::handle_line(const std::string& line) {
    IncomingMessage msg = decode_incoming(line);

    if (msg.is_notification()) {
        if (msg.method != methods::Initialized) {
            std::cerr << "[server] Ignoring notification " << msg.method << "\n";
        }
        return std::nullopt;
    }

    int64_t id = *msg.id;
    // The line itself parsed; a params shape we did not expect fails this request only
    try {
        return dispatch(id, msg);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[server] Bad params for " << msg.method << ": " << e.what() << "\n";
        return Response::failure(id, "invalid params for " + msg.method + ": " + e.what());
    }
}

Response ToolServer::dispatch(int64_t id, const IncomingMessage& msg) {
    if (msg.method == methods::Initialize) {
        return handle_initialize(id, msg.params);
    }
    if (!initialized_) {
        return Response::failure(id, "server not initialized");
    }
    if (msg.method == methods::ToolsList) {
        return handle_tools_list(id);
    }
    if (msg.method == methods::ToolsCall) {
        return handle_tools_call(id, msg.params);
    }
    return Response::failure(id, "unknown method " + msg.method);
}

Response ToolServer::handle_initialize(int64_t id, const json& params) {
    initialized_ = true;

    std::string client = "unknown client";
    if (params.contains("clientInfo") && params["clientInfo"].is_object()) {
        const auto& info = params["clientInfo"];
        if (info.contains("name") && info["name"].is_string()) {
            client = info["name"].get<std::string>();
        }
    }
    std::cerr << "[server] Initialized by " << client << "\n";

    std::string version = info_.protocol_version;
    if (params.contains("protocolVersion") && params["protocolVersion"].is_string()) {
        version = params["protocolVersion"].get<std::string>();
    }

    return Response::success(id, {
        {"protocolVersion", version},
        {"capabilities", {{"tools", {{"listChanged", false}}}}},
        {"serverInfo", {{"name", info_.name}, {"version", info_.version}}}
    });
}

Response ToolServer::handle_tools_list(int64_t id) const {
    json tools = json::array();
    for (const auto& d : registry_.descriptors()) {
        tools.push_back({
            {"name", d.name},
            {"description", d.description},
            {"inputSchema", d.input_schema}
        });
    }
    return Response::success(id, {{"tools", tools}});
}

Response ToolServer::handle_tools_call(int64_t id, const json& params) {
    if (!params.contains("name") || !params["name"].is_string()) {
        return Response::failure(id, "missing tool name");
    }
    std::string name = params["name"].get<std::string>();

    Tool* tool = registry_.find(name);
    if (!tool) {
        return Response::failure(id, "unknown tool " + name);
    }

    json args = json::object();
    if (params.contains("arguments") && !params["arguments"].is_null()) {
        args = params["arguments"];
    }

    // Backend faults become error replies, never stream faults
    try {
        ToolResult result = tool->execute(args);
        if (!result.success) {
            std::cerr << "[server] " << name << " failed: " << result.error << "\n";
            return Response::failure(id, result.error);
        }
        return Response::success(id, std::move(result.output));
    } catch (const std::exception& e) {
        std::cerr << "[server] " << name << " threw: " << e.what() << "\n";
        return Response::failure(id, e.what());
    } catch (...) {
        std::cerr << "[server] " << name << " threw a non-standard exception\n";
        return Response::failure(id, "internal error in " + name);
    }
}

void ToolServer::send(const Response& resp) {
    out_ << encode(resp) << '\n';
    out_.flush();
}

int ToolServer::serve(std::istream& in) {
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (trim(line).empty()) continue;

        std::optional<Response> reply;
        try {
            reply = handle_line(line);
        } catch (const ProtocolError& e) {
            // Framing is one message per line; a bad line means a bad stream
            std::cerr << "[server] Fatal: corrupted input stream: " << e.what() << "\n";
            return 1;
        }
        if (reply) send(*reply);
        if (!out_) {
            std::cerr << "[server] Reply channel closed\n";
            return 1;
        }
    }
    return 0;
}

} // namespace paperscout
