#include "protocol.hpp"

namespace paperscout {

Response Response::success(int64_t id, nlohmann::json result) {
    Response r;
    r.id = id;
    r.result = std::move(result);
    return r;
}

Response Response::failure(int64_t id, std::string message) {
    Response r;
    r.id = id;
    r.is_error = true;
    r.error_message = std::move(message);
    return r;
}

std::string encode(const Request& req) {
    nlohmann::json j = {
        {"jsonrpc", "2.0"},
        {"id", req.id},
        {"method", req.method},
        {"params", req.params.is_null() ? nlohmann::json::object() : req.params}
    };
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string encode(const Notification& note) {
    nlohmann::json j = {
        {"jsonrpc", "2.0"},
        {"method", note.method}
    };
    if (!note.params.is_null()) {
        j["params"] = note.params;
    }
    return j.dump();
}

std::string encode(const Response& resp) {
    nlohmann::json j = {
        {"jsonrpc", "2.0"},
        {"id", resp.id}
    };
    if (resp.is_error) {
        j["error"] = {{"message", resp.error_message}};
    } else {
        j["result"] = resp.result;
    }
    // Replace invalid UTF-8 from backends instead of throwing mid-reply
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

static nlohmann::json parse_object(const std::string& line) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& e) {
        throw ProtocolError(std::string("malformed JSON: ") + e.what());
    }
    if (!j.is_object()) {
        throw ProtocolError("message is not a JSON object");
    }
    return j;
}

static std::string error_text(const nlohmann::json& err) {
    if (err.is_object() && err.contains("message") && err["message"].is_string()) {
        return err["message"].get<std::string>();
    }
    if (err.is_string()) return err.get<std::string>();
    return err.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

Response decode_response(const std::string& line) {
    nlohmann::json j = parse_object(line);

    if (!j.contains("id") || !j["id"].is_number_integer()) {
        throw ProtocolError("response without integer id");
    }

    bool has_result = j.contains("result");
    bool has_error = j.contains("error") && !j["error"].is_null();
    if (has_result == has_error) {
        throw ProtocolError("response must carry exactly one of result and error");
    }

    int64_t id = j["id"].get<int64_t>();
    if (has_error) {
        return Response::failure(id, error_text(j["error"]));
    }
    return Response::success(id, j["result"]);
}

IncomingMessage decode_incoming(const std::string& line) {
    nlohmann::json j = parse_object(line);

    if (!j.contains("method") || !j["method"].is_string()) {
        throw ProtocolError("message without method");
    }

    IncomingMessage msg;
    msg.method = j["method"].get<std::string>();
    if (j.contains("id") && j["id"].is_number_integer()) {
        msg.id = j["id"].get<int64_t>();
    }
    if (j.contains("params") && j["params"].is_object()) {
        msg.params = j["params"];
    }
    return msg;
}

} // namespace paperscout
