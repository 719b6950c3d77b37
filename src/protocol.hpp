#pragma once
#include <string>
#include <optional>
#include <stdexcept>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace paperscout {

// Line-delimited JSON-RPC 2.0 over a child process's stdio.
// One message per line, UTF-8, '\n' terminated.

namespace methods {
    constexpr const char* Initialize  = "initialize";
    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* ToolsList   = "tools/list";
    constexpr const char* ToolsCall   = "tools/call";
} // namespace methods

// Raised by the codec when a line is not a well-formed message
class ProtocolError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct Request {
    int64_t id = 0;
    std::string method;
    nlohmann::json params = nlohmann::json::object();
};

struct Notification {
    std::string method;
    nlohmann::json params; // null = omitted on the wire
};

// Exactly one of result / error_message is meaningful, selected by is_error.
struct Response {
    int64_t id = 0;
    bool is_error = false;
    nlohmann::json result;
    std::string error_message;

    static Response success(int64_t id, nlohmann::json result);
    static Response failure(int64_t id, std::string message);
};

// An inbound line on the server side is either a Request or a Notification
struct IncomingMessage {
    std::string method;
    std::optional<int64_t> id; // absent for notifications
    nlohmann::json params = nlohmann::json::object();

    bool is_notification() const { return !id.has_value(); }
};

// Encoders produce a single line without the trailing newline
std::string encode(const Request& req);
std::string encode(const Notification& note);
std::string encode(const Response& resp);

// Decode a reply line read by the Host. Throws ProtocolError when the line is
// not JSON, is not an object, lacks an integer id, or carries neither/both of
// result and error.
Response decode_response(const std::string& line);

// Decode a line read by the Server. Throws ProtocolError when the line is not
// a JSON object with a string method.
IncomingMessage decode_incoming(const std::string& line);

} // namespace paperscout
