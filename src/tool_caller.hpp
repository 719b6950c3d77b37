#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace paperscout {

// Why a single tool call failed. Everything except Remote and MalformedReply
// means the channel is no longer usable.
enum class CallError {
    None,
    NotStarted,      // start() has not completed
    HandshakeFailed, // the host never reached Ready
    Stopped,         // shut down, or a previous call ended the channel
    NoResponse,      // child closed its output before replying
    Timeout,         // no reply line within the response timeout
    MalformedReply,  // reply line was not a valid response
    Remote,          // server answered with an error response
    Cancelled
};

inline const char* call_error_name(CallError e) {
    switch (e) {
        case CallError::None:            return "none";
        case CallError::NotStarted:      return "not_started";
        case CallError::HandshakeFailed: return "handshake_failed";
        case CallError::Stopped:         return "stopped";
        case CallError::NoResponse:      return "no_response";
        case CallError::Timeout:         return "timeout";
        case CallError::MalformedReply:  return "malformed_reply";
        case CallError::Remote:          return "remote";
        case CallError::Cancelled:       return "cancelled";
    }
    return "unknown";
}

struct CallResult {
    bool success = false;
    nlohmann::json value;   // raw "result" of the reply
    CallError error = CallError::None;
    std::string message;

    static CallResult ok(nlohmann::json value) {
        return {true, std::move(value), CallError::None, {}};
    }
    static CallResult fail(CallError error, std::string message) {
        return {false, nullptr, error, std::move(message)};
    }
};

// Anything that can invoke a named tool synchronously
class ToolCaller {
public:
    virtual ~ToolCaller() = default;
    virtual CallResult call_tool(const std::string& name, const nlohmann::json& arguments) = 0;
};

} // namespace paperscout
