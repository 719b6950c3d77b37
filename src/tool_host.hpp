#pragma once
#include "protocol.hpp"
#include "tool.hpp"
#include "tool_caller.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <sys/types.h>

namespace paperscout {

struct Config;

enum class HostState { NotStarted, Starting, Initializing, Ready, Terminating, Stopped };

const char* host_state_name(HostState state);

// Milliseconds left before a deadline, clamped to what poll() accepts
int poll_timeout_ms(uint64_t remaining_ms);

class ToolHostError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The server executable could not be launched
class SpawnError : public ToolHostError {
public:
    using ToolHostError::ToolHostError;
};

// initialize went unanswered or was refused; the child has been terminated
class HandshakeError : public ToolHostError {
public:
    using ToolHostError::ToolHostError;
};

struct HostOptions {
    std::string label = "search"; // log prefix for this host's child
    std::string command;
    std::vector<std::string> args;
    std::chrono::milliseconds settle_delay{1000};
    std::chrono::milliseconds response_timeout{30000};
    std::chrono::milliseconds shutdown_grace{3000};
    bool forward_stderr = true;

    std::string client_name = "paperscout";
    std::string client_version = "1.0.0";
    std::string protocol_version = "2024-11-05";

    static HostOptions from_config(const Config& config);
};

struct ListToolsResult {
    bool success = false;
    std::vector<ToolDescriptor> tools;
    std::string error;
};

// Spawns a tool server as a child process and talks line-delimited JSON-RPC
// to it over pipes. At most one request is outstanding at any time; calls
// from several threads are serialized. Each instance owns its own child,
// pipes and id counter.
class ToolHost : public ToolCaller {
public:
    explicit ToolHost(HostOptions options);
    ~ToolHost() override;

    ToolHost(const ToolHost&) = delete;
    ToolHost& operator=(const ToolHost&) = delete;

    // NotStarted -> Ready. Throws SpawnError or HandshakeError; both leave the
    // host Stopped with no child running.
    void start();

    CallResult call_tool(const std::string& name, const nlohmann::json& arguments) override;

    // Runs call_tool on a worker thread; the one-outstanding-request rule
    // still holds because calls share the same lock.
    std::future<CallResult> call_async(const std::string& name, nlohmann::json arguments);

    ListToolsResult list_tools();

    // Terminate the child and wait for it. Idempotent, safe from any state.
    void shutdown();

    // Callable from any thread: kills the child, fails a pending call with
    // CallError::Cancelled and leaves the host Stopped.
    void cancel();

    HostState state() const { return state_.load(); }
    int64_t last_request_id() const { return last_id_.load(); }
    pid_t pid() const;

private:
    enum class ReadStatus { Line, Eof, Timeout, Woken };

    CallResult exchange(const std::string& method, nlohmann::json params);
    CallResult gate() const;

    void spawn();
    void handshake();
    [[noreturn]] void fail_handshake(const std::string& reason);
    void terminate_locked();

    bool write_line(const std::string& line);
    ReadStatus read_line(std::string& out);

    void signal_child(int sig);
    bool reap(bool block);
    void drain_stderr();
    void close_fds();

    HostOptions options_;

    std::mutex call_mutex_; // one outstanding request per host
    std::atomic<HostState> state_{HostState::NotStarted};
    std::atomic<int64_t> last_id_{0};
    std::atomic<bool> cancelled_{false};
    bool handshake_failed_ = false;

    mutable std::mutex pid_mutex_;
    pid_t child_pid_ = -1;

    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
    int wake_read_fd_ = -1;
    int wake_write_fd_ = -1;
    std::string read_buffer_;

    std::thread stderr_thread_;
    std::atomic<bool> stop_drain_{false};
};

} // namespace paperscout
