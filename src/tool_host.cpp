#include "tool_host.hpp"
#include "config.hpp"
#include "util.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <limits>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace paperscout {

using json = nlohmann::json;

const char* host_state_name(HostState state) {
    switch (state) {
        case HostState::NotStarted:   return "NotStarted";
        case HostState::Starting:     return "Starting";
        case HostState::Initializing: return "Initializing";
        case HostState::Ready:        return "Ready";
        case HostState::Terminating:  return "Terminating";
        case HostState::Stopped:      return "Stopped";
    }
    return "Unknown";
}

HostOptions HostOptions::from_config(const Config& config) {
    HostOptions o;
    o.command = config.server.command;
    o.args = config.server.args;
    o.settle_delay = std::chrono::milliseconds(config.server.settle_delay_ms);
    o.response_timeout = std::chrono::milliseconds(config.server.response_timeout_ms);
    o.shutdown_grace = std::chrono::milliseconds(config.server.shutdown_grace_ms);
    o.forward_stderr = config.server.forward_stderr;
    o.client_name = config.client.name;
    o.client_version = config.client.version;
    o.protocol_version = config.client.protocol_version;
    return o;
}

// Writes to a dead child must surface as EPIPE, not kill the process
static void ignore_sigpipe() {
    static std::once_flag once;
    std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

int poll_timeout_ms(uint64_t remaining_ms) {
    constexpr auto kMax = static_cast<uint64_t>(std::numeric_limits<int>::max());
    return static_cast<int>(std::min(remaining_ms, kMax));
}

// Reads obj[key] only when it holds a string; peers may send anything
static std::string string_field(const json& obj, const char* key,
                                const std::string& fallback) {
    if (!obj.is_object()) return fallback;
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return fallback;
    return it->get<std::string>();
}

static void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

ToolHost::ToolHost(HostOptions options) : options_(std::move(options)) {
    int wake[2];
    if (pipe2(wake, O_CLOEXEC | O_NONBLOCK) == 0) {
        wake_read_fd_ = wake[0];
        wake_write_fd_ = wake[1];
    }
}

ToolHost::~ToolHost() {
    shutdown();
    close_fd(wake_read_fd_);
    close_fd(wake_write_fd_);
}

pid_t ToolHost::pid() const {
    std::lock_guard<std::mutex> lock(pid_mutex_);
    return child_pid_;
}

// ── Lifecycle ────────────────────────────────────────────────────

void ToolHost::start() {
    std::lock_guard<std::mutex> lock(call_mutex_);
    if (state_.load() != HostState::NotStarted) {
        throw ToolHostError(std::string("cannot start host in state ") +
                            host_state_name(state_.load()));
    }
    ignore_sigpipe();

    state_ = HostState::Starting;
    try {
        spawn();
    } catch (const SpawnError&) {
        state_ = HostState::Stopped;
        throw;
    }

    std::this_thread::sleep_for(options_.settle_delay);

    state_ = HostState::Initializing;
    try {
        handshake();
    } catch (const HandshakeError&) {
        throw;
    } catch (const std::exception& e) {
        fail_handshake(std::string("invalid initialize reply: ") + e.what());
    }
    state_ = HostState::Ready;
}

void ToolHost::spawn() {
    if (options_.command.empty()) {
        throw SpawnError("no server command configured");
    }

    // argv is built before fork: only async-signal-safe calls in the child
    std::vector<const char*> argv;
    argv.push_back(options_.command.c_str());
    for (const auto& a : options_.args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};
    auto close_all = [&] {
        for (int* p : {in_pipe, out_pipe, err_pipe, status_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
    };

    if (pipe2(in_pipe, O_CLOEXEC) != 0 || pipe2(out_pipe, O_CLOEXEC) != 0 ||
        (options_.forward_stderr && pipe2(err_pipe, O_CLOEXEC) != 0) ||
        pipe2(status_pipe, O_CLOEXEC) != 0) {
        int err = errno;
        close_all();
        throw SpawnError(std::string("failed to create pipes: ") + std::strerror(err));
    }

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close_all();
        throw SpawnError(std::string("fork failed: ") + std::strerror(err));
    }

    if (pid == 0) {
        // Child: own session so terminal signals reach only the host
        setsid();
        dup2(in_pipe[0], STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        if (err_pipe[1] >= 0) {
            dup2(err_pipe[1], STDERR_FILENO);
        } else {
            int devnull = ::open("/dev/null", O_WRONLY);
            if (devnull >= 0) dup2(devnull, STDERR_FILENO);
        }
        execvp(argv[0], const_cast<char* const*>(argv.data()));
        int err = errno;
        ssize_t ignored = ::write(status_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // Parent
    close_fd(in_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(status_pipe[1]);

    // The status pipe closes on successful exec; an errno arrives otherwise
    int exec_errno = 0;
    ssize_t n;
    do {
        n = ::read(status_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(status_pipe[0]);

    if (n > 0) {
        int status = 0;
        waitpid(pid, &status, 0);
        close_all();
        throw SpawnError("cannot launch " + options_.command + ": " +
                         std::strerror(exec_errno));
    }

    {
        std::lock_guard<std::mutex> lock(pid_mutex_);
        child_pid_ = pid;
    }
    stdin_fd_ = in_pipe[1];
    stdout_fd_ = out_pipe[0];
    stderr_fd_ = err_pipe[0];
    read_buffer_.clear();

    if (stderr_fd_ >= 0) {
        stop_drain_ = false;
        stderr_thread_ = std::thread(&ToolHost::drain_stderr, this);
    }
    std::cerr << "[host] Spawned " << options_.label << " server (pid " << pid << ")\n";
}

void ToolHost::fail_handshake(const std::string& reason) {
    handshake_failed_ = true;
    std::cerr << "[host] Handshake with " << options_.label << " failed: " << reason << "\n";
    terminate_locked();
    throw HandshakeError(reason);
}

void ToolHost::handshake() {
    Request req;
    req.id = ++last_id_;
    req.method = methods::Initialize;
    req.params = {
        {"protocolVersion", options_.protocol_version},
        {"capabilities", {{"tools", json::object()}}},
        {"clientInfo", {{"name", options_.client_name}, {"version", options_.client_version}}}
    };

    if (cancelled_ || !write_line(encode(req))) {
        fail_handshake(cancelled_ ? "cancelled" : "no response");
    }

    std::string line;
    switch (read_line(line)) {
        case ReadStatus::Line:    break;
        case ReadStatus::Eof:     fail_handshake("no response");
        case ReadStatus::Timeout: fail_handshake("timeout");
        case ReadStatus::Woken:   fail_handshake("cancelled");
    }
    if (trim(line).empty()) {
        fail_handshake("no response");
    }

    Response resp;
    try {
        resp = decode_response(line);
    } catch (const ProtocolError& e) {
        fail_handshake(std::string("invalid response: ") + e.what());
    }
    if (resp.id != req.id) {
        fail_handshake("response id " + std::to_string(resp.id) +
                       " does not match request " + std::to_string(req.id));
    }
    if (resp.is_error) {
        fail_handshake("server refused initialize: " + resp.error_message);
    }

    Notification done;
    done.method = methods::Initialized;
    if (!write_line(encode(done))) {
        fail_handshake("server closed its input after initialize");
    }

    std::string server_name = "unknown";
    if (resp.result.is_object() && resp.result.contains("serverInfo")) {
        server_name = string_field(resp.result["serverInfo"], "name", server_name);
    }
    std::cerr << "[host] Connected to " << options_.label << " (" << server_name << ")\n";
}

void ToolHost::shutdown() {
    std::lock_guard<std::mutex> lock(call_mutex_);
    terminate_locked();
}

void ToolHost::cancel() {
    cancelled_ = true;
    std::unique_lock<std::mutex> lock(call_mutex_, std::try_to_lock);
    if (lock.owns_lock()) {
        terminate_locked();
        return;
    }
    // A call is in flight: wake its read and take the child down
    if (wake_write_fd_ >= 0) {
        char b = 1;
        ssize_t ignored = ::write(wake_write_fd_, &b, 1);
        (void)ignored;
    }
    signal_child(SIGKILL);

    // The call may have returned before the kill landed; finish the teardown
    // once it lets go so the host always ends Stopped
    lock.lock();
    terminate_locked();
}

void ToolHost::terminate_locked() {
    HostState s = state_.load();
    if (s == HostState::Stopped) return;
    if (s == HostState::NotStarted) {
        state_ = HostState::Stopped;
        return;
    }
    state_ = HostState::Terminating;

    // EOF on stdin lets a well-behaved server exit by itself
    close_fd(stdin_fd_);
    signal_child(SIGTERM);

    uint64_t deadline = monotonic_ms() +
        static_cast<uint64_t>(options_.shutdown_grace.count());
    bool reaped = reap(false);
    while (!reaped && monotonic_ms() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        reaped = reap(false);
    }
    if (!reaped) {
        std::cerr << "[host] " << options_.label << " ignored SIGTERM, killing\n";
        signal_child(SIGKILL);
        reap(true);
    }

    stop_drain_ = true;
    if (stderr_thread_.joinable()) stderr_thread_.join();
    close_fds();

    state_ = HostState::Stopped;
}

void ToolHost::signal_child(int sig) {
    std::lock_guard<std::mutex> lock(pid_mutex_);
    if (child_pid_ > 0) kill(child_pid_, sig);
}

bool ToolHost::reap(bool block) {
    std::lock_guard<std::mutex> lock(pid_mutex_);
    if (child_pid_ <= 0) return true;
    int status = 0;
    pid_t r;
    do {
        r = waitpid(child_pid_, &status, block ? 0 : WNOHANG);
    } while (r < 0 && errno == EINTR);
    if (r == child_pid_ || (r < 0 && errno == ECHILD)) {
        child_pid_ = -1;
        return true;
    }
    return false;
}

void ToolHost::close_fds() {
    close_fd(stdin_fd_);
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
    read_buffer_.clear();
}

void ToolHost::drain_stderr() {
    std::string pending;
    std::array<char, 4096> buf;
    while (true) {
        struct pollfd pfd{stderr_fd_, POLLIN, 0};
        int ret = poll(&pfd, 1, 100);
        if (ret < 0 && errno != EINTR) break;
        if (ret <= 0) {
            if (stop_drain_) break;
            continue;
        }
        ssize_t n = ::read(stderr_fd_, buf.data(), buf.size());
        if (n <= 0) break;
        pending.append(buf.data(), static_cast<size_t>(n));
        size_t pos;
        while ((pos = pending.find('\n')) != std::string::npos) {
            std::cerr << "[server:" << options_.label << "] " << pending.substr(0, pos) << "\n";
            pending.erase(0, pos + 1);
        }
    }
    if (!pending.empty()) {
        std::cerr << "[server:" << options_.label << "] " << pending << "\n";
    }
}

// ── Line I/O ─────────────────────────────────────────────────────

bool ToolHost::write_line(const std::string& line) {
    if (stdin_fd_ < 0) return false;
    std::string data = line + "\n";
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(stdin_fd_, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

ToolHost::ReadStatus ToolHost::read_line(std::string& out) {
    uint64_t deadline = monotonic_ms() +
        static_cast<uint64_t>(options_.response_timeout.count());
    std::array<char, 4096> buf;

    while (true) {
        size_t pos = read_buffer_.find('\n');
        if (pos != std::string::npos) {
            out = read_buffer_.substr(0, pos);
            read_buffer_.erase(0, pos + 1);
            if (!out.empty() && out.back() == '\r') out.pop_back();
            return ReadStatus::Line;
        }
        if (stdout_fd_ < 0) return ReadStatus::Eof;

        uint64_t now = monotonic_ms();
        if (now >= deadline) return ReadStatus::Timeout;

        struct pollfd pfds[2] = {
            {stdout_fd_, POLLIN, 0},
            {wake_read_fd_, POLLIN, 0}
        };
        nfds_t nfds = wake_read_fd_ >= 0 ? 2 : 1;
        int ret = poll(pfds, nfds, poll_timeout_ms(deadline - now));
        if (ret < 0) {
            if (errno == EINTR) continue;
            return ReadStatus::Eof;
        }
        if (ret == 0) continue; // the deadline check above decides

        if (nfds == 2 && (pfds[1].revents & POLLIN) != 0) {
            char sink[16];
            while (::read(wake_read_fd_, sink, sizeof(sink)) > 0) {}
            if (cancelled_) return ReadStatus::Woken;
        }
        if ((pfds[0].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
            ssize_t n = ::read(stdout_fd_, buf.data(), buf.size());
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) return ReadStatus::Eof;
            read_buffer_.append(buf.data(), static_cast<size_t>(n));
        }
    }
}

// ── Calls ────────────────────────────────────────────────────────

CallResult ToolHost::gate() const {
    if (cancelled_) return CallResult::fail(CallError::Cancelled, "cancelled");
    if (handshake_failed_) {
        return CallResult::fail(CallError::HandshakeFailed, "handshake failed");
    }
    switch (state_.load()) {
        case HostState::Ready:
            return CallResult::ok(nullptr);
        case HostState::NotStarted:
        case HostState::Starting:
        case HostState::Initializing:
            return CallResult::fail(CallError::NotStarted, "host not ready");
        case HostState::Terminating:
        case HostState::Stopped:
            break;
    }
    return CallResult::fail(CallError::Stopped, "host stopped");
}

CallResult ToolHost::exchange(const std::string& method, json params) {
    CallResult ready = gate();
    if (!ready.success) return ready;

    Request req;
    req.id = ++last_id_;
    req.method = method;
    req.params = std::move(params);

    auto fail_channel = [this](CallError error, const std::string& message) {
        std::cerr << "[host] " << options_.label << ": " << message
                  << ", stopping server\n";
        terminate_locked();
        return CallResult::fail(error, message);
    };

    if (!write_line(encode(req))) {
        return cancelled_ ? fail_channel(CallError::Cancelled, "cancelled")
                          : fail_channel(CallError::NoResponse, "no response");
    }

    std::string line;
    switch (read_line(line)) {
        case ReadStatus::Line:
            break;
        case ReadStatus::Eof:
            return cancelled_ ? fail_channel(CallError::Cancelled, "cancelled")
                              : fail_channel(CallError::NoResponse, "no response");
        case ReadStatus::Timeout:
            // A late reply would desynchronize the line framing
            return fail_channel(CallError::Timeout, "timeout");
        case ReadStatus::Woken:
            return fail_channel(CallError::Cancelled, "cancelled");
    }

    Response resp;
    try {
        resp = decode_response(line);
    } catch (const ProtocolError& e) {
        std::cerr << "[host] " << options_.label << ": malformed reply to request "
                  << req.id << ": " << e.what() << "\n";
        return CallResult::fail(CallError::MalformedReply,
                                std::string("malformed reply: ") + e.what());
    }
    if (resp.id != req.id) {
        return fail_channel(CallError::MalformedReply,
                            "reply id " + std::to_string(resp.id) +
                            " does not match request " + std::to_string(req.id));
    }
    if (resp.is_error) {
        return CallResult::fail(CallError::Remote, resp.error_message);
    }
    return CallResult::ok(std::move(resp.result));
}

CallResult ToolHost::call_tool(const std::string& name, const json& arguments) {
    std::lock_guard<std::mutex> lock(call_mutex_);
    return exchange(methods::ToolsCall, {
        {"name", name},
        {"arguments", arguments.is_null() ? json::object() : arguments}
    });
}

std::future<CallResult> ToolHost::call_async(const std::string& name, json arguments) {
    return std::async(std::launch::async,
                      [this, name, args = std::move(arguments)] {
                          return call_tool(name, args);
                      });
}

ListToolsResult ToolHost::list_tools() {
    ListToolsResult out;
    CallResult result;
    {
        std::lock_guard<std::mutex> lock(call_mutex_);
        result = exchange(methods::ToolsList, json::object());
    }
    if (!result.success) {
        out.error = result.message;
        return out;
    }
    if (!result.value.is_object() || !result.value.contains("tools") ||
        !result.value["tools"].is_array()) {
        out.error = "tools/list reply has no tools array";
        return out;
    }
    for (const auto& t : result.value["tools"]) {
        if (!t.is_object()) continue;
        ToolDescriptor d;
        d.name = string_field(t, "name", "");
        d.description = string_field(t, "description", "");
        d.input_schema = t.contains("inputSchema") ? t["inputSchema"]
                                                   : json{{"type", "object"}};
        if (!d.name.empty()) out.tools.push_back(std::move(d));
    }
    out.success = true;
    return out;
}

} // namespace paperscout
