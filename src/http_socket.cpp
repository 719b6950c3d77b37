// HTTP/HTTPS client using POSIX sockets + OpenSSL.
#include "http.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>

#include <sys/socket.h>
#include <sys/time.h>
#include <sys/select.h>
#include <netdb.h>
#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <string>

namespace paperscout {

// ── URL parsing ────────────────────────────────────────────────

struct ParsedUrl {
    bool tls = false;
    std::string host;
    std::string port;
    std::string path; // includes leading / and query string
};

static ParsedUrl parse_url(const std::string& url) {
    ParsedUrl result;
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos)
        throw std::runtime_error("invalid URL: " + url);

    std::string scheme = url.substr(0, scheme_end);
    if (scheme != "http" && scheme != "https")
        throw std::runtime_error("unsupported URL scheme: " + scheme);
    result.tls = (scheme == "https");

    size_t host_start = scheme_end + 3;
    size_t path_start = url.find('/', host_start);
    std::string host_port = (path_start == std::string::npos)
        ? url.substr(host_start)
        : url.substr(host_start, path_start - host_start);

    result.path = (path_start == std::string::npos) ? "/" : url.substr(path_start);

    size_t colon = host_port.rfind(':');
    if (colon != std::string::npos) {
        result.host = host_port.substr(0, colon);
        result.port = host_port.substr(colon + 1);
    } else {
        result.host = host_port;
        result.port = result.tls ? "443" : "80";
    }
    if (result.host.empty())
        throw std::runtime_error("invalid URL: " + url);
    return result;
}

std::string url_encode(const std::string& segment) {
    std::string out;
    out.reserve(segment.size());
    for (unsigned char c : segment) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }
    }
    return out;
}

// ── RAII connection (TCP + optional TLS) ──────────────────────

class Connection {
public:
    Connection() = default;
    ~Connection() {
        if (ssl_) { SSL_shutdown(ssl_); SSL_free(ssl_); }
        if (ctx_) SSL_CTX_free(ctx_);
        if (fd_ >= 0) ::close(fd_);
    }
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    bool open(const ParsedUrl& url, long timeout_secs) {
        if (!connect_tcp(url, timeout_secs)) return false;

        struct timeval tv{timeout_secs, 0};
        setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

        if (!url.tls) return true;

        ctx_ = SSL_CTX_new(TLS_client_method());
        if (!ctx_) return false;
        SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER, nullptr);
        SSL_CTX_set_default_verify_paths(ctx_);
        SSL_CTX_set_min_proto_version(ctx_, TLS1_2_VERSION);

        ssl_ = SSL_new(ctx_);
        if (!ssl_) return false;
        SSL_set_fd(ssl_, fd_);
        SSL_set_tlsext_host_name(ssl_, url.host.c_str()); // SNI
        return SSL_connect(ssl_) == 1;
    }

    // >0 bytes read, 0 on EOF, -1 on error or timeout
    ssize_t read_some(char* buf, size_t len) {
        if (ssl_) {
            int n = SSL_read(ssl_, buf, static_cast<int>(len));
            if (n > 0) return n;
            int err = SSL_get_error(ssl_, n);
            return err == SSL_ERROR_ZERO_RETURN ? 0 : -1;
        }
        while (true) {
            ssize_t n = ::recv(fd_, buf, len, 0);
            if (n < 0 && errno == EINTR) continue;
            return n;
        }
    }

    bool write_all(const char* buf, size_t len) {
        while (len > 0) {
            ssize_t n;
            if (ssl_) {
                n = SSL_write(ssl_, buf, static_cast<int>(len));
                if (n <= 0) return false;
            } else {
                n = ::send(fd_, buf, len, MSG_NOSIGNAL);
                if (n < 0) {
                    if (errno == EINTR) continue;
                    return false;
                }
            }
            buf += n;
            len -= static_cast<size_t>(n);
        }
        return true;
    }

private:
    bool connect_tcp(const ParsedUrl& url, long timeout_secs) {
        struct addrinfo hints{};
        hints.ai_family   = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        struct addrinfo* res = nullptr;
        if (getaddrinfo(url.host.c_str(), url.port.c_str(), &hints, &res) != 0)
            return false;

        bool connected = false;
        for (auto* ai = res; ai && !connected; ai = ai->ai_next) {
            fd_ = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
            if (fd_ < 0) continue;

            // Non-blocking connect so we can honour timeout_secs.
            int flags = fcntl(fd_, F_GETFL, 0);
            fcntl(fd_, F_SETFL, flags | O_NONBLOCK);

            int rc = ::connect(fd_, ai->ai_addr, ai->ai_addrlen);
            if (rc == 0) {
                connected = true;
            } else if (errno == EINPROGRESS) {
                fd_set wset;
                FD_ZERO(&wset);
                FD_SET(fd_, &wset);
                struct timeval tv{timeout_secs, 0};
                if (select(fd_ + 1, nullptr, &wset, nullptr, &tv) > 0) {
                    int err = 0;
                    socklen_t elen = sizeof(err);
                    getsockopt(fd_, SOL_SOCKET, SO_ERROR, &err, &elen);
                    connected = (err == 0);
                }
            }
            if (connected) {
                fcntl(fd_, F_SETFL, flags);
            } else {
                ::close(fd_);
                fd_ = -1;
            }
        }
        freeaddrinfo(res);
        return connected;
    }

    int      fd_  = -1;
    SSL_CTX* ctx_ = nullptr;
    SSL*     ssl_ = nullptr;
};

// ── Request building ───────────────────────────────────────────

static std::string build_request(const std::string& method,
                                 const ParsedUrl& url,
                                 const std::string& body,
                                 const std::vector<Header>& headers) {
    std::string req;
    req.reserve(512 + body.size());
    req += method + " " + url.path + " HTTP/1.1\r\n";
    req += "Host: " + url.host + "\r\n";
    for (const auto& h : headers) {
        req += h.first + ": " + h.second + "\r\n";
    }
    if (method == "POST")
        req += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    req += "Connection: close\r\n\r\n";
    req += body;
    return req;
}

// ── Response parsing ───────────────────────────────────────────

// Buffered reader over a Connection
class ResponseReader {
public:
    explicit ResponseReader(Connection& conn) : conn_(conn) {}

    // CRLF-terminated line without the terminator; false on EOF/error
    bool line(std::string& out) {
        while (true) {
            size_t pos = buf_.find('\n');
            if (pos != std::string::npos) {
                out = buf_.substr(0, pos);
                buf_.erase(0, pos + 1);
                if (!out.empty() && out.back() == '\r') out.pop_back();
                return true;
            }
            if (!fill()) return false;
        }
    }

    bool exactly(size_t n, std::string& out) {
        while (buf_.size() < n) {
            if (!fill()) return false;
        }
        out.append(buf_, 0, n);
        buf_.erase(0, n);
        return true;
    }

    void rest(std::string& out) {
        while (fill()) {}
        out += buf_;
        buf_.clear();
    }

private:
    bool fill() {
        char chunk[4096];
        ssize_t n = conn_.read_some(chunk, sizeof(chunk));
        if (n <= 0) return false;
        buf_.append(chunk, static_cast<size_t>(n));
        return true;
    }

    Connection& conn_;
    std::string buf_;
};

static std::string lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

static HttpResponse read_response(Connection& conn) {
    ResponseReader reader(conn);

    // "HTTP/1.1 200 OK": extract the three-digit code
    std::string status_line;
    if (!reader.line(status_line)) return {};
    size_t sp1 = status_line.find(' ');
    if (sp1 == std::string::npos) return {};
    long status = std::strtol(status_line.c_str() + sp1 + 1, nullptr, 10);
    if (status <= 0) return {};

    bool is_chunked = false;
    bool has_length = false;
    size_t content_length = 0;
    std::string line;
    while (reader.line(line) && !line.empty()) {
        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;
        std::string name  = lower(line.substr(0, colon));
        std::string value = lower(line.substr(colon + 1));
        value.erase(0, value.find_first_not_of(" \t"));

        if (name == "transfer-encoding") {
            is_chunked = value.find("chunked") != std::string::npos;
        } else if (name == "content-length") {
            content_length = std::strtoul(value.c_str(), nullptr, 10);
            has_length = true;
        }
    }

    HttpResponse resp;
    resp.status_code = status;
    if (is_chunked) {
        std::string size_line;
        while (reader.line(size_line)) {
            // Chunk size is hex, may have extensions after ';'
            size_t chunk_size = std::strtoul(size_line.c_str(), nullptr, 16);
            if (chunk_size == 0) break;
            if (!reader.exactly(chunk_size, resp.body)) break;
            std::string crlf;
            if (!reader.exactly(2, crlf)) break;
        }
    } else if (has_length) {
        reader.exactly(content_length, resp.body);
    } else {
        reader.rest(resp.body);
    }
    return resp;
}

static HttpResponse do_request(const std::string& method,
                               const std::string& url_str,
                               const std::string& body,
                               const std::vector<Header>& headers,
                               long timeout_secs) {
    ParsedUrl url;
    try {
        url = parse_url(url_str);
    } catch (const std::runtime_error&) {
        return {};
    }

    Connection conn;
    if (!conn.open(url, timeout_secs)) return {};

    std::string request = build_request(method, url, body, headers);
    if (!conn.write_all(request.c_str(), request.size())) return {};

    return read_response(conn);
}

// ── Public API ─────────────────────────────────────────────────

HttpResponse SocketHttpClient::post(const std::string& url,
                                    const std::string& body,
                                    const std::vector<Header>& headers,
                                    long timeout_seconds) {
    return do_request("POST", url, body, headers, timeout_seconds);
}

HttpResponse SocketHttpClient::get(const std::string& url,
                                   const std::vector<Header>& headers,
                                   long timeout_seconds) {
    return do_request("GET", url, "", headers, timeout_seconds);
}

} // namespace paperscout
