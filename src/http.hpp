#pragma once
#include <string>
#include <vector>
#include <utility>

namespace paperscout {

using Header = std::pair<std::string, std::string>;

struct HttpResponse {
    long status_code = 0; // 0 = transport failure (connect, TLS, parse)
    std::string body;

    bool ok() const { return status_code >= 200 && status_code < 300; }
};

// Abstract HTTP client interface (injectable for testing)
class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual HttpResponse post(const std::string& url,
                              const std::string& body,
                              const std::vector<Header>& headers,
                              long timeout_seconds = 120) = 0;

    virtual HttpResponse get(const std::string& url,
                             const std::vector<Header>& headers,
                             long timeout_seconds = 30) = 0;
};

// POSIX sockets + OpenSSL. One connection per request (Connection: close).
class SocketHttpClient : public HttpClient {
public:
    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      long timeout_seconds = 120) override;

    HttpResponse get(const std::string& url,
                     const std::vector<Header>& headers,
                     long timeout_seconds = 30) override;
};

// Percent-encode a URL path segment (RFC 3986 unreserved chars pass through)
std::string url_encode(const std::string& segment);

} // namespace paperscout
