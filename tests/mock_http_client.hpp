#pragma once
#include "http.hpp"
#include <string>
#include <vector>

namespace paperscout {

class MockHttpClient : public HttpClient {
public:
    HttpResponse next_response;
    std::vector<HttpResponse> response_queue;
    std::string last_method;
    std::string last_url;
    std::string last_body;
    std::vector<Header> last_headers;
    long last_timeout = 0;
    int call_count = 0;

    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      long timeout_seconds) override {
        last_method = "POST";
        last_body = body;
        return record(url, headers, timeout_seconds);
    }

    HttpResponse get(const std::string& url,
                     const std::vector<Header>& headers,
                     long timeout_seconds) override {
        last_method = "GET";
        last_body.clear();
        return record(url, headers, timeout_seconds);
    }

private:
    HttpResponse record(const std::string& url, const std::vector<Header>& headers,
                        long timeout_seconds) {
        call_count++;
        last_url = url;
        last_headers = headers;
        last_timeout = timeout_seconds;
        if (!response_queue.empty()) {
            auto resp = response_queue.front();
            response_queue.erase(response_queue.begin());
            return resp;
        }
        return next_response;
    }
};

} // namespace paperscout
