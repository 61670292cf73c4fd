#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "bm/common.hpp"

namespace bm::util {

struct HttpResponse {
    int status_code = 0;
    std::string content_type;
    std::string body;

    bool ok() const { return status_code >= 200 && status_code < 300; }
};

// Fetch capability handed to the store; tests substitute their own
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual Result<HttpResponse> get(const std::string& url,
                                     std::chrono::seconds timeout) = 0;
};

class HttpClient : public HttpTransport {
public:
    HttpClient();
    ~HttpClient() override;

    // Non-copyable
    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    // Movable
    HttpClient(HttpClient&&) = default;
    HttpClient& operator=(HttpClient&&) = default;

    Result<HttpResponse> get(const std::string& url,
                             std::chrono::seconds timeout) override;

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

// Charset declared in a Content-Type header, "utf-8" when none is given
std::string charsetOf(const std::string& content_type);

} // namespace bm::util
