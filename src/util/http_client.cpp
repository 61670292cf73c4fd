#include "bm/util/http_client.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include <curl/curl.h>

namespace bm::util {

struct HttpClient::Impl {
    CURL* curl = nullptr;

    Impl() {
        curl = curl_easy_init();
        if (!curl) {
            throw std::runtime_error("Failed to initialize CURL");
        }
    }

    ~Impl() {
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }
};

static size_t WriteCallback(void* contents, size_t size, size_t nmemb, std::string* response) {
    size_t total_size = size * nmemb;
    response->append(static_cast<char*>(contents), total_size);
    return total_size;
}

HttpClient::HttpClient() : pImpl(std::make_unique<Impl>()) {
}

HttpClient::~HttpClient() = default;

Result<HttpResponse> HttpClient::get(const std::string& url, std::chrono::seconds timeout) {
    if (!pImpl->curl) {
        return std::unexpected(makeError(ErrorCode::kNetworkError, "CURL not initialized"));
    }

    std::string response_body;
    long response_code = 0;

    curl_easy_reset(pImpl->curl);

    curl_easy_setopt(pImpl->curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(pImpl->curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(pImpl->curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(pImpl->curl, CURLOPT_MAXREDIRS, 5L);

    // Set callback for response body
    curl_easy_setopt(pImpl->curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(pImpl->curl, CURLOPT_WRITEDATA, &response_body);

    curl_easy_setopt(pImpl->curl, CURLOPT_TIMEOUT, static_cast<long>(timeout.count()));
    curl_easy_setopt(pImpl->curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(pImpl->curl);
    if (res != CURLE_OK) {
        return std::unexpected(makeError(ErrorCode::kNetworkError,
                                       "HTTP request failed: " + std::string(curl_easy_strerror(res))));
    }

    curl_easy_getinfo(pImpl->curl, CURLINFO_RESPONSE_CODE, &response_code);

    char* content_type = nullptr;
    curl_easy_getinfo(pImpl->curl, CURLINFO_CONTENT_TYPE, &content_type);

    HttpResponse response;
    response.status_code = static_cast<int>(response_code);
    response.content_type = content_type ? content_type : "";
    response.body = std::move(response_body);

    return response;
}

std::string charsetOf(const std::string& content_type) {
    std::string lowered = content_type;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto pos = lowered.find("charset=");
    if (pos == std::string::npos) {
        return "utf-8";
    }

    auto value = lowered.substr(pos + 8);
    auto end = value.find_first_of("; ");
    if (end != std::string::npos) {
        value = value.substr(0, end);
    }
    value.erase(std::remove(value.begin(), value.end(), '"'), value.end());
    return value.empty() ? "utf-8" : value;
}

} // namespace bm::util
