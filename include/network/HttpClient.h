#pragma once

#include <map>
#include <mutex>
#include <string>

#include <curl/curl.h>

#include "network/IHttpClient.h"

namespace orderguard {
namespace network {

// libcurl client for the gateway REST API. One easy handle, requests serialized.
class HttpClient : public IHttpClient {
public:
    HttpClient(std::string base_url, std::string api_key, std::string api_secret);
    ~HttpClient() override;

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    // Call once per process before/after any HttpClient exists.
    static void globalInit();
    static void globalCleanup();

    HttpResponse get(
        const std::string& endpoint,
        const std::map<std::string, std::string>& query_params,
        Duration timeout
    ) override;

    HttpResponse post(
        const std::string& endpoint,
        const nlohmann::json& body,
        Duration timeout
    ) override;

private:
    HttpResponse performRequest(
        const std::string& method,
        const std::string& url,
        const std::string& body_data,
        const std::map<std::string, std::string>& headers,
        Duration timeout
    );

    std::map<std::string, std::string> authHeaders() const;
    std::string buildQueryString(const std::map<std::string, std::string>& params);

    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);
    static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata);

    std::string base_url_;
    std::string api_key_;
    std::string api_secret_;
    CURL* curl_;
    std::mutex mutex_;
};

} // namespace network
} // namespace orderguard
