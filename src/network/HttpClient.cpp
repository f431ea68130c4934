#include "network/HttpClient.h"

#include <algorithm>
#include <cctype>
#include <set>
#include <sstream>

#include "common/Errors.h"
#include "common/Logger.h"
#include "network/JwtGenerator.h"

namespace orderguard {
namespace network {

namespace {
bool isSensitiveKey(const std::string& key) {
    static const std::set<std::string> kKeys = {
        "api_key", "api_secret", "authorization", "bearer", "token", "signature"
    };
    std::string lower = key;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return kKeys.find(lower) != kKeys.end();
}

void maskSensitiveJson(nlohmann::json& node) {
    if (node.is_object()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            if (isSensitiveKey(it.key())) {
                it.value() = "***";
            } else {
                maskSensitiveJson(it.value());
            }
        }
        return;
    }
    if (node.is_array()) {
        for (auto& item : node) {
            maskSensitiveJson(item);
        }
    }
}

std::string sanitizeForLog(const std::string& text) {
    auto j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        return text.substr(0, 256);
    }
    maskSensitiveJson(j);
    return j.dump();
}
}

HttpClient::HttpClient(std::string base_url, std::string api_key, std::string api_secret)
    : base_url_(std::move(base_url))
    , api_key_(std::move(api_key))
    , api_secret_(std::move(api_secret))
{
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
    curl_ = curl_easy_init();
    if (!curl_) {
        throw std::runtime_error("Failed to initialize CURL");
    }
}

HttpClient::~HttpClient() {
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
}

void HttpClient::globalInit() {
    curl_global_init(CURL_GLOBAL_ALL);
}

void HttpClient::globalCleanup() {
    curl_global_cleanup();
}

std::map<std::string, std::string> HttpClient::authHeaders() const {
    std::map<std::string, std::string> headers;
    headers["Content-Type"] = "application/json";
    headers["Accept"] = "application/json";
    if (!api_key_.empty() && !api_secret_.empty()) {
        headers["Authorization"] = "Bearer " + JwtGenerator::generate(api_key_, api_secret_);
    }
    return headers;
}

HttpResponse HttpClient::get(
    const std::string& endpoint,
    const std::map<std::string, std::string>& query_params,
    Duration timeout
) {
    std::string url = base_url_ + endpoint;
    if (!query_params.empty()) {
        url += "?" + buildQueryString(query_params);
    }
    return performRequest("GET", url, "", authHeaders(), timeout);
}

HttpResponse HttpClient::post(
    const std::string& endpoint,
    const nlohmann::json& body,
    Duration timeout
) {
    auto response = performRequest("POST", base_url_ + endpoint, body.dump(), authHeaders(), timeout);
    if (!response.isSuccess()) {
        LOG_WARN("POST {} -> {} {}", endpoint, response.status_code, sanitizeForLog(response.body));
    }
    return response;
}

HttpResponse HttpClient::performRequest(
    const std::string& method,
    const std::string& url,
    const std::string& body_data,
    const std::map<std::string, std::string>& headers,
    Duration timeout
) {
    std::lock_guard<std::mutex> lock(mutex_);

    HttpResponse response;
    std::string response_body;
    std::map<std::string, std::string> response_headers;

    curl_easy_reset(curl_);
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl_, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl_, CURLOPT_HEADERDATA, &response_headers);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, static_cast<long>(std::max<Duration::rep>(1, timeout.count())));
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);

    if (method == "POST") {
        curl_easy_setopt(curl_, CURLOPT_POST, 1L);
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, body_data.c_str());
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(body_data.size()));
    }

    struct curl_slist* header_list = nullptr;
    for (const auto& [key, value] : headers) {
        std::string header_line = key + ": " + value;
        header_list = curl_slist_append(header_list, header_line.c_str());
    }
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, header_list);

    CURLcode res = curl_easy_perform(curl_);
    curl_slist_free_all(header_list);

    if (res != CURLE_OK) {
        throw TransientIoError(method + " " + url + ": " + curl_easy_strerror(res));
    }

    long http_code = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &http_code);

    response.status_code = static_cast<int>(http_code);
    response.body = std::move(response_body);
    response.headers = std::move(response_headers);
    return response;
}

size_t HttpClient::writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total_size = size * nmemb;
    std::string* response_body = static_cast<std::string*>(userp);
    response_body->append(static_cast<char*>(contents), total_size);
    return total_size;
}

size_t HttpClient::headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    size_t total_size = size * nitems;
    std::string header_line(buffer, total_size);

    size_t colon_pos = header_line.find(':');
    if (colon_pos != std::string::npos) {
        std::string key = header_line.substr(0, colon_pos);
        std::string value = header_line.substr(colon_pos + 1);
        value.erase(0, value.find_first_not_of(" \t\r\n"));
        value.erase(value.find_last_not_of(" \t\r\n") + 1);

        auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
        (*headers)[key] = value;
    }
    return total_size;
}

std::string HttpClient::buildQueryString(const std::map<std::string, std::string>& params) {
    std::ostringstream oss;
    bool first = true;
    for (const auto& [key, value] : params) {
        if (!first) oss << "&";
        oss << key << "=" << value;
        first = false;
    }
    return oss.str();
}

} // namespace network
} // namespace orderguard
