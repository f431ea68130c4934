#pragma once

#include <map>
#include <string>

#include <nlohmann/json.hpp>

#include "common/Types.h"

namespace orderguard {
namespace network {

struct HttpResponse {
    int status_code = 0;
    std::string body;
    std::map<std::string, std::string> headers;

    bool isSuccess() const { return status_code >= 200 && status_code < 300; }
    bool isRateLimited() const { return status_code == 429; }
    bool isNotFound() const { return status_code == 404; }
    bool isServerError() const { return status_code >= 500; }
    bool isRetryable() const { return isRateLimited() || isServerError(); }

    // Throws nlohmann::json::parse_error on a malformed body.
    nlohmann::json json() const {
        return nlohmann::json::parse(body);
    }
};

class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    // Transport failures throw TransientIoError; HTTP errors come back as a response.
    virtual HttpResponse get(
        const std::string& endpoint,
        const std::map<std::string, std::string>& query_params,
        Duration timeout
    ) = 0;

    virtual HttpResponse post(
        const std::string& endpoint,
        const nlohmann::json& body,
        Duration timeout
    ) = 0;
};

} // namespace network
} // namespace orderguard
