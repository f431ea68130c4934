#include "core/adapters/HttpSafetyStateSource.h"

#include "common/Errors.h"

namespace orderguard {
namespace core {

HttpSafetyStateSource::HttpSafetyStateSource(std::shared_ptr<network::IHttpClient> http_client)
    : http_client_(std::move(http_client)) {
    if (!http_client_) {
        throw InvariantViolation("HttpSafetyStateSource requires an HTTP client");
    }
}

std::optional<std::string> HttpSafetyStateSource::fetch(const std::string& key, Duration timeout) {
    const auto response = http_client_->get("/api/v1/safety/" + key, {}, timeout);
    if (response.isNotFound()) {
        return std::nullopt;
    }
    if (!response.isSuccess()) {
        throw TransientIoError("safety state " + key + ": HTTP " + std::to_string(response.status_code));
    }
    return response.body;
}

} // namespace core
} // namespace orderguard
