#pragma once

#include <memory>

#include "core/contracts/ISafetyStateSource.h"
#include "network/IHttpClient.h"

namespace orderguard {
namespace core {

// GET /api/v1/safety/{key}. 404 means the key has never been written.
class HttpSafetyStateSource : public ISafetyStateSource {
public:
    explicit HttpSafetyStateSource(std::shared_ptr<network::IHttpClient> http_client);

    std::optional<std::string> fetch(const std::string& key, Duration timeout) override;

private:
    std::shared_ptr<network::IHttpClient> http_client_;
};

} // namespace core
} // namespace orderguard
