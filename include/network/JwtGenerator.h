#pragma once

#include <string>

#include "common/Types.h"

namespace orderguard {
namespace network {

class JwtGenerator {
public:
    // HS256 bearer token for the gateway: {sub, nonce, iat, exp}.
    static std::string generate(
        const std::string& api_key,
        const std::string& api_secret,
        Timestamp now = systemNow(),
        std::chrono::seconds lifetime = std::chrono::seconds(60)
    );

    static std::string generateNonce();

    static std::string base64UrlEncode(const std::string& data);
};

} // namespace network
} // namespace orderguard
