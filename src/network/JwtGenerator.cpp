#include "network/JwtGenerator.h"

#include <algorithm>

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <nlohmann/json.hpp>
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace orderguard {
namespace network {

std::string JwtGenerator::base64UrlEncode(const std::string& data) {
    BIO* b64 = BIO_new(BIO_f_base64());
    BIO* bio = BIO_new(BIO_s_mem());
    bio = BIO_push(b64, bio);

    BIO_set_flags(bio, BIO_FLAGS_BASE64_NO_NL);
    BIO_write(bio, data.data(), static_cast<int>(data.size()));
    (void)BIO_flush(bio);

    BUF_MEM* buffer_ptr = nullptr;
    BIO_get_mem_ptr(bio, &buffer_ptr);
    std::string result(buffer_ptr->data, buffer_ptr->length);
    BIO_free_all(bio);

    std::replace(result.begin(), result.end(), '+', '-');
    std::replace(result.begin(), result.end(), '/', '_');
    result.erase(std::remove(result.begin(), result.end(), '='), result.end());
    return result;
}

std::string JwtGenerator::generate(
    const std::string& api_key,
    const std::string& api_secret,
    Timestamp now,
    std::chrono::seconds lifetime
) {
    const nlohmann::json header = {{"alg", "HS256"}, {"typ", "JWT"}};
    const auto issued_at = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();

    nlohmann::json payload;
    payload["sub"] = api_key;
    payload["nonce"] = generateNonce();
    payload["iat"] = issued_at;
    payload["exp"] = issued_at + lifetime.count();

    const std::string message = base64UrlEncode(header.dump()) + "." + base64UrlEncode(payload.dump());

    unsigned char signature[EVP_MAX_MD_SIZE];
    unsigned int signature_len = 0;
    HMAC(EVP_sha256(),
         api_secret.data(), static_cast<int>(api_secret.size()),
         reinterpret_cast<const unsigned char*>(message.data()), message.size(),
         signature, &signature_len);

    return message + "." + base64UrlEncode(std::string(reinterpret_cast<char*>(signature), signature_len));
}

std::string JwtGenerator::generateNonce() {
    thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

} // namespace network
} // namespace orderguard
