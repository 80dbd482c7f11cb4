#include "api_key_authenticator.hpp"
#include "string_utils.hpp"

#include <crow/logging.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <stdexcept>

namespace querygate {

ApiKeyAuthenticator::ApiKeyAuthenticator(const SecurityConfig& config)
    : header_name(config.api_key_header),
      scheme_prefix(config.scheme_prefix),
      requires_scheme(toLowerString(config.api_key_header) == "authorization")
{
    for (const auto& key : config.api_keys) {
        if (key.empty()) {
            CROW_LOG_WARNING << "Ignoring empty API key in configuration";
            continue;
        }
        key_digests.push_back(sha256(key));
    }
}

bool ApiKeyAuthenticator::authenticate(const GatewayRequest& request) const {
    auto credential = extractCredential(request);
    if (credential.empty()) {
        CROW_LOG_DEBUG << "No credential in header " << header_name;
        return false;
    }
    return isValidKey(credential);
}

bool ApiKeyAuthenticator::isValidKey(const std::string& credential) const {
    if (credential.empty()) {
        return false;
    }

    const Digest presented = sha256(credential);
    int matched = 0;
    for (const auto& digest : key_digests) {
        matched |= CRYPTO_memcmp(presented.data(), digest.data(), digest.size()) == 0 ? 1 : 0;
    }
    return matched != 0;
}

std::string ApiKeyAuthenticator::extractCredential(const GatewayRequest& request) const {
    std::string value = trimString(request.getHeader(header_name));
    if (value.empty() || !requires_scheme) {
        return value;
    }

    if (!startsWithIgnoreCase(value, scheme_prefix)) {
        CROW_LOG_DEBUG << "Authorization header without expected scheme prefix";
        return "";
    }
    return trimString(value.substr(scheme_prefix.size()));
}

ApiKeyAuthenticator::Digest ApiKeyAuthenticator::sha256(const std::string& input) {
    Digest digest{};
    unsigned int length = 0;

    EVP_MD_CTX* mdctx = EVP_MD_CTX_new();
    if (!mdctx) {
        throw std::runtime_error("Failed to create EVP_MD_CTX");
    }
    bool ok = EVP_DigestInit_ex(mdctx, EVP_sha256(), nullptr) == 1 &&
              EVP_DigestUpdate(mdctx, input.data(), input.size()) == 1 &&
              EVP_DigestFinal_ex(mdctx, digest.data(), &length) == 1;
    EVP_MD_CTX_free(mdctx);

    if (!ok || length != digest.size()) {
        throw std::runtime_error("SHA-256 digest failed");
    }
    return digest;
}

} // namespace querygate
