#pragma once

#include <array>
#include <string>
#include <vector>

#include "config_manager.hpp"
#include "gateway_request.hpp"

namespace querygate {

/**
 * Checks the API key carried in the configured request header.
 *
 * Keys are compared as SHA-256 digests in constant time, and every
 * configured key is compared on every call so timing does not reveal
 * which key (if any) matched. When the configured header is
 * "Authorization" the value must start with the scheme prefix
 * (case-insensitive, default "Key ") which is stripped before comparing.
 */
class ApiKeyAuthenticator {
public:
    explicit ApiKeyAuthenticator(const SecurityConfig& config);

    bool authenticate(const GatewayRequest& request) const;
    bool isValidKey(const std::string& credential) const;

    // Credential from the request, empty when absent or malformed
    std::string extractCredential(const GatewayRequest& request) const;

private:
    using Digest = std::array<unsigned char, 32>;

    static Digest sha256(const std::string& input);

    std::string header_name;
    std::string scheme_prefix;
    bool requires_scheme;
    std::vector<Digest> key_digests;
};

} // namespace querygate
