#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "gateway_request.hpp"

namespace querygate {

/**
 * IP allow-list made of single addresses and CIDR blocks, IPv4 and IPv6.
 *
 * An empty configuration allows everyone. Entries that cannot be parsed are
 * logged and skipped, so a list made only of invalid entries denies everyone.
 */
class NetworkFilter {
public:
    explicit NetworkFilter(const std::vector<std::string>& allowed_networks);

    bool isAllowed(const std::string& address) const;

    // First X-Forwarded-For hop when present, otherwise the peer address
    static std::string clientAddress(const GatewayRequest& request);

    bool allowsAll() const { return allow_all; }
    std::size_t size() const { return networks.size(); }

private:
    struct Network {
        int family;                          // AF_INET or AF_INET6
        std::array<uint8_t, 16> address;
        int prefix_bits;
    };

    static bool parseAddress(const std::string& text, int& family, std::array<uint8_t, 16>& address);
    static bool parseNetwork(const std::string& text, Network& network);
    static bool matches(const Network& network, int family, const std::array<uint8_t, 16>& address);

    std::vector<Network> networks;
    bool allow_all = false;
};

} // namespace querygate
