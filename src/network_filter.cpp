#include "network_filter.hpp"
#include "string_utils.hpp"

#include <arpa/inet.h>
#include <crow/logging.h>

namespace querygate {

NetworkFilter::NetworkFilter(const std::vector<std::string>& allowed_networks) {
    allow_all = allowed_networks.empty();

    for (const auto& entry : allowed_networks) {
        Network network{};
        if (!parseNetwork(trimString(entry), network)) {
            CROW_LOG_WARNING << "Ignoring invalid allowed-networks entry: '" << entry << "'";
            continue;
        }
        networks.push_back(network);
    }

    if (!allow_all && networks.empty()) {
        CROW_LOG_WARNING << "No valid allowed-networks entries, every client will be denied";
    }
}

bool NetworkFilter::isAllowed(const std::string& address) const {
    if (allow_all) {
        return true;
    }

    int family = 0;
    std::array<uint8_t, 16> parsed{};
    if (!parseAddress(trimString(address), family, parsed)) {
        CROW_LOG_DEBUG << "Unparseable client address: '" << address << "'";
        return false;
    }

    for (const auto& network : networks) {
        if (matches(network, family, parsed)) {
            return true;
        }
    }
    return false;
}

std::string NetworkFilter::clientAddress(const GatewayRequest& request) {
    auto forwarded = request.getHeader("X-Forwarded-For");
    if (!forwarded.empty()) {
        auto hop = trimString(forwarded.substr(0, forwarded.find(',')));
        if (!hop.empty()) {
            return hop;
        }
    }
    return request.remote_address;
}

bool NetworkFilter::parseAddress(const std::string& text, int& family, std::array<uint8_t, 16>& address) {
    address.fill(0);
    if (inet_pton(AF_INET, text.c_str(), address.data()) == 1) {
        family = AF_INET;
        return true;
    }
    if (inet_pton(AF_INET6, text.c_str(), address.data()) == 1) {
        family = AF_INET6;
        return true;
    }
    return false;
}

bool NetworkFilter::parseNetwork(const std::string& text, Network& network) {
    auto slash = text.find('/');
    if (!parseAddress(text.substr(0, slash), network.family, network.address)) {
        return false;
    }

    const int max_bits = network.family == AF_INET ? 32 : 128;
    if (slash == std::string::npos) {
        network.prefix_bits = max_bits;
        return true;
    }

    const std::string bits = text.substr(slash + 1);
    if (bits.empty() || bits.size() > 3 || bits.find_first_not_of("0123456789") != std::string::npos) {
        return false;
    }
    network.prefix_bits = std::stoi(bits);
    return network.prefix_bits <= max_bits;
}

bool NetworkFilter::matches(const Network& network, int family, const std::array<uint8_t, 16>& address) {
    if (network.family != family) {
        return false;
    }

    int remaining = network.prefix_bits;
    for (std::size_t i = 0; remaining > 0; ++i, remaining -= 8) {
        const uint8_t mask = remaining >= 8 ? 0xFF : static_cast<uint8_t>(0xFF << (8 - remaining));
        if ((network.address[i] & mask) != (address[i] & mask)) {
            return false;
        }
    }
    return true;
}

} // namespace querygate
