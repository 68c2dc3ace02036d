#ifndef REDISKIT_CORE_NODE_ADDRESS_HPP
#define REDISKIT_CORE_NODE_ADDRESS_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <tuple>

namespace rediskit::core {

struct NodeAddress {
    std::string host = "127.0.0.1";
    uint16_t port = 6379;

    [[nodiscard]] std::string to_string() const {
        return host + ":" + std::to_string(port);
    }

    // "host:port"; throws std::invalid_argument when the port is missing or malformed
    static NodeAddress parse(const std::string& str);

    bool operator==(const NodeAddress& other) const {
        return host == other.host && port == other.port;
    }
    bool operator!=(const NodeAddress& other) const { return !(*this == other); }
    bool operator<(const NodeAddress& other) const {
        return std::tie(host, port) < std::tie(other.host, other.port);
    }
};

struct NodeAddressHash {
    std::size_t operator()(const NodeAddress& address) const noexcept {
        return std::hash<std::string>()(address.host) * 31 + address.port;
    }
};

}  // namespace rediskit::core

#endif
