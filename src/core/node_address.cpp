#include "rediskit/core/node_address.hpp"

#include <stdexcept>

namespace rediskit::core {

NodeAddress NodeAddress::parse(const std::string& str) {
    auto sep = str.rfind(':');
    if (sep == std::string::npos || sep == 0 || sep + 1 == str.size()) {
        throw std::invalid_argument("invalid node address: " + str);
    }

    NodeAddress address;
    address.host = str.substr(0, sep);

    std::size_t consumed = 0;
    int port = 0;
    try {
        port = std::stoi(str.substr(sep + 1), &consumed);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("invalid port in node address: " + str);
    }
    if (consumed != str.size() - sep - 1 || port <= 0 || port > 65535) {
        throw std::invalid_argument("invalid port in node address: " + str);
    }
    address.port = static_cast<uint16_t>(port);
    return address;
}

}  // namespace rediskit::core
