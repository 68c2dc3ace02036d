#ifndef REDISKIT_NET_SOCKET_HPP
#define REDISKIT_NET_SOCKET_HPP

#include <cstddef>
#include <string_view>
#include <utility>

#include "rediskit/core/node_address.hpp"
#include "rediskit/util/types.hpp"

namespace rediskit::net {

/*
    blocking TCP stream owning one file descriptor.
    one thread writes, another reads: send and receive may run concurrently, shutdown() may be
    called from any thread to unblock a pending receive.
*/
class Socket {
   public:
    Socket() = default;
    ~Socket();

    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;
    Socket(Socket&& other) noexcept;
    Socket& operator=(Socket&& other) noexcept;

    // throws ConnectionException
    static Socket connect(const core::NodeAddress& address, util::Duration timeout);

    // throws ConnectionException
    void send_all(std::string_view data);

    // bytes read, 0 on orderly close. throws ConnectionException
    std::size_t receive(char* buf, std::size_t len);

    void shutdown() noexcept;
    void close() noexcept;

    [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }
    [[nodiscard]] const core::NodeAddress& address() const noexcept { return address_; }

   private:
    Socket(int fd, core::NodeAddress address) : fd_(fd), address_(std::move(address)) {}

    int fd_ = -1;
    core::NodeAddress address_;
};

}  // namespace rediskit::net

#endif
