#include "rediskit/net/socket.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <string>

#include "rediskit/core/errors.hpp"

namespace rediskit::net {

namespace {

std::string errno_string() {
    return std::string(strerror(errno));
}

}  // namespace

Socket::~Socket() {
    close();
}

Socket::Socket(Socket&& other) noexcept : fd_(other.fd_), address_(std::move(other.address_)) {
    other.fd_ = -1;
}

Socket& Socket::operator=(Socket&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        address_ = std::move(other.address_);
        other.fd_ = -1;
    }
    return *this;
}

Socket Socket::connect(const core::NodeAddress& address, util::Duration timeout) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* result = nullptr;
    std::string port = std::to_string(address.port);
    int rc = getaddrinfo(address.host.c_str(), port.c_str(), &hints, &result);
    if (rc != 0) {
        throw core::ConnectionException(address, std::string("cannot resolve host: ") +
                                                      gai_strerror(rc));
    }

    std::string last_error = "no usable address";
    for (addrinfo* ai = result; ai != nullptr; ai = ai->ai_next) {
        int fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            last_error = errno_string();
            continue;
        }

        // on linux SO_SNDTIMEO also bounds connect(). no receive timeout: the reader blocks
        // until data arrives or the socket is shut down
        if (timeout.count() > 0) {
            struct timeval tv;
            tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
            tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
            setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
        }

        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) < 0) {
            last_error = errno_string();
            ::close(fd);
            continue;
        }

        // pipelined small writes must not wait for Nagle
        int opt = 1;
        setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt));

        freeaddrinfo(result);
        return Socket(fd, address);
    }

    freeaddrinfo(result);
    throw core::ConnectionException(address, last_error);
}

void Socket::send_all(std::string_view data) {
    if (fd_ < 0) {
        throw core::ConnectionException(address_, "socket is closed");
    }
    std::size_t total_sent = 0;
    while (total_sent < data.size()) {
        // MSG_NOSIGNAL: a peer that went away gives EPIPE instead of killing the process
        ssize_t sent = ::send(fd_, data.data() + total_sent, data.size() - total_sent, MSG_NOSIGNAL);
        if (sent < 0 && errno == EINTR) {
            continue;
        }
        if (sent <= 0) {
            throw core::ConnectionException(address_, "write failed: " + errno_string());
        }
        total_sent += static_cast<std::size_t>(sent);
    }
}

std::size_t Socket::receive(char* buf, std::size_t len) {
    while (true) {
        ssize_t n = ::recv(fd_, buf, len, 0);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0) {
            throw core::ConnectionException(address_, "read failed: " + errno_string());
        }
        return static_cast<std::size_t>(n);
    }
}

void Socket::shutdown() noexcept {
    if (fd_ >= 0) {
        ::shutdown(fd_, SHUT_RDWR);
    }
}

void Socket::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

}  // namespace rediskit::net
