// src/transport/listener.hpp
// TCP listening socket producing BSDSocket connections

#pragma once

#include "transport/bsd_socket.hpp"

#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <errno.h>
#include <cstdint>
#include <cstring>
#include <string>
#include <stdexcept>

namespace wspump {
namespace transport {

class Listener {
public:
    Listener() : fd_(-1) {}

    ~Listener() {
        close();
    }

    Listener(const Listener&) = delete;
    Listener& operator=(const Listener&) = delete;

    Listener(Listener&& other) noexcept : fd_(other.fd_) {
        other.fd_ = -1;
    }

    Listener& operator=(Listener&& other) noexcept {
        if (this != &other) {
            close();
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }

    /**
     * Bind and listen on an IPv4 address
     *
     * @param bind_addr Dotted address ("0.0.0.0" for all interfaces)
     * @param port Port, 0 for an ephemeral one (see local_port())
     * @throws std::runtime_error on failure
     */
    void listen(const std::string& bind_addr, uint16_t port, int backlog = 128) {
        if (fd_ >= 0) {
            throw std::runtime_error("Listener already open");
        }

        int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (fd < 0) {
            throw std::runtime_error(std::string("socket() failed: ") + strerror(errno));
        }

        int optval = 1;
        if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval)) < 0) {
            WSPUMP_LOG_WARN("LISTEN", "Failed to set SO_REUSEADDR: %s", strerror(errno));
        }

        struct sockaddr_in addr;
        memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        if (::inet_pton(AF_INET, bind_addr.c_str(), &addr.sin_addr) != 1) {
            ::close(fd);
            throw std::runtime_error("Invalid bind address: " + bind_addr);
        }

        if (::bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
            int err = errno;
            ::close(fd);
            throw std::runtime_error(std::string("bind() failed: ") + strerror(err));
        }

        if (::listen(fd, backlog) < 0) {
            int err = errno;
            ::close(fd);
            throw std::runtime_error(std::string("listen() failed: ") + strerror(err));
        }

        fd_ = fd;
        WSPUMP_LOG_INFO("LISTEN", "Listening on %s:%u", bind_addr.c_str(), local_port());
    }

    /**
     * Block until a connection arrives
     *
     * @return Connected socket; an unconnected one if accept() failed
     *         (errno is preserved for the caller)
     */
    BSDSocket accept() {
        int fd;
        do {
            fd = ::accept4(fd_, nullptr, nullptr, SOCK_CLOEXEC);
        } while (fd < 0 && errno == EINTR);
        return BSDSocket(fd);
    }

    uint16_t local_port() const {
        struct sockaddr_in addr;
        socklen_t len = sizeof(addr);
        if (fd_ < 0 || ::getsockname(fd_, reinterpret_cast<struct sockaddr*>(&addr), &len) < 0) {
            return 0;
        }
        return ntohs(addr.sin_port);
    }

    void close() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

    int get_fd() const {
        return fd_;
    }

private:
    int fd_;
};

}  // namespace transport
}  // namespace wspump
