// src/transport/bsd_socket.hpp
// BSD Socket - plain TCP stream over the kernel stack
//
// Policy-based design: No inheritance, no virtual functions.
// Satisfies TimeoutCapableStream (transport/stream.hpp), so it can carry a
// WebSocket connection directly or sit underneath a TLS stream.

#pragma once

#include "core/log.hpp"

#include <cstddef>
#include <sys/types.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <errno.h>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <optional>
#include <string>
#include <stdexcept>

namespace wspump {
namespace transport {

/**
 * BSD Socket Configuration (optional)
 */
struct BSDSocketConfig {
    bool tcp_nodelay;          // Disable Nagle's algorithm right after connect (default: false)
    int connect_timeout_ms;    // Non-blocking connect timeout (default: 5000)

    BSDSocketConfig()
        : tcp_nodelay(false)
        , connect_timeout_ms(5000)
    {}
};

/**
 * BSDSocket - TCP stream using standard BSD sockets
 *
 * Owns its file descriptor (closed on destruction). Move-only.
 *
 * Stream Interface:
 *   ssize_t read(void* buf, size_t len)         -1/EAGAIN on read deadline expiry
 *   ssize_t write(const void* buf, size_t len)
 *   int set_read_deadline(optional<ms>)         0 or errno
 *   int set_nodelay(bool)                       0 or errno
 *   int get_fd() const
 */
class BSDSocket {
public:
    BSDSocket() : fd_(-1) {}

    /**
     * Adopt an already-connected descriptor (e.g. from accept())
     */
    explicit BSDSocket(int fd) : fd_(fd) {}

    ~BSDSocket() {
        close();
    }

    BSDSocket(const BSDSocket&) = delete;
    BSDSocket& operator=(const BSDSocket&) = delete;

    BSDSocket(BSDSocket&& other) noexcept : fd_(other.fd_) {
        other.fd_ = -1;
    }

    BSDSocket& operator=(BSDSocket&& other) noexcept {
        if (this != &other) {
            close();
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }

    /**
     * Connect to host:port, trying every resolved address in order
     *
     * @throws std::runtime_error on resolution, timeout or connect failure
     */
    void connect(const std::string& host, uint16_t port,
                 const BSDSocketConfig& config = BSDSocketConfig()) {
        if (fd_ >= 0) {
            throw std::runtime_error("Already connected");
        }

        struct addrinfo hints = {};
        struct addrinfo* result = nullptr;
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        std::string port_str = std::to_string(port);
        int ret = ::getaddrinfo(host.c_str(), port_str.c_str(), &hints, &result);
        if (ret != 0) {
            throw std::runtime_error(std::string("getaddrinfo() failed: ") + gai_strerror(ret));
        }
        if (!result) {
            throw std::runtime_error("getaddrinfo() returned no addresses");
        }

        std::string last_error = "no usable address";
        for (struct addrinfo* ai = result; ai; ai = ai->ai_next) {
            int fd = try_connect(ai, config.connect_timeout_ms, last_error);
            if (fd >= 0) {
                fd_ = fd;
                break;
            }
        }
        ::freeaddrinfo(result);

        if (fd_ < 0) {
            throw std::runtime_error("connect(" + host + ":" + port_str + ") failed: " + last_error);
        }

        if (config.tcp_nodelay) {
            int err = set_nodelay(true);
            if (err != 0) {
                WSPUMP_LOG_WARN("BSD", "Failed to set TCP_NODELAY: %s", strerror(err));
            }
        }

        WSPUMP_LOG_INFO("BSD", "Connected to %s:%u (fd=%d)", host.c_str(), port, fd_);
    }

    void close() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

    /**
     * Half-close: signal end-of-data to the peer, keep reading
     */
    int shutdown_write() {
        if (fd_ < 0) return EBADF;
        return ::shutdown(fd_, SHUT_WR) == 0 ? 0 : errno;
    }

    bool is_connected() const {
        return fd_ >= 0;
    }

    ssize_t read(void* buf, size_t len) {
        if (fd_ < 0) {
            errno = EBADF;
            return -1;
        }
        ssize_t n;
        do {
            n = ::recv(fd_, buf, len, 0);
        } while (n < 0 && errno == EINTR);
        return n;
    }

    ssize_t write(const void* buf, size_t len) {
        if (fd_ < 0) {
            errno = EBADF;
            return -1;
        }
        ssize_t n;
        do {
            n = ::send(fd_, buf, len, MSG_NOSIGNAL);
        } while (n < 0 && errno == EINTR);
        return n;
    }

    /**
     * Set (or clear, with std::nullopt) the receive timeout (SO_RCVTIMEO)
     *
     * A zero duration is rejected: the kernel would read it as "no timeout".
     *
     * @return 0 on success, errno value on failure
     */
    int set_read_deadline(std::optional<std::chrono::milliseconds> deadline) {
        if (fd_ < 0) return EBADF;

        struct timeval tv = {};
        if (deadline) {
            if (deadline->count() <= 0) {
                return EINVAL;
            }
            tv.tv_sec = static_cast<time_t>(deadline->count() / 1000);
            tv.tv_usec = static_cast<suseconds_t>((deadline->count() % 1000) * 1000);
        }

        if (::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
            return errno;
        }
        return 0;
    }

    /**
     * Current receive timeout, std::nullopt when reads block indefinitely
     */
    std::optional<std::chrono::milliseconds> read_deadline() const {
        struct timeval tv = {};
        socklen_t len = sizeof(tv);
        if (fd_ < 0 || ::getsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, &len) < 0) {
            return std::nullopt;
        }
        if (tv.tv_sec == 0 && tv.tv_usec == 0) {
            return std::nullopt;
        }
        return std::chrono::milliseconds(tv.tv_sec * 1000 + tv.tv_usec / 1000);
    }

    /**
     * Enable/disable TCP_NODELAY (Nagle's algorithm off/on)
     *
     * @return 0 on success, errno value on failure
     */
    int set_nodelay(bool enabled) {
        if (fd_ < 0) return EBADF;
        int flag = enabled ? 1 : 0;
        if (::setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag)) < 0) {
            return errno;
        }
        return 0;
    }

    bool nodelay() const {
        int flag = 0;
        socklen_t len = sizeof(flag);
        if (fd_ < 0 || ::getsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &flag, &len) < 0) {
            return false;
        }
        return flag != 0;
    }

    int get_fd() const {
        return fd_;
    }

    /**
     * Give up ownership of the descriptor
     */
    int release() {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

private:
    static int try_connect(const struct addrinfo* ai, int timeout_ms, std::string& error) {
        int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) {
            error = std::string("socket() failed: ") + strerror(errno);
            return -1;
        }

        // Non-blocking connect so the timeout can be enforced
        int flags = fcntl(fd, F_GETFL, 0);
        if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
            error = "Failed to set non-blocking mode";
            ::close(fd);
            return -1;
        }

        int ret = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
        if (ret < 0 && errno != EINPROGRESS) {
            error = strerror(errno);
            ::close(fd);
            return -1;
        }

        if (ret < 0) {  // EINPROGRESS
            struct pollfd pfd = {};
            pfd.fd = fd;
            pfd.events = POLLOUT;

            do {
                ret = ::poll(&pfd, 1, timeout_ms);
            } while (ret < 0 && errno == EINTR);

            if (ret <= 0) {
                error = (ret == 0) ? "timeout after " + std::to_string(timeout_ms) + " ms"
                                   : std::string("poll() failed: ") + strerror(errno);
                ::close(fd);
                return -1;
            }

            int sock_error = 0;
            socklen_t len = sizeof(sock_error);
            if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &sock_error, &len) < 0) {
                error = "getsockopt(SO_ERROR) failed";
                ::close(fd);
                return -1;
            }
            if (sock_error != 0) {
                error = strerror(sock_error);
                ::close(fd);
                return -1;
            }
        }

        // Restore blocking mode: the pump relies on SO_RCVTIMEO, not O_NONBLOCK
        if (fcntl(fd, F_SETFL, flags) < 0) {
            error = "Failed to restore blocking mode";
            ::close(fd);
            return -1;
        }

        return fd;
    }

    int fd_;
};

}  // namespace transport
}  // namespace wspump
