// policy/ssl.hpp
// TLS client policy (OpenSSL) and the TLS stream built on it
//
//   OpenSSLPolicy: owns SSL_CTX/SSL for one client connection
//     - void init(const TlsConfig&)
//     - void handshake(int fd, const std::string& host)
//     - ssize_t read(void* buf, size_t len)
//     - ssize_t write(const void* buf, size_t len)
//     - int get_fd() const
//     - void shutdown()
//
//   TlsStream<SSLPolicy>: BSDSocket + SSL policy. Satisfies
//     TimeoutCapableStream; deadline and no-delay control unwrap to the raw
//     socket underneath, since the TLS layer has no timeout control itself.
//
// Namespace: wspump::ssl

#pragma once

#include "core/log.hpp"
#include "transport/bsd_socket.hpp"
#include "transport/stream.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>
#include <openssl/x509v3.h>

#include <arpa/inet.h>
#include <errno.h>
#include <chrono>
#include <concepts>
#include <cstdio>
#include <cstring>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace wspump {
namespace ssl {

/**
 * TLS client configuration
 */
struct TlsConfig {
    bool verify_peer;        // Verify certificate chain and host name (default: true)
    std::string ca_file;     // PEM bundle; empty = system default paths

    TlsConfig()
        : verify_peer(true)
    {}
};

inline std::string last_ssl_error() {
    unsigned long err = ERR_get_error();
    if (err == 0) {
        return errno ? strerror(errno) : "unknown error";
    }
    char err_buf[256];
    ERR_error_string_n(err, err_buf, sizeof(err_buf));
    ERR_clear_error();
    return err_buf;
}

inline bool is_ip_literal(const std::string& host) {
    unsigned char buf[sizeof(struct in6_addr)];
    return ::inet_pton(AF_INET, host.c_str(), buf) == 1 ||
           ::inet_pton(AF_INET6, host.c_str(), buf) == 1;
}

// ============================================================================
// OpenSSL Policy
// ============================================================================

/**
 * OpenSSLPolicy - OpenSSL client implementation
 *
 * Works on a blocking socket. A read deadline (SO_RCVTIMEO) set on that
 * socket makes SSL_read fail with SSL_ERROR_WANT_READ, which read() reports
 * as -1/EAGAIN; the call can simply be retried later.
 *
 * Thread safety: Not thread-safe (one connection per instance)
 */
struct OpenSSLPolicy {
    OpenSSLPolicy() : ctx_(nullptr), ssl_(nullptr) {}

    ~OpenSSLPolicy() {
        shutdown();
    }

    // Prevent copying
    OpenSSLPolicy(const OpenSSLPolicy&) = delete;
    OpenSSLPolicy& operator=(const OpenSSLPolicy&) = delete;

    // Allow moving
    OpenSSLPolicy(OpenSSLPolicy&& other) noexcept
        : ctx_(other.ctx_)
        , ssl_(other.ssl_)
        , verify_peer_(other.verify_peer_)
    {
        other.ctx_ = nullptr;
        other.ssl_ = nullptr;
    }

    OpenSSLPolicy& operator=(OpenSSLPolicy&& other) noexcept {
        if (this != &other) {
            shutdown();
            ctx_ = other.ctx_;
            ssl_ = other.ssl_;
            verify_peer_ = other.verify_peer_;
            other.ctx_ = nullptr;
            other.ssl_ = nullptr;
        }
        return *this;
    }

    /**
     * Initialize SSL context
     *
     * @throws std::runtime_error if initialization fails
     */
    void init(const TlsConfig& config = TlsConfig()) {
        const SSL_METHOD* method = TLS_client_method();
        ctx_ = SSL_CTX_new(method);

        if (!ctx_) {
            throw std::runtime_error("SSL_CTX_new() failed: " + last_ssl_error());
        }

        SSL_CTX_set_min_proto_version(ctx_, TLS1_2_VERSION);

        // Retry internally after non-application records (TLS 1.3 tickets)
        SSL_CTX_set_mode(ctx_, SSL_MODE_AUTO_RETRY);

        verify_peer_ = config.verify_peer;
        if (config.verify_peer) {
            SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER, nullptr);
            int ok = config.ca_file.empty()
                ? SSL_CTX_set_default_verify_paths(ctx_)
                : SSL_CTX_load_verify_locations(ctx_, config.ca_file.c_str(), nullptr);
            if (ok != 1) {
                throw std::runtime_error("Failed to load CA certificates: " + last_ssl_error());
            }
        } else {
            SSL_CTX_set_verify(ctx_, SSL_VERIFY_NONE, nullptr);
        }
    }

    /**
     * Perform TLS handshake
     *
     * @param fd Connected socket file descriptor
     * @param host Server name for SNI and certificate host name check
     * @throws std::runtime_error if handshake fails
     */
    void handshake(int fd, const std::string& host) {
        ssl_ = SSL_new(ctx_);
        if (!ssl_) {
            throw std::runtime_error("SSL_new() failed: " + last_ssl_error());
        }

        if (SSL_set_fd(ssl_, fd) != 1) {
            throw std::runtime_error("SSL_set_fd() failed: " + last_ssl_error());
        }

        // SNI is only defined for DNS names
        if (!host.empty() && !is_ip_literal(host)) {
            SSL_set_tlsext_host_name(ssl_, host.c_str());
        }

        if (verify_peer_ && !host.empty()) {
            if (SSL_set1_host(ssl_, host.c_str()) != 1) {
                throw std::runtime_error("SSL_set1_host() failed: " + last_ssl_error());
            }
        }

        // Blocking handshake
        ERR_clear_error();
        int ret = SSL_connect(ssl_);
        if (ret != 1) {
            std::string reason = last_ssl_error();
            long verify = SSL_get_verify_result(ssl_);
            if (verify != X509_V_OK) {
                reason += std::string(" (") + X509_verify_cert_error_string(verify) + ")";
            }
            throw std::runtime_error("SSL_connect() failed: " + reason);
        }

        WSPUMP_LOG_INFO("TLS", "Handshake complete (%s, %s)",
                        SSL_get_version(ssl_), SSL_get_cipher_name(ssl_));
    }

    /**
     * Read decrypted data
     *
     * @return Bytes read, 0 on close_notify, -1 with errno (EAGAIN when the
     *         socket read deadline expired)
     */
    ssize_t read(void* buf, size_t len) {
        if (!ssl_) {
            errno = EBADF;
            return -1;
        }

        ERR_clear_error();
        int n = SSL_read(ssl_, buf, static_cast<int>(len));
        if (n > 0) {
            return n;
        }

        int err = SSL_get_error(ssl_, n);
        switch (err) {
            case SSL_ERROR_ZERO_RETURN:
                return 0;  // Peer sent close_notify
            case SSL_ERROR_WANT_READ:
            case SSL_ERROR_WANT_WRITE:
                errno = EAGAIN;
                return -1;
            case SSL_ERROR_SYSCALL:
                if (errno == 0) {
                    errno = ECONNRESET;  // EOF without close_notify
                }
                ERR_clear_error();
                return -1;
            default:
                ERR_clear_error();
                errno = EPROTO;
                return -1;
        }
    }

    /**
     * Write data (encrypted on the wire)
     *
     * @return Bytes written, -1 with errno on error
     */
    ssize_t write(const void* buf, size_t len) {
        if (!ssl_) {
            errno = EBADF;
            return -1;
        }

        ERR_clear_error();
        int n = SSL_write(ssl_, buf, static_cast<int>(len));
        if (n > 0) {
            return n;
        }

        int err = SSL_get_error(ssl_, n);
        if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
            errno = EAGAIN;
        } else if (err != SSL_ERROR_SYSCALL || errno == 0) {
            errno = EPIPE;
        }
        ERR_clear_error();
        return -1;
    }

    /**
     * Get underlying socket file descriptor
     *
     * @return File descriptor, -1 if not set
     */
    int get_fd() const {
        if (!ssl_) return -1;
        return SSL_get_fd(ssl_);
    }

    /**
     * Send close_notify (best effort) and free resources
     */
    void shutdown() {
        if (ssl_) {
            ERR_clear_error();
            SSL_shutdown(ssl_);
            SSL_free(ssl_);
            ssl_ = nullptr;
        }

        if (ctx_) {
            SSL_CTX_free(ctx_);
            ctx_ = nullptr;
        }

        ERR_clear_error();
    }

    static constexpr const char* name() {
        return "OpenSSL";
    }

    SSL_CTX* ctx_;
    SSL* ssl_;
    bool verify_peer_ = true;
};

using DefaultSSLPolicy = OpenSSLPolicy;

// ============================================================================
// SSL Policy Concept
// ============================================================================

/**
 * SSLPolicyConcept - Defines required interface for SSL policies
 */
template<typename T>
concept SSLPolicyConcept = requires(T ssl, const TlsConfig& cfg, int fd, const std::string& host,
                                    void* buf, size_t len) {
    { ssl.init(cfg) } -> std::same_as<void>;
    { ssl.handshake(fd, host) } -> std::same_as<void>;
    { ssl.read(buf, len) } -> std::convertible_to<ssize_t>;
    { ssl.write(buf, len) } -> std::convertible_to<ssize_t>;
    { ssl.get_fd() } -> std::convertible_to<int>;
    { ssl.shutdown() } -> std::same_as<void>;
};

static_assert(SSLPolicyConcept<OpenSSLPolicy>);

// ============================================================================
// TLS Stream
// ============================================================================

/**
 * TlsStream - TLS-wrapped TCP socket
 *
 * Member order matters: the SSL object is destroyed (close_notify sent)
 * before the socket it runs on is closed.
 */
template<SSLPolicyConcept SSLPolicy = DefaultSSLPolicy>
class TlsStream {
public:
    TlsStream() = default;

    /**
     * Wrap an already-connected socket (handshake not yet done)
     */
    explicit TlsStream(transport::BSDSocket socket) : socket_(std::move(socket)) {}

    TlsStream(const TlsStream&) = delete;
    TlsStream& operator=(const TlsStream&) = delete;
    TlsStream(TlsStream&&) noexcept = default;
    TlsStream& operator=(TlsStream&&) noexcept = default;

    /**
     * TCP connect followed by the TLS handshake
     *
     * @throws std::runtime_error on any failure
     */
    void connect(const std::string& host, uint16_t port,
                 const TlsConfig& tls_config = TlsConfig(),
                 const transport::BSDSocketConfig& socket_config = transport::BSDSocketConfig()) {
        socket_.connect(host, port, socket_config);
        handshake(host, tls_config);
    }

    void handshake(const std::string& host, const TlsConfig& tls_config = TlsConfig()) {
        ssl_.init(tls_config);
        ssl_.handshake(socket_.get_fd(), host);
    }

    ssize_t read(void* buf, size_t len) {
        return ssl_.read(buf, len);
    }

    ssize_t write(const void* buf, size_t len) {
        return ssl_.write(buf, len);
    }

    int set_read_deadline(std::optional<std::chrono::milliseconds> deadline) {
        return socket_.set_read_deadline(deadline);
    }

    int set_nodelay(bool enabled) {
        return socket_.set_nodelay(enabled);
    }

    int get_fd() const {
        return socket_.get_fd();
    }

    transport::BSDSocket& get_socket() { return socket_; }
    const transport::BSDSocket& get_socket() const { return socket_; }

    void close() {
        ssl_.shutdown();
        socket_.close();
    }

private:
    transport::BSDSocket socket_;
    SSLPolicy ssl_;
};

static_assert(transport::TimeoutCapableStream<TlsStream<>>);
static_assert(transport::TimeoutCapableStream<transport::BSDSocket>);

}  // namespace ssl
}  // namespace wspump
