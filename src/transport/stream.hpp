// src/transport/stream.hpp
// Stream concepts shared by the WebSocket connection and the pump
//
//   TimeoutCapableStream: socket-like duplex endpoint whose read deadline and
//     send coalescing can be controlled uniformly, whether it is a plain TCP
//     socket (BSDSocket) or a TLS stream over one (ssl::TlsStream).
//   ByteSource / ByteSink: the two halves of the local duplex byte endpoint.
//
// Implementations:
//   - transport::BSDSocket            (transport/bsd_socket.hpp)
//   - ssl::TlsStream<OpenSSLPolicy>   (policy/ssl.hpp)
//   - transport::FdReader / FdWriter  (transport/fd_stream.hpp)

#pragma once

#include <sys/types.h>
#include <errno.h>
#include <chrono>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace wspump {
namespace transport {

/**
 * TimeoutCapableStream
 *
 *   read(buf, len)          >0 bytes, 0 on EOF, -1 with errno (EAGAIN or
 *                           EWOULDBLOCK when the read deadline expired)
 *   write(buf, len)         bytes written or -1 with errno
 *   set_read_deadline(d)    0 or errno; std::nullopt blocks indefinitely
 *   set_nodelay(on)         0 or errno
 *   get_fd()                underlying socket descriptor
 */
template<typename T>
concept TimeoutCapableStream = requires(T s, void* buf, const void* cbuf, size_t len,
                                        std::optional<std::chrono::milliseconds> deadline,
                                        bool on) {
    { s.read(buf, len) } -> std::convertible_to<ssize_t>;
    { s.write(cbuf, len) } -> std::convertible_to<ssize_t>;
    { s.set_read_deadline(deadline) } -> std::same_as<int>;
    { s.set_nodelay(on) } -> std::same_as<int>;
    { s.get_fd() } -> std::convertible_to<int>;
};

/**
 * ByteSource: blocking reads, 0 on end-of-data, -1 on error
 */
template<typename T>
concept ByteSource = std::movable<T> && requires(T s, void* buf, size_t len) {
    { s.read(buf, len) } -> std::convertible_to<ssize_t>;
};

/**
 * ByteSink: write_all() returns false on the first failed write
 */
template<typename T>
concept ByteSink = requires(T s, const uint8_t* data, size_t len) {
    { s.write_all(data, len) } -> std::same_as<bool>;
};

/**
 * Write a whole buffer to a stream, looping over short writes
 *
 * @return false on the first failed write (errno preserved)
 */
template<TimeoutCapableStream Stream>
inline bool write_all(Stream& stream, const void* data, size_t len) {
    const uint8_t* p = static_cast<const uint8_t*>(data);
    size_t done = 0;
    while (done < len) {
        ssize_t n = stream.write(p + done, len - done);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        if (n == 0) {
            errno = EIO;
            return false;
        }
        done += static_cast<size_t>(n);
    }
    return true;
}

}  // namespace transport
}  // namespace wspump
