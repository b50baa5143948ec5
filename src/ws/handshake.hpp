// src/ws/handshake.hpp
// HTTP upgrade handshakes producing a WebSocketConnection
//
//   client_handshake(): send GET upgrade, validate 101 + Sec-WebSocket-Accept
//   server_handshake(): read upgrade request, answer 101 (or 400 and throw)
//
// Both run on a blocking stream before any read deadline is configured, and
// hand the bytes that arrived after the HTTP head to the connection.

#pragma once

#include "core/http.hpp"
#include "core/log.hpp"
#include "core/url.hpp"
#include "transport/stream.hpp"
#include "ws/connection.hpp"

#include <errno.h>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace wspump {
namespace ws {

/**
 * Read an HTTP header block
 *
 * @param leftover Receives bytes read past the blank line
 * @throws std::runtime_error on EOF, I/O error, oversize or malformed head
 */
template<transport::TimeoutCapableStream Stream>
http::HttpHead read_http_head(Stream& stream, std::vector<uint8_t>& leftover) {
    std::vector<uint8_t> buf;
    uint8_t chunk[4096];

    for (;;) {
        ssize_t n = stream.read(chunk, sizeof(chunk));
        if (n == 0) {
            throw std::runtime_error("Connection closed during HTTP upgrade");
        }
        if (n < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error(std::string("Read failed during HTTP upgrade: ") + strerror(errno));
        }

        size_t scan_from = buf.size() >= 3 ? buf.size() - 3 : 0;
        buf.insert(buf.end(), chunk, chunk + n);

        size_t end = http::find_head_end(buf.data() + scan_from, buf.size() - scan_from);
        if (end != 0) {
            end += scan_from;
            http::HttpHead head;
            if (!http::parse_http_head(reinterpret_cast<const char*>(buf.data()), end, head)) {
                throw std::runtime_error("Malformed HTTP upgrade head");
            }
            leftover.assign(buf.begin() + static_cast<std::ptrdiff_t>(end), buf.end());
            return head;
        }

        if (buf.size() > http::MAX_HTTP_HEAD_SIZE) {
            throw std::runtime_error("HTTP upgrade head too large");
        }
    }
}

/**
 * Perform the client side of the upgrade on a connected stream
 *
 * @param stream Connected (and, for wss, TLS-established) stream
 * @param target Parsed ws:// or wss:// URL
 * @param extra_headers Additional request headers
 * @throws std::runtime_error if the server refuses or answers incorrectly
 */
template<transport::TimeoutCapableStream Stream>
WebSocketConnection<Stream> client_handshake(Stream stream,
                                             const url::WebSocketUrl& target,
                                             const http::HeaderList& extra_headers = {},
                                             const ConnectionConfig& config = ConnectionConfig()) {
    std::string key = http::generate_websocket_key();
    std::string request = http::build_websocket_upgrade_request(
        target.host_header(), target.path, key, extra_headers);

    if (!transport::write_all(stream, request.data(), request.size())) {
        throw std::runtime_error(std::string("Failed to send upgrade request: ") + strerror(errno));
    }

    std::vector<uint8_t> leftover;
    http::HttpHead head = read_http_head(stream, leftover);

    std::string error;
    if (!http::validate_http_upgrade_response(head, http::compute_accept_key(key), &error)) {
        throw std::runtime_error("WebSocket upgrade rejected (" + error + "): " + head.start_line);
    }

    WSPUMP_LOG_INFO("WS", "Upgraded %s%s", target.host_header().c_str(), target.path.c_str());
    return WebSocketConnection<Stream>(std::move(stream), Role::CLIENT, config, std::move(leftover));
}

/**
 * Perform the server side of the upgrade on an accepted stream
 *
 * @param request_path Receives the request target (optional)
 * @throws std::runtime_error on an invalid request (after replying 400)
 */
template<transport::TimeoutCapableStream Stream>
WebSocketConnection<Stream> server_handshake(Stream stream,
                                             const ConnectionConfig& config = ConnectionConfig(),
                                             std::string* request_path = nullptr) {
    std::vector<uint8_t> leftover;
    http::HttpHead head = read_http_head(stream, leftover);

    std::string key;
    std::string error;
    if (!http::validate_http_upgrade_request(head, key, &error)) {
        std::string response = http::build_bad_request_response(error + "\n");
        if (!transport::write_all(stream, response.data(), response.size())) {
            WSPUMP_LOG_DEBUG("WS", "400 response not delivered: %s", strerror(errno));
        }
        throw std::runtime_error("Invalid WebSocket upgrade request: " + error);
    }

    std::string response = http::build_websocket_upgrade_response(http::compute_accept_key(key));
    if (!transport::write_all(stream, response.data(), response.size())) {
        throw std::runtime_error(std::string("Failed to send upgrade response: ") + strerror(errno));
    }

    if (request_path) {
        // "GET <target> HTTP/1.1"
        size_t b = head.start_line.find(' ');
        size_t e = head.start_line.rfind(' ');
        *request_path = (b != std::string::npos && e > b) ? head.start_line.substr(b + 1, e - b - 1) : "/";
    }

    return WebSocketConnection<Stream>(std::move(stream), Role::SERVER, config, std::move(leftover));
}

}  // namespace ws
}  // namespace wspump
