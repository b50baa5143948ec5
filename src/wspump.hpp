// wspump.hpp
// Umbrella header: pre-configured connection types and establishment helpers
//
// Stream types:
//   - PlainStream: transport::BSDSocket                 (ws://)
//   - TlsStream:   ssl::TlsStream<ssl::DefaultSSLPolicy> (wss://)
//
// Callers pick the instantiation from the URL scheme:
//
//   url::WebSocketUrl target;
//   url::parse_websocket_url(argv[1], target);
//   if (target.secure) {
//       auto conn = open_tls(target, tls_config);
//       pump::connect_streams(conn, source, sink, pump_config);
//   } else {
//       auto conn = open_plain(target);
//       ...
//   }
#pragma once

#include "core/http.hpp"
#include "core/log.hpp"
#include "core/url.hpp"
#include "policy/ssl.hpp"
#include "process/child_process.hpp"
#include "pump/bridge.hpp"
#include "pump/config.hpp"
#include "pump/process_adapter.hpp"
#include "transport/bsd_socket.hpp"
#include "transport/fd_stream.hpp"
#include "transport/listener.hpp"
#include "ws/connection.hpp"
#include "ws/handshake.hpp"

#include <utility>

namespace wspump {

using PlainStream = transport::BSDSocket;
using TlsStream = ssl::TlsStream<ssl::DefaultSSLPolicy>;

using PlainConnection = ws::WebSocketConnection<PlainStream>;
using TlsConnection = ws::WebSocketConnection<TlsStream>;

/**
 * Connect and upgrade over plain TCP
 *
 * @throws std::runtime_error on connect or handshake failure
 */
inline PlainConnection open_plain(const url::WebSocketUrl& target,
                                  const http::HeaderList& headers = {},
                                  const transport::BSDSocketConfig& socket_config = transport::BSDSocketConfig(),
                                  const ws::ConnectionConfig& conn_config = ws::ConnectionConfig()) {
    PlainStream stream;
    stream.connect(target.host, target.port, socket_config);
    return ws::client_handshake(std::move(stream), target, headers, conn_config);
}

/**
 * Connect, establish TLS and upgrade
 *
 * @throws std::runtime_error on connect, TLS or handshake failure
 */
inline TlsConnection open_tls(const url::WebSocketUrl& target,
                              const ssl::TlsConfig& tls_config = ssl::TlsConfig(),
                              const http::HeaderList& headers = {},
                              const transport::BSDSocketConfig& socket_config = transport::BSDSocketConfig(),
                              const ws::ConnectionConfig& conn_config = ws::ConnectionConfig()) {
    TlsStream stream;
    stream.connect(target.host, target.port, tls_config, socket_config);
    return ws::client_handshake(std::move(stream), target, headers, conn_config);
}

}  // namespace wspump
