// src/pump/process_adapter.hpp
// Bridge a WebSocket connection to a spawned child's stdin/stdout
//
// The child's stdout feeds the outbound pump, its stdin receives the binary
// messages. When the session ends the child is killed and reaped whatever
// state it is in.

#pragma once

#include "core/log.hpp"
#include "process/child_process.hpp"
#include "pump/bridge.hpp"
#include "pump/config.hpp"
#include "transport/stream.hpp"
#include "ws/connection.hpp"

#include <optional>
#include <utility>

namespace wspump {
namespace pump {

/**
 * Run a bridge session between conn and child
 *
 * @return std::nullopt if the child's stdin or stdout cannot be taken
 *         (no session was run), otherwise the session report
 */
template<transport::TimeoutCapableStream Stream>
std::optional<BridgeReport> connect_process(ws::WebSocketConnection<Stream>& conn,
                                            process::ChildProcess& child,
                                            const PumpConfig& config = PumpConfig()) {
    std::optional<transport::FdWriter> child_stdin = child.take_stdin();
    if (!child_stdin) {
        WSPUMP_LOG_ERROR("PROCESS", "Cannot take control of stdin (PID %d)", static_cast<int>(child.pid()));
        return std::nullopt;
    }
    std::optional<transport::FdReader> child_stdout = child.take_stdout();
    if (!child_stdout) {
        WSPUMP_LOG_ERROR("PROCESS", "Cannot take control of stdout (PID %d)", static_cast<int>(child.pid()));
        return std::nullopt;
    }

    BridgeReport report = connect_streams(conn, std::move(*child_stdout), *child_stdin, config);

    // The child may already have exited on its own
    int kill_err = child.kill();
    int status = child.wait();
    WSPUMP_LOG_DEBUG("PROCESS", "Child %d stopped (kill=%d, status=%d)",
                     static_cast<int>(child.pid()), kill_err, status);

    return report;
}

}  // namespace pump
}  // namespace wspump
