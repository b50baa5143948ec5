// src/pump/bridge.hpp
// Bridge loop - relay between a WebSocket connection and a local byte endpoint
//
//   remote -> local:  binary message  -> sink.write_all()
//   local  -> remote: OutboundPump    -> ChunkChannel -> send_binary()
//
// The framed read runs with a read deadline of one tick. Every expiry is the
// point where the outbound channel is polled (one chunk per tick) and the
// inactivity timeout is checked. The session ends on the first of:
//   peer close, transport error, local write failure, local end-of-data,
//   send failure, inactivity.
//
// Setup and teardown touch only the stream's deadline and no-delay options.
// A failure there is logged and reported, never fatal.

#pragma once

#include "core/log.hpp"
#include "core/lossy_text.hpp"
#include "pump/chunk_channel.hpp"
#include "pump/config.hpp"
#include "pump/outbound_pump.hpp"
#include "transport/stream.hpp"
#include "ws/connection.hpp"

#include <errno.h>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <optional>
#include <string>
#include <utility>

namespace wspump {
namespace pump {

enum class BridgeState {
    RUNNING,
    TERMINATED,
};

enum class TerminationCause {
    SETUP_FAILED,         // Deadline or no-delay could not be configured
    REMOTE_CLOSED,        // Peer sent a close frame
    TRANSPORT_ERROR,      // Framed read failed (I/O, EOF, protocol violation)
    LOCAL_WRITE_FAILED,   // Writing a received payload to the sink failed
    LOCAL_EOF,            // Outbound source finished and its chunks were sent
    SEND_FAILED,          // Sending an outbound chunk failed
    INACTIVITY_TIMEOUT,   // No data in either direction for the timeout
};

inline const char* termination_cause_name(TerminationCause cause) {
    switch (cause) {
        case TerminationCause::SETUP_FAILED:       return "setup failed";
        case TerminationCause::REMOTE_CLOSED:      return "remote closed";
        case TerminationCause::TRANSPORT_ERROR:    return "transport error";
        case TerminationCause::LOCAL_WRITE_FAILED: return "local write failed";
        case TerminationCause::LOCAL_EOF:          return "local end of data";
        case TerminationCause::SEND_FAILED:        return "send failed";
        case TerminationCause::INACTIVITY_TIMEOUT: return "inactivity timeout";
    }
    return "unknown";
}

/**
 * Outcome of one bridge session
 */
struct BridgeReport {
    TerminationCause cause = TerminationCause::SETUP_FAILED;
    uint64_t bytes_in = 0;        // remote -> local payload bytes
    uint64_t bytes_out = 0;       // local -> remote payload bytes
    uint64_t messages_in = 0;     // binary messages written to the sink
    uint64_t messages_out = 0;    // chunks sent as binary messages
    bool teardown_ok = false;     // deadline cleared and no-delay disabled

    bool setup_failed() const { return cause == TerminationCause::SETUP_FAILED; }
};

namespace detail {

inline void echo_payload(const PumpConfig& config, const char* prefix,
                         const uint8_t* data, size_t len) {
    std::string line(prefix);
    line += text::to_lossy_utf8(data, len);
    fputs(line.c_str(), config.echo_stream);
    fflush(config.echo_stream);
}

/**
 * Read deadline at the tick and no-delay on
 */
template<transport::TimeoutCapableStream Stream>
bool configure_stream(Stream& stream, const PumpConfig& config) {
    int err = stream.set_read_deadline(std::chrono::milliseconds(config.tick_ms));
    if (err != 0) {
        WSPUMP_LOG_ERROR("BRIDGE", "Cannot set read deadline: %s", strerror(err));
        return false;
    }
    err = stream.set_nodelay(true);
    if (err != 0) {
        WSPUMP_LOG_ERROR("BRIDGE", "Cannot enable no-delay: %s", strerror(err));
        return false;
    }
    return true;
}

/**
 * Back to blocking reads with coalescing. Stops at the first failure.
 */
template<transport::TimeoutCapableStream Stream>
bool restore_stream(Stream& stream) {
    int err = stream.set_read_deadline(std::nullopt);
    if (err != 0) {
        WSPUMP_LOG_ERROR("BRIDGE", "Cannot clear read deadline: %s", strerror(err));
        return false;
    }
    err = stream.set_nodelay(false);
    if (err != 0) {
        WSPUMP_LOG_ERROR("BRIDGE", "Cannot disable no-delay: %s", strerror(err));
        return false;
    }
    return true;
}

}  // namespace detail

/**
 * Relay data between a WebSocket connection and a local duplex endpoint
 * until one side ends the session.
 *
 * @param conn Established connection, owned by the caller, used exclusively
 *             by this call for its duration
 * @param source Read half of the local endpoint, moved into the pump thread
 * @param sink Write half of the local endpoint
 * @param config Tick, inactivity timeout, buffer size, echo
 * @return Report with the termination cause and traffic counters
 */
template<transport::TimeoutCapableStream Stream, transport::ByteSource Source, transport::ByteSink Sink>
BridgeReport connect_streams(ws::WebSocketConnection<Stream>& conn, Source source, Sink& sink,
                             const PumpConfig& config = PumpConfig()) {
    using Clock = std::chrono::steady_clock;

    BridgeReport report;
    if (!config.validate()) {
        return report;
    }

    Stream& stream = conn.get_stream();
    if (!detail::configure_stream(stream, config)) {
        return report;
    }

    auto [sender, receiver] = make_chunk_channel();
    OutboundPump pump;
    if (!pump.start(std::move(source), std::move(sender), config.buffer_size)) {
        report.teardown_ok = detail::restore_stream(stream);
        return report;
    }

    const auto timeout = std::chrono::milliseconds(config.inactivity_timeout_ms);
    auto last_activity = Clock::now();
    BridgeState state = BridgeState::RUNNING;
    ws::Message msg;
    Chunk chunk;

    while (state == BridgeState::RUNNING) {
        ws::ReadStatus status = conn.read_message(msg);

        switch (status) {
            case ws::ReadStatus::MESSAGE:
                if (!msg.is_binary()) {
                    break;
                }
                if (config.echo) {
                    detail::echo_payload(config, "< ", msg.payload.data(), msg.payload.size());
                }
                if (!sink.write_all(msg.payload.data(), msg.payload.size())) {
                    WSPUMP_LOG_INFO("BRIDGE", "Local write failed: %s", strerror(errno));
                    report.cause = TerminationCause::LOCAL_WRITE_FAILED;
                    state = BridgeState::TERMINATED;
                    break;
                }
                last_activity = Clock::now();
                report.bytes_in += msg.payload.size();
                report.messages_in++;
                break;

            case ws::ReadStatus::TIMEOUT: {
                if (Clock::now() - last_activity >= timeout) {
                    report.cause = TerminationCause::INACTIVITY_TIMEOUT;
                    state = BridgeState::TERMINATED;
                    break;
                }

                RecvStatus recv = receiver.try_recv(chunk);
                if (recv == RecvStatus::EMPTY) {
                    break;
                }
                if (recv == RecvStatus::DISCONNECTED) {
                    report.cause = TerminationCause::LOCAL_EOF;
                    state = BridgeState::TERMINATED;
                    break;
                }

                last_activity = Clock::now();
                if (config.echo) {
                    detail::echo_payload(config, "> ", chunk.data(), chunk.size());
                }
                if (!conn.send_binary(chunk)) {
                    WSPUMP_LOG_INFO("BRIDGE", "Send failed: %s", conn.last_error().c_str());
                    report.cause = TerminationCause::SEND_FAILED;
                    state = BridgeState::TERMINATED;
                    break;
                }
                report.bytes_out += chunk.size();
                report.messages_out++;
                break;
            }

            case ws::ReadStatus::CLOSED:
                WSPUMP_LOG_DEBUG("BRIDGE", "Peer closed (code %u)",
                                 static_cast<unsigned>(conn.peer_close_code()));
                report.cause = TerminationCause::REMOTE_CLOSED;
                state = BridgeState::TERMINATED;
                break;

            case ws::ReadStatus::ERROR:
                WSPUMP_LOG_INFO("BRIDGE", "Read failed: %s", conn.last_error().c_str());
                report.cause = TerminationCause::TRANSPORT_ERROR;
                state = BridgeState::TERMINATED;
                break;
        }
    }

    report.teardown_ok = detail::restore_stream(stream);

    // Pump sees send() fail on its next chunk if it is still reading
    receiver.close();
    pump.release();

    WSPUMP_LOG_INFO("BRIDGE", "Session ended (%s): in %llu bytes/%llu msgs, out %llu bytes/%llu msgs",
                    termination_cause_name(report.cause),
                    static_cast<unsigned long long>(report.bytes_in),
                    static_cast<unsigned long long>(report.messages_in),
                    static_cast<unsigned long long>(report.bytes_out),
                    static_cast<unsigned long long>(report.messages_out));
    return report;
}

}  // namespace pump
}  // namespace wspump
