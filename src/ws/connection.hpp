// src/ws/connection.hpp
// WebSocketConnection - message-oriented RFC 6455 endpoint over a stream
//
// Reads complete messages (reassembling fragments) and writes single-frame
// messages. Works for both roles:
//   - CLIENT: outgoing frames masked, incoming frames must be unmasked
//   - SERVER: outgoing frames unmasked, incoming frames must be masked
//
// Control frames:
//   - PING is answered with a PONG automatically and still returned
//   - CLOSE is answered with a CLOSE (same status) and reported as CLOSED
//
// A read deadline on the stream surfaces as ReadStatus::TIMEOUT. Partial
// frames and partial fragmented messages stay buffered, so the next
// read_message() continues exactly where the previous one stopped.

#pragma once

#include "core/http.hpp"
#include "core/log.hpp"
#include "transport/stream.hpp"

#include <errno.h>
#include <cstdint>
#include <cstring>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace wspump {
namespace ws {

enum class Role {
    CLIENT,
    SERVER,
};

struct ConnectionConfig {
    size_t max_message_size;   // Reassembled message limit (default: 64 MiB)
    size_t max_frame_size;     // Single frame payload limit (default: 16 MiB)
    size_t read_chunk;         // Bytes requested per stream read (default: 64 KiB)

    ConnectionConfig()
        : max_message_size(64 << 20)
        , max_frame_size(16 << 20)
        , read_chunk(64 * 1024)
    {}
};

enum class ReadStatus {
    MESSAGE,    // out holds a complete message (any opcode except CLOSE)
    TIMEOUT,    // Read deadline expired, nothing complete yet
    CLOSED,     // CLOSE frame received (and answered)
    ERROR,      // I/O error, EOF without CLOSE, or protocol violation
};

inline const char* read_status_name(ReadStatus status) {
    switch (status) {
        case ReadStatus::MESSAGE: return "MESSAGE";
        case ReadStatus::TIMEOUT: return "TIMEOUT";
        case ReadStatus::CLOSED:  return "CLOSED";
        case ReadStatus::ERROR:   return "ERROR";
    }
    return "?";
}

struct Message {
    http::WebSocketOpcode opcode = http::WebSocketOpcode::BINARY;
    std::vector<uint8_t> payload;

    bool is_binary() const { return opcode == http::WebSocketOpcode::BINARY; }
};

template<transport::TimeoutCapableStream Stream>
class WebSocketConnection {
public:
    /**
     * @param stream Connected stream, upgrade handshake already completed
     * @param role Which side of the connection this endpoint plays
     * @param config Size limits
     * @param initial Bytes read past the HTTP upgrade head (already framed data)
     */
    WebSocketConnection(Stream stream, Role role,
                        ConnectionConfig config = ConnectionConfig(),
                        std::vector<uint8_t> initial = {})
        : stream_(std::move(stream))
        , role_(role)
        , config_(config)
        , rx_(std::move(initial))
        , rng_(std::random_device{}())
    {
        read_buf_.resize(config_.read_chunk);
    }

    WebSocketConnection(const WebSocketConnection&) = delete;
    WebSocketConnection& operator=(const WebSocketConnection&) = delete;
    WebSocketConnection(WebSocketConnection&&) = default;
    WebSocketConnection& operator=(WebSocketConnection&&) = default;

    Stream& get_stream() { return stream_; }
    const Stream& get_stream() const { return stream_; }

    Role role() const { return role_; }

    /**
     * true until a CLOSE was sent or received, or the connection failed
     */
    bool is_open() const {
        return !close_sent_ && !close_received_ && !failed_;
    }

    bool close_received() const { return close_received_; }
    bool close_sent() const { return close_sent_; }

    /**
     * Status carried by the peer's CLOSE frame (CLOSE_NO_STATUS if none)
     */
    uint16_t peer_close_code() const { return peer_close_code_; }

    const std::string& last_error() const { return last_error_; }

    /**
     * Read one complete message
     *
     * Blocks at most for the stream's read deadline per underlying read.
     */
    ReadStatus read_message(Message& out) {
        if (failed_) return ReadStatus::ERROR;
        if (close_received_) return ReadStatus::CLOSED;

        for (;;) {
            // Drain every complete frame already buffered
            for (;;) {
                http::WebSocketFrame frame;
                size_t avail = rx_.size() - rx_start_;
                http::FrameParseResult res = http::parse_websocket_frame(
                    rx_.data() + rx_start_, avail, frame, config_.max_frame_size);

                if (res == http::FrameParseResult::INCOMPLETE) {
                    break;
                }
                if (res == http::FrameParseResult::TOO_LARGE) {
                    return fail(http::CLOSE_MESSAGE_TOO_BIG, "frame exceeds max_frame_size");
                }

                size_t frame_len = frame.header_len + static_cast<size_t>(frame.payload_len);
                uint8_t* payload = rx_.data() + rx_start_ + frame.header_len;
                size_t payload_len = static_cast<size_t>(frame.payload_len);
                if (frame.masked) {
                    http::unmask_payload(payload, payload_len, frame.mask_key);
                }

                ReadStatus status;
                bool produced = handle_frame(frame, payload, payload_len, out, status);
                rx_start_ += frame_len;
                if (produced) {
                    return status;
                }
            }

            compact();

            ssize_t n = stream_.read(read_buf_.data(), read_buf_.size());
            if (n > 0) {
                rx_.insert(rx_.end(), read_buf_.begin(), read_buf_.begin() + n);
                continue;
            }
            if (n == 0) {
                failed_ = true;
                last_error_ = "connection closed without closing handshake";
                return ReadStatus::ERROR;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                return ReadStatus::TIMEOUT;
            }

            failed_ = true;
            last_error_ = std::string("read failed: ") + strerror(errno);
            return ReadStatus::ERROR;
        }
    }

    /**
     * Send one unfragmented message
     *
     * @return false if the connection is closing/failed or the write failed
     */
    bool send_message(http::WebSocketOpcode opcode, const uint8_t* data, size_t len) {
        if (failed_ || close_sent_) {
            last_error_ = "connection is closed";
            return false;
        }
        return write_frame(opcode, data, len);
    }

    bool send_binary(const uint8_t* data, size_t len) {
        return send_message(http::WebSocketOpcode::BINARY, data, len);
    }

    bool send_binary(const std::vector<uint8_t>& data) {
        return send_binary(data.data(), data.size());
    }

    bool send_text(const std::string& text) {
        return send_message(http::WebSocketOpcode::TEXT,
                            reinterpret_cast<const uint8_t*>(text.data()), text.size());
    }

    bool send_ping(const uint8_t* data = nullptr, size_t len = 0) {
        if (len > http::MAX_CONTROL_PAYLOAD) len = http::MAX_CONTROL_PAYLOAD;
        return send_message(http::WebSocketOpcode::PING, data, len);
    }

    /**
     * Start (or complete) the closing handshake. Idempotent.
     */
    bool close(uint16_t code = http::CLOSE_NORMAL, const std::string& reason = {}) {
        if (close_sent_) return true;
        if (failed_) return false;

        std::vector<uint8_t> payload = http::build_close_payload(code, reason);
        close_sent_ = true;
        return write_frame(http::WebSocketOpcode::CLOSE, payload.data(), payload.size());
    }

private:
    /**
     * @return true when the frame completed something to report to the caller
     */
    bool handle_frame(const http::WebSocketFrame& frame, const uint8_t* payload, size_t len,
                      Message& out, ReadStatus& status) {
        if (frame.rsv != 0) {
            status = fail(http::CLOSE_PROTOCOL_ERROR, "reserved bits set without extension");
            return true;
        }
        if (!http::is_known_opcode(frame.opcode)) {
            status = fail(http::CLOSE_PROTOCOL_ERROR, "unknown opcode");
            return true;
        }
        if (role_ == Role::SERVER && !frame.masked) {
            status = fail(http::CLOSE_PROTOCOL_ERROR, "client frame not masked");
            return true;
        }
        if (role_ == Role::CLIENT && frame.masked) {
            status = fail(http::CLOSE_PROTOCOL_ERROR, "server frame masked");
            return true;
        }

        auto opcode = static_cast<http::WebSocketOpcode>(frame.opcode);

        if (http::is_control_opcode(frame.opcode)) {
            if (!frame.fin || len > http::MAX_CONTROL_PAYLOAD) {
                status = fail(http::CLOSE_PROTOCOL_ERROR, "invalid control frame");
                return true;
            }

            switch (opcode) {
                case http::WebSocketOpcode::PING:
                    if (!close_sent_ && !write_frame(http::WebSocketOpcode::PONG, payload, len)) {
                        status = ReadStatus::ERROR;
                        return true;
                    }
                    break;
                case http::WebSocketOpcode::CLOSE: {
                    if (len == 1) {
                        status = fail(http::CLOSE_PROTOCOL_ERROR, "invalid close payload");
                        return true;
                    }
                    close_received_ = true;
                    peer_close_code_ = http::parse_close_status(payload, len);
                    if (!close_sent_) {
                        std::vector<uint8_t> reply = http::build_close_payload(peer_close_code_);
                        close_sent_ = true;
                        if (!write_frame(http::WebSocketOpcode::CLOSE, reply.data(), reply.size())) {
                            WSPUMP_LOG_DEBUG("WS", "Close reply not delivered: %s", last_error_.c_str());
                        }
                    }
                    out.opcode = opcode;
                    out.payload.assign(payload, payload + len);
                    status = ReadStatus::CLOSED;
                    return true;
                }
                default:
                    break;  // PONG
            }

            out.opcode = opcode;
            out.payload.assign(payload, payload + len);
            status = ReadStatus::MESSAGE;
            return true;
        }

        if (opcode == http::WebSocketOpcode::CONTINUATION) {
            if (!in_fragment_) {
                status = fail(http::CLOSE_PROTOCOL_ERROR, "continuation without start frame");
                return true;
            }
            if (fragment_.size() + len > config_.max_message_size) {
                status = fail(http::CLOSE_MESSAGE_TOO_BIG, "message exceeds max_message_size");
                return true;
            }
            fragment_.insert(fragment_.end(), payload, payload + len);
            if (!frame.fin) {
                return false;
            }
            in_fragment_ = false;
            out.opcode = fragment_opcode_;
            out.payload = std::move(fragment_);
            fragment_.clear();
            status = ReadStatus::MESSAGE;
            return true;
        }

        // TEXT or BINARY start frame
        if (in_fragment_) {
            status = fail(http::CLOSE_PROTOCOL_ERROR, "new message inside fragmented message");
            return true;
        }
        if (len > config_.max_message_size) {
            status = fail(http::CLOSE_MESSAGE_TOO_BIG, "message exceeds max_message_size");
            return true;
        }
        if (!frame.fin) {
            in_fragment_ = true;
            fragment_opcode_ = opcode;
            fragment_.assign(payload, payload + len);
            return false;
        }

        out.opcode = opcode;
        out.payload.assign(payload, payload + len);
        status = ReadStatus::MESSAGE;
        return true;
    }

    bool write_frame(http::WebSocketOpcode opcode, const uint8_t* data, size_t len) {
        tx_.clear();

        if (role_ == Role::CLIENT) {
            uint32_t key = static_cast<uint32_t>(rng_());
            uint8_t mask_key[4];
            memcpy(mask_key, &key, 4);
            http::build_websocket_frame(opcode, data, len, mask_key, tx_);
        } else {
            http::build_websocket_frame(opcode, data, len, nullptr, tx_);
        }

        if (!transport::write_all(stream_, tx_.data(), tx_.size())) {
            failed_ = true;
            last_error_ = std::string("write failed: ") + strerror(errno);
            return false;
        }
        return true;
    }

    ReadStatus fail(uint16_t code, const char* reason) {
        last_error_ = reason;
        WSPUMP_LOG_WARN("WS", "Protocol error: %s", reason);
        if (!close_sent_) {
            std::vector<uint8_t> payload = http::build_close_payload(code, reason);
            close_sent_ = true;
            write_frame(http::WebSocketOpcode::CLOSE, payload.data(), payload.size());
            last_error_ = reason;
        }
        failed_ = true;
        return ReadStatus::ERROR;
    }

    // Drop consumed bytes once they dominate the buffer
    void compact() {
        if (rx_start_ == 0) return;
        if (rx_start_ == rx_.size()) {
            rx_.clear();
            rx_start_ = 0;
        } else if (rx_start_ >= rx_.size() / 2) {
            rx_.erase(rx_.begin(), rx_.begin() + static_cast<std::ptrdiff_t>(rx_start_));
            rx_start_ = 0;
        }
    }

    Stream stream_;
    Role role_;
    ConnectionConfig config_;

    std::vector<uint8_t> rx_;          // Received, not yet consumed bytes
    size_t rx_start_ = 0;
    std::vector<uint8_t> read_buf_;    // Scratch for stream reads
    std::vector<uint8_t> tx_;          // Scratch for outgoing frames

    bool in_fragment_ = false;
    http::WebSocketOpcode fragment_opcode_ = http::WebSocketOpcode::BINARY;
    std::vector<uint8_t> fragment_;

    bool close_sent_ = false;
    bool close_received_ = false;
    bool failed_ = false;
    uint16_t peer_close_code_ = http::CLOSE_NO_STATUS;
    std::string last_error_;

    std::mt19937 rng_;
};

}  // namespace ws
}  // namespace wspump
