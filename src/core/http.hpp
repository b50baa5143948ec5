// src/core/http.hpp
// Transport-agnostic HTTP/WebSocket utilities
//
// This module provides HTTP upgrade and WebSocket frame parsing/building
// utilities shared by the client and server sides of a connection:
//   - WebSocket frame parsing (RFC 6455), header + payload bounds
//   - WebSocket frame building (masked for clients, unmasked for servers)
//   - HTTP upgrade request/response building and validation
//   - Sec-WebSocket-Accept computation (SHA-1 + base64 via OpenSSL)
//
// No socket/SSL dependencies: callers feed bytes in and write bytes out.

#pragma once

#include <openssl/evp.h>

#include <cstdint>
#include <cstddef>
#include <cstring>
#include <cctype>
#include <string>
#include <vector>
#include <random>
#include <stdexcept>
#include <utility>

namespace wspump {
namespace http {

// RFC 6455 section 1.3
inline constexpr const char* WEBSOCKET_GUID = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

// Upper bound for an HTTP upgrade header block
inline constexpr size_t MAX_HTTP_HEAD_SIZE = 16 * 1024;

using HeaderList = std::vector<std::pair<std::string, std::string>>;

// ═══════════════════════════════════════════════════════════════════════════
// HTTP Utilities
// ═══════════════════════════════════════════════════════════════════════════

/**
 * Validate HTTP header key/value for CRLF injection attacks
 *
 * @param key Header name
 * @param value Header value
 * @return true if safe, false if contains CRLF or invalid
 */
inline bool is_valid_header(const std::string& key, const std::string& value) {
    if (key.find('\r') != std::string::npos || key.find('\n') != std::string::npos) {
        return false;
    }
    if (value.find('\r') != std::string::npos || value.find('\n') != std::string::npos) {
        return false;
    }
    if (key.empty() || key.find(':') != std::string::npos) {
        return false;
    }
    return true;
}

inline bool iequals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); i++) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

/**
 * Case-insensitive search for a comma-separated token (e.g. "Upgrade" inside
 * "keep-alive, Upgrade")
 */
inline bool header_has_token(const std::string& value, const std::string& token) {
    size_t start = 0;
    while (start <= value.size()) {
        size_t end = value.find(',', start);
        if (end == std::string::npos) end = value.size();

        size_t b = start;
        size_t e = end;
        while (b < e && std::isspace(static_cast<unsigned char>(value[b]))) b++;
        while (e > b && std::isspace(static_cast<unsigned char>(value[e - 1]))) e--;

        if (iequals(value.substr(b, e - b), token)) {
            return true;
        }
        start = end + 1;
    }
    return false;
}

/**
 * Standard base64 (with padding) using OpenSSL's EVP encoder
 */
inline std::string base64_encode(const uint8_t* data, size_t len) {
    std::string out;
    out.resize(4 * ((len + 2) / 3));
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), data, static_cast<int>(len));
    out.resize(n > 0 ? static_cast<size_t>(n) : 0);
    return out;
}

/**
 * Generate random WebSocket key (RFC 6455 compliance)
 *
 * 16 random bytes, base64-encoded to a 24-character Sec-WebSocket-Key.
 */
inline std::string generate_websocket_key() {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 255);

    uint8_t nonce[16];
    for (int i = 0; i < 16; ++i) {
        nonce[i] = static_cast<uint8_t>(dis(gen));
    }

    return base64_encode(nonce, sizeof(nonce));
}

/**
 * Compute Sec-WebSocket-Accept for a given Sec-WebSocket-Key
 *
 * accept = base64(SHA1(key + GUID))
 *
 * @throws std::runtime_error if the digest cannot be computed
 */
inline std::string compute_accept_key(const std::string& key) {
    std::string input = key + WEBSOCKET_GUID;

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_Digest(input.data(), input.size(), digest, &digest_len, EVP_sha1(), nullptr) != 1) {
        throw std::runtime_error("EVP_Digest(SHA1) failed");
    }

    return base64_encode(digest, digest_len);
}

/**
 * Build HTTP WebSocket upgrade request
 *
 * @param host Host header value (include ":port" for non-default ports)
 * @param path Path and query (e.g. "/session?id=3")
 * @param ws_key Sec-WebSocket-Key to send (see generate_websocket_key)
 * @param custom_headers Additional headers; invalid ones are skipped
 * @return Complete request including the terminating blank line
 */
inline std::string build_websocket_upgrade_request(
    const std::string& host,
    const std::string& path,
    const std::string& ws_key,
    const HeaderList& custom_headers = {})
{
    std::string request;
    request.reserve(512);

    request += "GET ";
    request += path.empty() ? "/" : path;
    request += " HTTP/1.1\r\n";
    request += "Host: ";
    request += host;
    request += "\r\n";
    request += "Upgrade: websocket\r\n";
    request += "Connection: Upgrade\r\n";
    request += "Sec-WebSocket-Key: ";
    request += ws_key;
    request += "\r\n";
    request += "Sec-WebSocket-Version: 13\r\n";

    for (const auto& [key, value] : custom_headers) {
        if (!is_valid_header(key, value)) {
            continue;
        }

        request += key;
        request += ": ";
        request += value;
        request += "\r\n";
    }

    request += "\r\n";
    return request;
}

/**
 * Build the 101 response for an accepted upgrade
 */
inline std::string build_websocket_upgrade_response(const std::string& accept_key) {
    std::string response;
    response.reserve(160);
    response += "HTTP/1.1 101 Switching Protocols\r\n";
    response += "Upgrade: websocket\r\n";
    response += "Connection: Upgrade\r\n";
    response += "Sec-WebSocket-Accept: ";
    response += accept_key;
    response += "\r\n\r\n";
    return response;
}

inline std::string build_bad_request_response(const std::string& reason) {
    std::string response;
    response += "HTTP/1.1 400 Bad Request\r\n";
    response += "Connection: close\r\n";
    response += "Content-Type: text/plain\r\n";
    response += "Content-Length: ";
    response += std::to_string(reason.size());
    response += "\r\n\r\n";
    response += reason;
    return response;
}

/**
 * Parsed HTTP header block (request or response)
 *
 * start_line is the first line without CRLF. Header names keep their
 * original case; use find() for case-insensitive lookup.
 */
struct HttpHead {
    std::string start_line;
    HeaderList headers;

    const std::string* find(const std::string& name) const {
        for (const auto& kv : headers) {
            if (iequals(kv.first, name)) {
                return &kv.second;
            }
        }
        return nullptr;
    }
};

/**
 * Locate the end of an HTTP header block
 *
 * @return Offset one past "\r\n\r\n", or 0 if not yet complete
 */
inline size_t find_head_end(const uint8_t* data, size_t len) {
    if (len < 4) return 0;
    for (size_t i = 0; i + 3 < len; i++) {
        if (data[i] == '\r' && data[i + 1] == '\n' && data[i + 2] == '\r' && data[i + 3] == '\n') {
            return i + 4;
        }
    }
    return 0;
}

/**
 * Parse an HTTP header block (up to and including the blank line)
 *
 * @return false if malformed (missing start line or a header without ':')
 */
inline bool parse_http_head(const char* data, size_t len, HttpHead& out) {
    out.start_line.clear();
    out.headers.clear();

    std::string text(data, len);
    size_t pos = 0;
    bool first = true;

    while (pos < text.size()) {
        size_t eol = text.find("\r\n", pos);
        if (eol == std::string::npos) eol = text.size();
        std::string line = text.substr(pos, eol - pos);
        pos = eol + 2;

        if (line.empty()) {
            break;  // End of headers
        }

        if (first) {
            out.start_line = line;
            first = false;
            continue;
        }

        size_t colon = line.find(':');
        if (colon == std::string::npos || colon == 0) {
            return false;
        }

        std::string name = line.substr(0, colon);
        size_t vb = colon + 1;
        while (vb < line.size() && (line[vb] == ' ' || line[vb] == '\t')) vb++;
        size_t ve = line.size();
        while (ve > vb && (line[ve - 1] == ' ' || line[ve - 1] == '\t')) ve--;

        out.headers.emplace_back(std::move(name), line.substr(vb, ve - vb));
    }

    return !out.start_line.empty();
}

/**
 * Validate HTTP upgrade response
 *
 * Requires status 101, "Upgrade: websocket" and a matching Sec-WebSocket-Accept.
 *
 * @param head Parsed response head
 * @param expected_accept compute_accept_key(sent key)
 * @param error Set to a short reason on failure (optional)
 */
inline bool validate_http_upgrade_response(const HttpHead& head,
                                           const std::string& expected_accept,
                                           std::string* error = nullptr) {
    auto fail = [error](const char* reason) {
        if (error) *error = reason;
        return false;
    };

    // "HTTP/1.1 101 Switching Protocols"
    size_t sp = head.start_line.find(' ');
    if (sp == std::string::npos || head.start_line.compare(0, 5, "HTTP/") != 0) {
        return fail("malformed status line");
    }
    if (head.start_line.compare(sp + 1, 3, "101") != 0) {
        return fail("server did not switch protocols");
    }

    const std::string* upgrade = head.find("Upgrade");
    if (!upgrade || !iequals(*upgrade, "websocket")) {
        return fail("missing Upgrade: websocket");
    }

    const std::string* accept = head.find("Sec-WebSocket-Accept");
    if (!accept || *accept != expected_accept) {
        return fail("Sec-WebSocket-Accept mismatch");
    }

    return true;
}

/**
 * Validate an HTTP upgrade request (server side)
 *
 * @param key Receives the client's Sec-WebSocket-Key
 * @param error Set to a short reason on failure (optional)
 */
inline bool validate_http_upgrade_request(const HttpHead& head,
                                          std::string& key,
                                          std::string* error = nullptr) {
    auto fail = [error](const char* reason) {
        if (error) *error = reason;
        return false;
    };

    if (head.start_line.compare(0, 4, "GET ") != 0) {
        return fail("upgrade request must be GET");
    }

    const std::string* upgrade = head.find("Upgrade");
    if (!upgrade || !header_has_token(*upgrade, "websocket")) {
        return fail("missing Upgrade: websocket");
    }

    const std::string* connection = head.find("Connection");
    if (!connection || !header_has_token(*connection, "Upgrade")) {
        return fail("missing Connection: Upgrade");
    }

    const std::string* version = head.find("Sec-WebSocket-Version");
    if (!version || *version != "13") {
        return fail("unsupported Sec-WebSocket-Version");
    }

    const std::string* ws_key = head.find("Sec-WebSocket-Key");
    if (!ws_key || ws_key->empty()) {
        return fail("missing Sec-WebSocket-Key");
    }

    key = *ws_key;
    return true;
}

// ═══════════════════════════════════════════════════════════════════════════
// WebSocket Frame Structures
// ═══════════════════════════════════════════════════════════════════════════

/**
 * WebSocket frame opcodes (RFC 6455)
 */
enum class WebSocketOpcode : uint8_t {
    CONTINUATION = 0x00,
    TEXT = 0x01,
    BINARY = 0x02,
    CLOSE = 0x08,
    PING = 0x09,
    PONG = 0x0A,
};

inline bool is_control_opcode(uint8_t opcode) {
    return (opcode & 0x08) != 0;
}

inline bool is_known_opcode(uint8_t opcode) {
    switch (opcode) {
        case 0x00: case 0x01: case 0x02:
        case 0x08: case 0x09: case 0x0A:
            return true;
        default:
            return false;
    }
}

// Close status codes used by the connection layer
inline constexpr uint16_t CLOSE_NORMAL = 1000;
inline constexpr uint16_t CLOSE_PROTOCOL_ERROR = 1002;
inline constexpr uint16_t CLOSE_UNSUPPORTED_DATA = 1003;
inline constexpr uint16_t CLOSE_NO_STATUS = 1005;
inline constexpr uint16_t CLOSE_MESSAGE_TOO_BIG = 1009;
inline constexpr uint16_t CLOSE_INTERNAL_ERROR = 1011;

// WebSocket frame header constants
inline constexpr size_t MAX_WS_HEADER_SIZE = 14;    // 2 base + 8 ext len + 4 mask
inline constexpr uint8_t WS_PAYLOAD_LEN_16BIT = 126;
inline constexpr uint8_t WS_PAYLOAD_LEN_64BIT = 127;
inline constexpr size_t MAX_CONTROL_PAYLOAD = 125;

/**
 * Parsed WebSocket frame header
 */
struct WebSocketFrame {
    bool fin;                  // FIN bit (final fragment)
    uint8_t rsv;               // RSV1-3 bits (must be 0 without extensions)
    uint8_t opcode;            // Opcode (0x00-0x0F)
    bool masked;               // MASK bit
    uint64_t payload_len;      // Payload length
    uint8_t mask_key[4];       // Masking key (if masked)
    size_t header_len;         // Total header length (2-14 bytes)
    const uint8_t* payload;    // Pointer to payload (not copied)
};

enum class FrameParseResult {
    COMPLETE,     // Header and payload available
    INCOMPLETE,   // Need more bytes
    TOO_LARGE,    // Header parsed, payload exceeds max_payload
};

/**
 * Parse WebSocket frame header
 *
 * Parses the frame header and returns metadata. Does NOT copy payload data.
 * Caller must ensure buffer remains valid while using the frame.
 * Oversized payloads are reported as soon as the length field is readable,
 * so callers never buffer a frame they are going to reject.
 *
 * @param data Frame buffer
 * @param len Buffer length
 * @param out_frame Parsed frame metadata
 * @param max_payload Largest acceptable payload length
 */
inline FrameParseResult parse_websocket_frame(const uint8_t* data, size_t len,
                                              WebSocketFrame& out_frame,
                                              uint64_t max_payload = UINT64_MAX) {
    if (len < 2) {
        return FrameParseResult::INCOMPLETE;
    }

    // Byte 0: FIN + RSV + opcode
    uint8_t byte0 = data[0];
    out_frame.fin = (byte0 & 0x80) != 0;
    out_frame.rsv = (byte0 >> 4) & 0x07;
    out_frame.opcode = byte0 & 0x0F;

    // Byte 1: MASK + payload length
    uint8_t byte1 = data[1];
    out_frame.masked = (byte1 & 0x80) != 0;
    uint64_t payload_len = byte1 & 0x7F;

    size_t header_len = 2;

    if (payload_len == WS_PAYLOAD_LEN_16BIT) {
        if (len < 4) return FrameParseResult::INCOMPLETE;
        payload_len = (static_cast<uint64_t>(data[2]) << 8) | data[3];
        header_len = 4;
    } else if (payload_len == WS_PAYLOAD_LEN_64BIT) {
        if (len < 10) return FrameParseResult::INCOMPLETE;
        payload_len = 0;
        for (int i = 0; i < 8; i++) {
            payload_len = (payload_len << 8) | data[2 + i];
        }
        header_len = 10;
    }

    out_frame.payload_len = payload_len;
    if (payload_len > max_payload) {
        out_frame.header_len = header_len;
        out_frame.payload = nullptr;
        return FrameParseResult::TOO_LARGE;
    }

    if (out_frame.masked) {
        if (len < header_len + 4) return FrameParseResult::INCOMPLETE;
        memcpy(out_frame.mask_key, data + header_len, 4);
        header_len += 4;
    }

    out_frame.header_len = header_len;

    if (len - header_len < payload_len) {
        return FrameParseResult::INCOMPLETE;
    }

    out_frame.payload = data + header_len;
    return FrameParseResult::COMPLETE;
}

/**
 * Unmask WebSocket payload in-place
 *
 * @param offset Position of payload[0] within the whole masked payload
 */
inline void unmask_payload(uint8_t* payload, size_t len, const uint8_t mask_key[4], size_t offset = 0) {
    for (size_t i = 0; i < len; i++) {
        payload[i] ^= mask_key[(offset + i) % 4];
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// WebSocket Frame Builders
// ═══════════════════════════════════════════════════════════════════════════

/**
 * Build a single-frame (FIN=1) WebSocket message
 *
 * Client frames must be masked (pass mask_key); server frames must not
 * (pass nullptr). The frame is appended to out.
 *
 * @param opcode Frame opcode
 * @param payload Payload data (may be nullptr when payload_len == 0)
 * @param payload_len Payload length
 * @param mask_key 4-byte masking key, or nullptr for an unmasked frame
 * @param out Destination buffer (appended)
 * @return Total frame size
 */
inline size_t build_websocket_frame(WebSocketOpcode opcode,
                                    const uint8_t* payload, size_t payload_len,
                                    const uint8_t* mask_key,
                                    std::vector<uint8_t>& out) {
    uint8_t header[MAX_WS_HEADER_SIZE];
    size_t header_len = 2;
    uint8_t mask_bit = mask_key ? 0x80 : 0x00;

    // Byte 0: FIN + opcode
    header[0] = 0x80 | (static_cast<uint8_t>(opcode) & 0x0F);

    // Byte 1: MASK + payload length
    if (payload_len <= 125) {
        header[1] = mask_bit | static_cast<uint8_t>(payload_len);
    } else if (payload_len <= 65535) {
        header[1] = mask_bit | WS_PAYLOAD_LEN_16BIT;
        header[2] = (payload_len >> 8) & 0xFF;
        header[3] = payload_len & 0xFF;
        header_len = 4;
    } else {
        header[1] = mask_bit | WS_PAYLOAD_LEN_64BIT;
        uint64_t len64 = payload_len;
        for (int i = 0; i < 8; i++) {
            header[2 + i] = (len64 >> (56 - i * 8)) & 0xFF;
        }
        header_len = 10;
    }

    if (mask_key) {
        memcpy(header + header_len, mask_key, 4);
        header_len += 4;
    }

    size_t base = out.size();
    out.resize(base + header_len + payload_len);
    memcpy(out.data() + base, header, header_len);

    uint8_t* dst = out.data() + base + header_len;
    if (payload_len > 0) {
        memcpy(dst, payload, payload_len);
        if (mask_key) {
            unmask_payload(dst, payload_len, mask_key);  // XOR is symmetric
        }
    }

    return header_len + payload_len;
}

/**
 * Build the payload of a CLOSE frame (2-byte status + reason, max 125 bytes)
 *
 * CLOSE_NO_STATUS yields an empty payload, which RFC 6455 requires when
 * echoing a close that carried no status.
 */
inline std::vector<uint8_t> build_close_payload(uint16_t status_code, const std::string& reason = {}) {
    std::vector<uint8_t> payload;
    if (status_code == CLOSE_NO_STATUS) {
        return payload;
    }

    size_t reason_len = reason.size();
    if (reason_len > MAX_CONTROL_PAYLOAD - 2) {
        reason_len = MAX_CONTROL_PAYLOAD - 2;
    }

    payload.reserve(2 + reason_len);
    payload.push_back((status_code >> 8) & 0xFF);
    payload.push_back(status_code & 0xFF);
    payload.insert(payload.end(), reason.begin(), reason.begin() + reason_len);
    return payload;
}

/**
 * Extract the status code from a CLOSE payload
 *
 * @return CLOSE_NO_STATUS when the payload carries no code
 */
inline uint16_t parse_close_status(const uint8_t* payload, size_t len) {
    if (len < 2) {
        return CLOSE_NO_STATUS;
    }
    return static_cast<uint16_t>((payload[0] << 8) | payload[1]);
}

}  // namespace http
}  // namespace wspump
