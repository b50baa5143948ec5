// test/unittest/test_core_http.cpp
// Unit tests for core/http.hpp, core/url.hpp and core/lossy_text.hpp

#include "core/http.hpp"
#include "core/log.hpp"
#include "core/lossy_text.hpp"
#include "core/url.hpp"
#include "test_harness.hpp"

#include <cstring>
#include <string>
#include <vector>

using namespace wspump;
using namespace wspump::http;

static std::string as_string(const uint8_t* data, size_t len) {
    return std::string(reinterpret_cast<const char*>(data), len);
}

// ============================================================================
// Handshake helpers
// ============================================================================

TEST(generate_websocket_key) {
    std::string key1 = generate_websocket_key();
    std::string key2 = generate_websocket_key();

    ASSERT_EQ(key1.size(), 24u);
    ASSERT_EQ(key2.size(), 24u);
    ASSERT_NE(key1, key2);
}

TEST(compute_accept_key_rfc_example) {
    // RFC 6455 section 1.3
    ASSERT_EQ(compute_accept_key("dGhlIHNhbXBsZSBub25jZQ=="),
              std::string("s3pPLMBiTxaQ9kYGzzhZRbK+xOo="));
}

TEST(base64_encode_padding) {
    const uint8_t data[] = {'f', 'o', 'o', 'b', 'a', 'r'};
    ASSERT_EQ(base64_encode(data, 1), std::string("Zg=="));
    ASSERT_EQ(base64_encode(data, 2), std::string("Zm8="));
    ASSERT_EQ(base64_encode(data, 6), std::string("Zm9vYmFy"));
    ASSERT_EQ(base64_encode(data, 0), std::string(""));
}

TEST(is_valid_header) {
    ASSERT_TRUE(is_valid_header("Authorization", "Bearer token123"));

    // CRLF injection
    ASSERT_FALSE(is_valid_header("X-Test\r\n", "value"));
    ASSERT_FALSE(is_valid_header("X-Test", "value\r\nX-Injected: evil"));
    ASSERT_FALSE(is_valid_header("X-Test\n", "value"));
    ASSERT_FALSE(is_valid_header("X:Test", "value"));
    ASSERT_FALSE(is_valid_header("", "value"));
}

TEST(header_has_token) {
    ASSERT_TRUE(header_has_token("keep-alive, Upgrade", "upgrade"));
    ASSERT_TRUE(header_has_token("websocket", "WebSocket"));
    ASSERT_FALSE(header_has_token("keep-alive", "upgrade"));
    ASSERT_FALSE(header_has_token("upgraded", "upgrade"));
}

TEST(upgrade_request_layout) {
    HeaderList extra = {{"X-Token", "abc"}, {"Bad\r\nHeader", "x"}};
    std::string req = build_websocket_upgrade_request("example.com:8080", "/tunnel?id=1",
                                                      "dGhlIHNhbXBsZSBub25jZQ==", extra);

    ASSERT_EQ(req.compare(0, 30, "GET /tunnel?id=1 HTTP/1.1\r\nHos"), 0);
    ASSERT_NE(req.find("Host: example.com:8080\r\n"), std::string::npos);
    ASSERT_NE(req.find("Sec-WebSocket-Key: dGhlIHNhbXBsZSBub25jZQ==\r\n"), std::string::npos);
    ASSERT_NE(req.find("Sec-WebSocket-Version: 13\r\n"), std::string::npos);
    ASSERT_NE(req.find("X-Token: abc\r\n"), std::string::npos);
    ASSERT_EQ(req.find("Bad"), std::string::npos);
    ASSERT_EQ(req.substr(req.size() - 4), std::string("\r\n\r\n"));
}

TEST(request_roundtrip_through_server_validation) {
    std::string req = build_websocket_upgrade_request("h", "/", "a2V5a2V5a2V5a2V5a2V5YQ==");
    size_t end = find_head_end(reinterpret_cast<const uint8_t*>(req.data()), req.size());
    ASSERT_EQ(end, req.size());

    HttpHead head;
    ASSERT_TRUE(parse_http_head(req.data(), end, head));

    std::string key;
    std::string error;
    ASSERT_TRUE(validate_http_upgrade_request(head, key, &error));
    ASSERT_EQ(key, std::string("a2V5a2V5a2V5a2V5a2V5YQ=="));
}

TEST(parse_http_head_case_insensitive_lookup) {
    const char* text = "HTTP/1.1 101 Switching Protocols\r\n"
                       "upgrade:   websocket  \r\n"
                       "CONNECTION: Upgrade\r\n\r\n";
    HttpHead head;
    ASSERT_TRUE(parse_http_head(text, strlen(text), head));
    ASSERT_EQ(head.start_line, std::string("HTTP/1.1 101 Switching Protocols"));
    ASSERT_EQ(head.headers.size(), 2u);

    const std::string* upgrade = head.find("Upgrade");
    ASSERT_TRUE(upgrade != nullptr);
    ASSERT_EQ(*upgrade, std::string("websocket"));
    ASSERT_TRUE(head.find("Sec-WebSocket-Accept") == nullptr);
}

TEST(parse_http_head_rejects_garbage) {
    const char* text = "HTTP/1.1 101 OK\r\nno colon here\r\n\r\n";
    HttpHead head;
    ASSERT_FALSE(parse_http_head(text, strlen(text), head));
}

TEST(find_head_end_incomplete) {
    const char* text = "HTTP/1.1 101 OK\r\nUpgrade: websocket\r\n";
    ASSERT_EQ(find_head_end(reinterpret_cast<const uint8_t*>(text), strlen(text)), 0u);
}

TEST(validate_upgrade_response) {
    std::string accept = compute_accept_key("dGhlIHNhbXBsZSBub25jZQ==");
    std::string resp = build_websocket_upgrade_response(accept);

    HttpHead head;
    ASSERT_TRUE(parse_http_head(resp.data(), resp.size(), head));

    std::string error;
    ASSERT_TRUE(validate_http_upgrade_response(head, accept, &error));
    ASSERT_FALSE(validate_http_upgrade_response(head, "wrong", &error));
    ASSERT_EQ(error, std::string("Sec-WebSocket-Accept mismatch"));
}

TEST(validate_upgrade_response_rejects_non_101) {
    const char* text = "HTTP/1.1 403 Forbidden\r\nContent-Length: 0\r\n\r\n";
    HttpHead head;
    ASSERT_TRUE(parse_http_head(text, strlen(text), head));

    std::string error;
    ASSERT_FALSE(validate_http_upgrade_response(head, "x", &error));
    ASSERT_EQ(error, std::string("server did not switch protocols"));
}

TEST(validate_upgrade_request_rejects_missing_key) {
    const char* text = "GET / HTTP/1.1\r\nHost: h\r\nUpgrade: websocket\r\n"
                       "Connection: Upgrade\r\nSec-WebSocket-Version: 13\r\n\r\n";
    HttpHead head;
    ASSERT_TRUE(parse_http_head(text, strlen(text), head));

    std::string key;
    std::string error;
    ASSERT_FALSE(validate_http_upgrade_request(head, key, &error));
    ASSERT_EQ(error, std::string("missing Sec-WebSocket-Key"));
}

TEST(bad_request_response_content_length) {
    std::string resp = build_bad_request_response("nope\n");
    ASSERT_NE(resp.find("400 Bad Request"), std::string::npos);
    ASSERT_NE(resp.find("Content-Length: 5\r\n"), std::string::npos);
    ASSERT_EQ(resp.substr(resp.size() - 5), std::string("nope\n"));
}

// ============================================================================
// Frames
// ============================================================================

TEST(build_unmasked_small_frame) {
    std::vector<uint8_t> out;
    const uint8_t payload[] = {'p', 'i', 'n', 'g'};
    size_t n = build_websocket_frame(WebSocketOpcode::BINARY, payload, 4, nullptr, out);

    ASSERT_EQ(n, 6u);
    ASSERT_EQ(out.size(), 6u);
    ASSERT_EQ(out[0], 0x82);  // FIN + BINARY
    ASSERT_EQ(out[1], 0x04);  // Unmasked, length 4
    ASSERT_EQ(as_string(out.data() + 2, 4), std::string("ping"));
}

TEST(build_masked_frame_roundtrip) {
    std::vector<uint8_t> out;
    const uint8_t mask[4] = {0x12, 0x34, 0x56, 0x78};
    std::string text = "hello\n";
    build_websocket_frame(WebSocketOpcode::BINARY,
                          reinterpret_cast<const uint8_t*>(text.data()), text.size(), mask, out);

    ASSERT_EQ(out.size(), 2u + 4u + text.size());
    ASSERT_EQ(out[1], 0x80 | 6);
    ASSERT_NE(as_string(out.data() + 6, 6), text);  // Masked on the wire

    WebSocketFrame frame;
    ASSERT_TRUE(parse_websocket_frame(out.data(), out.size(), frame) == FrameParseResult::COMPLETE);
    ASSERT_TRUE(frame.fin);
    ASSERT_TRUE(frame.masked);
    ASSERT_EQ(frame.header_len, 6u);
    ASSERT_EQ(frame.payload_len, 6u);

    unmask_payload(out.data() + frame.header_len, 6, frame.mask_key);
    ASSERT_EQ(as_string(out.data() + frame.header_len, 6), text);
}

TEST(extended_length_encodings) {
    std::vector<uint8_t> medium(300, 'a');
    std::vector<uint8_t> out;
    build_websocket_frame(WebSocketOpcode::BINARY, medium.data(), medium.size(), nullptr, out);
    ASSERT_EQ(out[1], WS_PAYLOAD_LEN_16BIT);
    ASSERT_EQ(out.size(), 4u + 300u);

    std::vector<uint8_t> large(70000, 'b');
    out.clear();
    build_websocket_frame(WebSocketOpcode::BINARY, large.data(), large.size(), nullptr, out);
    ASSERT_EQ(out[1], WS_PAYLOAD_LEN_64BIT);
    ASSERT_EQ(out.size(), 10u + 70000u);

    WebSocketFrame frame;
    ASSERT_TRUE(parse_websocket_frame(out.data(), out.size(), frame) == FrameParseResult::COMPLETE);
    ASSERT_EQ(frame.payload_len, 70000u);
    ASSERT_EQ(frame.header_len, 10u);
}

TEST(parse_incomplete_frames) {
    std::vector<uint8_t> out;
    std::vector<uint8_t> payload(300, 'x');
    build_websocket_frame(WebSocketOpcode::BINARY, payload.data(), payload.size(), nullptr, out);

    WebSocketFrame frame;
    ASSERT_TRUE(parse_websocket_frame(out.data(), 1, frame) == FrameParseResult::INCOMPLETE);
    ASSERT_TRUE(parse_websocket_frame(out.data(), 3, frame) == FrameParseResult::INCOMPLETE);
    ASSERT_TRUE(parse_websocket_frame(out.data(), out.size() - 1, frame) == FrameParseResult::INCOMPLETE);
    ASSERT_TRUE(parse_websocket_frame(out.data(), out.size(), frame) == FrameParseResult::COMPLETE);
}

TEST(parse_rejects_oversized_payload_early) {
    std::vector<uint8_t> out;
    std::vector<uint8_t> payload(1000, 'x');
    build_websocket_frame(WebSocketOpcode::BINARY, payload.data(), payload.size(), nullptr, out);

    // Only the header is present: the limit is enforced before buffering
    WebSocketFrame frame;
    ASSERT_TRUE(parse_websocket_frame(out.data(), 4, frame, 999) == FrameParseResult::TOO_LARGE);
    ASSERT_TRUE(parse_websocket_frame(out.data(), 4, frame, 1000) == FrameParseResult::INCOMPLETE);
}

TEST(opcode_classification) {
    ASSERT_TRUE(is_control_opcode(0x08));
    ASSERT_TRUE(is_control_opcode(0x09));
    ASSERT_TRUE(is_control_opcode(0x0A));
    ASSERT_FALSE(is_control_opcode(0x02));
    ASSERT_TRUE(is_known_opcode(0x00));
    ASSERT_FALSE(is_known_opcode(0x03));
    ASSERT_FALSE(is_known_opcode(0x0B));
}

TEST(close_payload) {
    std::vector<uint8_t> p = build_close_payload(CLOSE_NORMAL, "bye");
    ASSERT_EQ(p.size(), 5u);
    ASSERT_EQ(parse_close_status(p.data(), p.size()), CLOSE_NORMAL);

    ASSERT_TRUE(build_close_payload(CLOSE_NO_STATUS).empty());
    ASSERT_EQ(parse_close_status(nullptr, 0), CLOSE_NO_STATUS);

    std::string long_reason(200, 'r');
    ASSERT_EQ(build_close_payload(CLOSE_PROTOCOL_ERROR, long_reason).size(), MAX_CONTROL_PAYLOAD);
}

// ============================================================================
// URL parsing
// ============================================================================

TEST(url_defaults) {
    url::WebSocketUrl u;
    ASSERT_TRUE(url::parse_websocket_url("ws://example.com", u));
    ASSERT_FALSE(u.secure);
    ASSERT_EQ(u.host, std::string("example.com"));
    ASSERT_EQ(u.port, 80);
    ASSERT_EQ(u.path, std::string("/"));
    ASSERT_EQ(u.host_header(), std::string("example.com"));

    ASSERT_TRUE(url::parse_websocket_url("wss://example.com/feed", u));
    ASSERT_TRUE(u.secure);
    ASSERT_EQ(u.port, 443);
    ASSERT_EQ(u.path, std::string("/feed"));
}

TEST(url_port_query_fragment) {
    url::WebSocketUrl u;
    ASSERT_TRUE(url::parse_websocket_url("ws://host:8080/a/b?x=1#frag", u));
    ASSERT_EQ(u.port, 8080);
    ASSERT_EQ(u.path, std::string("/a/b?x=1"));
    ASSERT_EQ(u.host_header(), std::string("host:8080"));

    ASSERT_TRUE(url::parse_websocket_url("ws://host?token=abc", u));
    ASSERT_EQ(u.path, std::string("/?token=abc"));
}

TEST(url_ipv6) {
    url::WebSocketUrl u;
    ASSERT_TRUE(url::parse_websocket_url("ws://[::1]:9000/", u));
    ASSERT_EQ(u.host, std::string("::1"));
    ASSERT_EQ(u.port, 9000);
    ASSERT_EQ(u.host_header(), std::string("[::1]:9000"));
}

TEST(url_rejects_invalid) {
    url::WebSocketUrl u;
    ASSERT_FALSE(url::parse_websocket_url("http://example.com/", u));
    ASSERT_FALSE(url::parse_websocket_url("ws://", u));
    ASSERT_FALSE(url::parse_websocket_url("ws://host:0/", u));
    ASSERT_FALSE(url::parse_websocket_url("ws://host:65536/", u));
    ASSERT_FALSE(url::parse_websocket_url("ws://host:/", u));
    ASSERT_FALSE(url::parse_websocket_url("ws://host:80a/", u));
    ASSERT_FALSE(url::parse_websocket_url("ws://user@host/", u));
    ASSERT_FALSE(url::parse_websocket_url("ws://[::1/", u));
}

// ============================================================================
// Lossy UTF-8
// ============================================================================

TEST(lossy_text_passes_valid_utf8) {
    std::string s = "hello \xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80\n";
    ASSERT_EQ(text::to_lossy_utf8(reinterpret_cast<const uint8_t*>(s.data()), s.size()), s);
}

TEST(lossy_text_replaces_invalid_sequences) {
    const std::string r = text::REPLACEMENT_CHARACTER;

    const uint8_t lone[] = {'a', 0xFF, 'b'};
    ASSERT_EQ(text::to_lossy_utf8(lone, sizeof(lone)), "a" + r + "b");

    // Truncated 3-byte sequence at the end is one maximal subpart
    const uint8_t truncated[] = {'x', 0xE2, 0x82};
    ASSERT_EQ(text::to_lossy_utf8(truncated, sizeof(truncated)), "x" + r);

    // Surrogate encoding: each byte is invalid on its own
    const uint8_t surrogate[] = {0xED, 0xA0, 0x80};
    ASSERT_EQ(text::to_lossy_utf8(surrogate, sizeof(surrogate)), r + r + r);

    // Overlong encoding of '/'
    const uint8_t overlong[] = {0xC0, 0xAF};
    ASSERT_EQ(text::to_lossy_utf8(overlong, sizeof(overlong)), r + r);
}

// ============================================================================
// Logging
// ============================================================================

TEST(log_level_parse_and_filter) {
    log::Level saved = log::get_level();

    log::Level level = log::Level::ERROR;
    ASSERT_TRUE(log::parse_level("debug", level));
    ASSERT_TRUE(level == log::Level::VERBOSE);
    ASSERT_TRUE(log::parse_level("warn", level));
    ASSERT_TRUE(level == log::Level::WARN);
    ASSERT_FALSE(log::parse_level("DEBUG", level));
    ASSERT_FALSE(log::parse_level(nullptr, level));

    log::set_level(log::Level::INFO);
    ASSERT_TRUE(log::get_level() == log::Level::INFO);
    ASSERT_TRUE(log::enabled(log::Level::WARN));
    ASSERT_FALSE(log::enabled(log::Level::VERBOSE));

    log::set_level(saved);
}

int main() {
    return run_all_tests("core/http");
}
