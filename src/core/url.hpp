// src/core/url.hpp
// Minimal ws:// / wss:// URL parser
//
// Accepts:
//   ws://host[:port][/path[?query]]
//   wss://host[:port][/path[?query]]
//   ws://[::1]:8080/path            (bracketed IPv6 literal)
//
// Rejects anything else without attempting full RFC 3986 compliance.

#pragma once

#include <cstdint>
#include <cstdlib>
#include <string>

namespace wspump {
namespace url {

struct WebSocketUrl {
    bool secure = false;    // true = wss
    std::string host;       // Without IPv6 brackets
    uint16_t port = 0;
    std::string path;       // Path + query, always starts with '/'

    /**
     * Host header value: host, bracketed if IPv6, with ":port" when the port
     * is not the scheme default
     */
    std::string host_header() const {
        std::string h = (host.find(':') != std::string::npos) ? "[" + host + "]" : host;
        uint16_t default_port = secure ? 443 : 80;
        if (port != default_port) {
            h += ":";
            h += std::to_string(port);
        }
        return h;
    }
};

/**
 * Parse a WebSocket URL
 *
 * @return false if the URL is malformed (out is left partially filled)
 */
inline bool parse_websocket_url(const std::string& text, WebSocketUrl& out) {
    out = WebSocketUrl{};

    size_t pos = 0;
    if (text.compare(0, 5, "ws://") == 0) {
        out.secure = false;
        pos = 5;
    } else if (text.compare(0, 6, "wss://") == 0) {
        out.secure = true;
        pos = 6;
    } else {
        return false;
    }

    // Authority ends at the first '/' or '?'
    size_t auth_end = text.find_first_of("/?", pos);
    std::string authority = (auth_end == std::string::npos)
        ? text.substr(pos)
        : text.substr(pos, auth_end - pos);
    if (authority.empty() || authority.find('@') != std::string::npos) {
        return false;
    }

    std::string port_text;
    if (authority[0] == '[') {
        size_t close = authority.find(']');
        if (close == std::string::npos || close == 1) {
            return false;
        }
        out.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') {
                return false;
            }
            port_text = authority.substr(close + 2);
            if (port_text.empty()) return false;
        }
    } else {
        size_t colon = authority.find(':');
        if (colon != std::string::npos) {
            out.host = authority.substr(0, colon);
            port_text = authority.substr(colon + 1);
            if (port_text.empty()) return false;
        } else {
            out.host = authority;
        }
    }

    if (out.host.empty()) {
        return false;
    }

    if (port_text.empty()) {
        out.port = out.secure ? 443 : 80;
    } else {
        if (port_text.size() > 5) return false;
        for (char c : port_text) {
            if (c < '0' || c > '9') return false;
        }
        unsigned long p = std::strtoul(port_text.c_str(), nullptr, 10);
        if (p == 0 || p > 65535) {
            return false;
        }
        out.port = static_cast<uint16_t>(p);
    }

    if (auth_end == std::string::npos) {
        out.path = "/";
    } else if (text[auth_end] == '?') {
        out.path = "/" + text.substr(auth_end);
    } else {
        out.path = text.substr(auth_end);
    }

    // Fragments are never sent to the server
    size_t hash = out.path.find('#');
    if (hash != std::string::npos) {
        out.path.erase(hash);
    }

    return true;
}

}  // namespace url
}  // namespace wspump
