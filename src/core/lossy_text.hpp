// src/core/lossy_text.hpp
// Best-effort UTF-8 rendering of arbitrary bytes for the echo side-channel
//
// Valid UTF-8 is copied through. Each maximal invalid subsequence is replaced
// by U+FFFD (EF BF BD), following the Unicode "substitution of maximal
// subparts" practice.

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace wspump {
namespace text {

inline constexpr const char* REPLACEMENT_CHARACTER = "\xEF\xBF\xBD";

/**
 * Length of the valid UTF-8 sequence starting at data[0], or the number of
 * bytes forming the maximal invalid prefix (as a negative value).
 */
inline int utf8_sequence(const uint8_t* data, size_t len) {
    uint8_t b0 = data[0];
    if (b0 < 0x80) return 1;

    size_t need;
    uint8_t lo = 0x80;
    uint8_t hi = 0xBF;

    if (b0 >= 0xC2 && b0 <= 0xDF) {
        need = 2;
    } else if (b0 >= 0xE0 && b0 <= 0xEF) {
        need = 3;
        if (b0 == 0xE0) lo = 0xA0;        // Overlong
        if (b0 == 0xED) hi = 0x9F;        // Surrogates
    } else if (b0 >= 0xF0 && b0 <= 0xF4) {
        need = 4;
        if (b0 == 0xF0) lo = 0x90;        // Overlong
        if (b0 == 0xF4) hi = 0x8F;        // > U+10FFFF
    } else {
        return -1;
    }

    for (size_t i = 1; i < need; i++) {
        if (i >= len) return -static_cast<int>(i);
        uint8_t b = data[i];
        uint8_t l = (i == 1) ? lo : 0x80;
        uint8_t h = (i == 1) ? hi : 0xBF;
        if (b < l || b > h) return -static_cast<int>(i);
    }
    return static_cast<int>(need);
}

inline std::string to_lossy_utf8(const uint8_t* data, size_t len) {
    std::string out;
    out.reserve(len);

    size_t i = 0;
    while (i < len) {
        int n = utf8_sequence(data + i, len - i);
        if (n > 0) {
            out.append(reinterpret_cast<const char*>(data + i), static_cast<size_t>(n));
            i += static_cast<size_t>(n);
        } else {
            out += REPLACEMENT_CHARACTER;
            i += static_cast<size_t>(-n);
        }
    }
    return out;
}

}  // namespace text
}  // namespace wspump
