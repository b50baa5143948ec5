// src/pump/config.hpp
// Pump tuning knobs
//
// Defaults:
//   tick                 10 ms    framed read deadline (bounds outbound latency)
//   inactivity timeout   60 s     no data in either direction ends the session
//   transfer buffer      1 MiB    largest chunk read from the local source
//
// Environment overrides (PumpConfig::from_env):
//   WSPUMP_TICK_MS, WSPUMP_TIMEOUT_MS, WSPUMP_BUFFER_SIZE, WSPUMP_ECHO=1

#pragma once

#include "core/log.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace wspump {
namespace pump {

inline constexpr uint32_t DEFAULT_TICK_MS = 10;
inline constexpr uint32_t DEFAULT_TIMEOUT_MS = 60 * 1000;
inline constexpr size_t DEFAULT_BUFFER_SIZE = 1 << 20;

struct PumpConfig {
    uint32_t tick_ms;
    uint32_t inactivity_timeout_ms;
    size_t buffer_size;
    bool echo;                 // Mirror traffic to echo_stream
    FILE* echo_stream;         // Defaults to stdout

    PumpConfig()
        : tick_ms(DEFAULT_TICK_MS)
        , inactivity_timeout_ms(DEFAULT_TIMEOUT_MS)
        , buffer_size(DEFAULT_BUFFER_SIZE)
        , echo(false)
        , echo_stream(stdout)
    {}

    /**
     * Defaults with environment overrides applied. Invalid values are
     * reported and ignored.
     */
    static PumpConfig from_env() {
        PumpConfig config;
        config.apply_env();
        return config;
    }

    void apply_env() {
        uint64_t value;
        if (read_env_u64("WSPUMP_TICK_MS", 1, 60 * 1000, value)) {
            tick_ms = static_cast<uint32_t>(value);
        }
        if (read_env_u64("WSPUMP_TIMEOUT_MS", 1, 24ull * 3600 * 1000, value)) {
            inactivity_timeout_ms = static_cast<uint32_t>(value);
        }
        if (read_env_u64("WSPUMP_BUFFER_SIZE", 1, 64ull << 20, value)) {
            buffer_size = static_cast<size_t>(value);
        }
        const char* e = getenv("WSPUMP_ECHO");
        if (e && *e) {
            echo = strcmp(e, "0") != 0;
        }
    }

    /**
     * @return false with a logged reason if the values cannot run a session
     */
    bool validate() const {
        if (tick_ms == 0) {
            WSPUMP_LOG_ERROR("CONFIG", "tick_ms must be > 0");
            return false;
        }
        if (inactivity_timeout_ms == 0) {
            WSPUMP_LOG_ERROR("CONFIG", "inactivity_timeout_ms must be > 0");
            return false;
        }
        if (buffer_size == 0) {
            WSPUMP_LOG_ERROR("CONFIG", "buffer_size must be > 0");
            return false;
        }
        if (echo && !echo_stream) {
            WSPUMP_LOG_ERROR("CONFIG", "echo enabled without an echo stream");
            return false;
        }
        return true;
    }

private:
    static bool read_env_u64(const char* name, uint64_t min, uint64_t max, uint64_t& out) {
        const char* text = getenv(name);
        if (!text || !*text) return false;

        char* end = nullptr;
        errno = 0;
        unsigned long long v = strtoull(text, &end, 10);
        if (errno != 0 || *end != '\0' || v < min || v > max) {
            WSPUMP_LOG_WARN("CONFIG", "Ignoring %s=%s (expected %llu..%llu)",
                            name, text,
                            static_cast<unsigned long long>(min),
                            static_cast<unsigned long long>(max));
            return false;
        }
        out = v;
        return true;
    }
};

}  // namespace pump
}  // namespace wspump
