// tools/wspump.cpp
// Command-line front end: tunnel a process or the terminal over a WebSocket
//
// Usage:
//   wspump connect [options] <ws-url> [-- command args...]
//   wspump serve   [options] --port N -- command args...
//
// connect: without a command the tool's own stdin/stdout are bridged.
// serve:   every accepted connection is handled in a forked child that
//          spawns the command and bridges it to the connection.

#include "wspump.hpp"

#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <optional>
#include <string>
#include <vector>

using namespace wspump;

namespace {

struct Options {
    std::string mode;
    std::string url;
    uint16_t port = 0;
    std::string bind_addr = "0.0.0.0";
    http::HeaderList headers;
    ssl::TlsConfig tls;
    pump::PumpConfig pump;
    std::vector<std::string> command;
};

void print_usage(const char* prog) {
    printf("Usage:\n");
    printf("  %s connect [options] <ws-url> [-- command args...]\n", prog);
    printf("  %s serve [options] --port N -- command args...\n\n", prog);
    printf("Options:\n");
    printf("  --echo            Mirror relayed data to stdout\n");
    printf("  --tick-ms N       Read deadline for the framed reader (default %u)\n", pump::DEFAULT_TICK_MS);
    printf("  --timeout-ms N    Inactivity timeout (default %u)\n", pump::DEFAULT_TIMEOUT_MS);
    printf("  --insecure        Skip TLS certificate verification\n");
    printf("  --ca-file PATH    Verify against this PEM bundle\n");
    printf("  --header K:V      Extra request header (connect only, repeatable)\n");
    printf("  --bind ADDR       Listen address for serve (default 0.0.0.0)\n");
    printf("  -v                Info logging (-vv for debug)\n");
    printf("  -h                Show this help\n");
}

uint32_t parse_u32(const char* opt, const char* text) {
    char* end = nullptr;
    errno = 0;
    unsigned long value = strtoul(text, &end, 10);
    if (errno != 0 || end == text || *end != '\0' || value == 0 || value > 0xFFFFFFFFul) {
        log::crash("Invalid value for %s: '%s'", opt, text);
    }
    return static_cast<uint32_t>(value);
}

Options parse_args(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        exit(1);
    }

    Options opts;
    opts.pump = pump::PumpConfig::from_env();

    int i = 1;
    if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
        print_usage(argv[0]);
        exit(0);
    }
    opts.mode = argv[i++];
    if (opts.mode != "connect" && opts.mode != "serve") {
        log::crash("Unknown mode '%s' (expected connect or serve)", opts.mode.c_str());
    }

    for (; i < argc; i++) {
        std::string arg = argv[i];
        auto value = [&]() -> const char* {
            if (i + 1 >= argc) {
                log::crash("%s needs a value", arg.c_str());
            }
            return argv[++i];
        };

        if (arg == "--") {
            for (i++; i < argc; i++) {
                opts.command.push_back(argv[i]);
            }
            break;
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            exit(0);
        } else if (arg == "-v") {
            // Never quieter than WSPUMP_LOG_LEVEL asked for
            if (log::get_level() < log::Level::INFO) {
                log::set_level(log::Level::INFO);
            }
        } else if (arg == "-vv") {
            log::set_level(log::Level::VERBOSE);
        } else if (arg == "--echo") {
            opts.pump.echo = true;
        } else if (arg == "--tick-ms") {
            opts.pump.tick_ms = parse_u32("--tick-ms", value());
        } else if (arg == "--timeout-ms") {
            opts.pump.inactivity_timeout_ms = parse_u32("--timeout-ms", value());
        } else if (arg == "--insecure") {
            opts.tls.verify_peer = false;
        } else if (arg == "--ca-file") {
            opts.tls.ca_file = value();
        } else if (arg == "--header") {
            std::string header = value();
            size_t colon = header.find(':');
            if (colon == std::string::npos || colon == 0) {
                log::crash("Invalid header '%s' (expected K:V)", header.c_str());
            }
            std::string name = header.substr(0, colon);
            std::string val = header.substr(colon + 1);
            size_t start = val.find_first_not_of(' ');
            val = (start == std::string::npos) ? std::string() : val.substr(start);
            opts.headers.emplace_back(name, val);
        } else if (arg == "--port") {
            uint32_t port = parse_u32("--port", value());
            if (port > 65535) {
                log::crash("Invalid port %u", port);
            }
            opts.port = static_cast<uint16_t>(port);
        } else if (arg == "--bind") {
            opts.bind_addr = value();
        } else if (!arg.empty() && arg[0] == '-') {
            log::crash("Unknown option '%s'", arg.c_str());
        } else if (opts.url.empty() && opts.mode == "connect") {
            opts.url = arg;
        } else {
            log::crash("Unexpected argument '%s'", arg.c_str());
        }
    }

    if (!opts.pump.validate()) {
        log::crash("Invalid pump configuration");
    }
    return opts;
}

const char* describe(const std::optional<pump::BridgeReport>& report) {
    return report ? pump::termination_cause_name(report->cause) : "no session";
}

// Bridge conn to the command, or to our own stdin/stdout without one
template<typename Stream>
int run_session(ws::WebSocketConnection<Stream>& conn, const Options& opts) {
    std::optional<pump::BridgeReport> report;

    if (opts.command.empty()) {
        transport::FdWriter out = transport::FdWriter::stdout_writer();
        report = pump::connect_streams(conn, transport::FdReader::stdin_reader(), out, opts.pump);
    } else {
        process::SpawnOptions spawn;
        spawn.argv = opts.command;
        process::ChildProcess child;
        try {
            child = process::ChildProcess::spawn(spawn);
        } catch (const std::exception& e) {
            WSPUMP_LOG_ERROR("WSPUMP", "%s", e.what());
            conn.close(http::CLOSE_INTERNAL_ERROR, "spawn failed");
            return 1;
        }
        report = pump::connect_process(conn, child, opts.pump);
    }

    conn.close();
    WSPUMP_LOG_INFO("WSPUMP", "Done: %s", describe(report));
    return (report && !report->setup_failed()) ? 0 : 1;
}

int run_connect(const Options& opts) {
    if (opts.url.empty()) {
        log::crash("connect: missing URL");
    }
    url::WebSocketUrl target;
    if (!url::parse_websocket_url(opts.url, target)) {
        log::crash("Invalid WebSocket URL '%s'", opts.url.c_str());
    }

    try {
        if (target.secure) {
            TlsConnection conn = open_tls(target, opts.tls, opts.headers);
            WSPUMP_LOG_INFO("WSPUMP", "Connected to %s", opts.url.c_str());
            return run_session(conn, opts);
        }
        PlainConnection conn = open_plain(target, opts.headers);
        WSPUMP_LOG_INFO("WSPUMP", "Connected to %s", opts.url.c_str());
        return run_session(conn, opts);
    } catch (const std::exception& e) {
        log::crash("%s: %s", opts.url.c_str(), e.what());
    }
}

// Runs in the forked per-connection child
[[noreturn]] void serve_connection(transport::BSDSocket sock, const Options& opts) {
    int rc = 1;
    try {
        std::string path;
        PlainConnection conn = ws::server_handshake(std::move(sock), ws::ConnectionConfig(), &path);
        WSPUMP_LOG_INFO("SERVE", "Upgraded %s (PID %d)", path.c_str(), static_cast<int>(getpid()));
        rc = run_session(conn, opts);
    } catch (const std::exception& e) {
        WSPUMP_LOG_WARN("SERVE", "Connection failed: %s", e.what());
    }
    fflush(stdout);
    fflush(stderr);
    _exit(rc);
}

void reap_children() {
    int status;
    pid_t pid;
    while ((pid = waitpid(-1, &status, WNOHANG)) > 0) {
        WSPUMP_LOG_DEBUG("SERVE", "Reaped PID %d (status %d)", static_cast<int>(pid), status);
    }
}

int run_serve(const Options& opts) {
    if (opts.command.empty()) {
        log::crash("serve: missing command (use -- command args...)");
    }
    if (opts.port == 0) {
        log::crash("serve: missing --port");
    }

    transport::Listener listener;
    try {
        listener.listen(opts.bind_addr, opts.port);
    } catch (const std::exception& e) {
        log::crash("%s", e.what());
    }
    WSPUMP_LOG_INFO("SERVE", "Listening on %s:%u", opts.bind_addr.c_str(), listener.local_port());

    for (;;) {
        transport::BSDSocket sock = listener.accept();
        reap_children();
        if (!sock.is_connected()) {
            WSPUMP_LOG_WARN("SERVE", "accept() failed: %s", strerror(errno));
            continue;
        }

        fflush(stdout);
        fflush(stderr);
        pid_t pid = fork();
        if (pid < 0) {
            WSPUMP_LOG_ERROR("SERVE", "fork() failed: %s", strerror(errno));
            continue;
        }
        if (pid == 0) {
            listener.close();
            serve_connection(std::move(sock), opts);
        }
        WSPUMP_LOG_DEBUG("SERVE", "Connection handed to PID %d", static_cast<int>(pid));
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    // Writes to a dead peer or child must fail with EPIPE, not kill us
    signal(SIGPIPE, SIG_IGN);
    log::init_from_env();

    Options opts = parse_args(argc, argv);
    if (opts.mode == "connect") {
        return run_connect(opts);
    }
    return run_serve(opts);
}
