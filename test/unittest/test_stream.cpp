// test/unittest/test_stream.cpp
// Unit tests for read deadline / no-delay control on BSDSocket and TlsStream,
// and for the FdReader/FdWriter endpoint halves

#include "policy/ssl.hpp"
#include "transport/bsd_socket.hpp"
#include "transport/fd_stream.hpp"
#include "transport/listener.hpp"
#include "test_harness.hpp"

#include <errno.h>
#include <pthread.h>
#include <signal.h>
#include <chrono>
#include <cstring>
#include <optional>
#include <string>

using namespace wspump;
using namespace std::chrono;

// Connected TCP pair on the loopback interface
struct LoopbackPair {
    transport::BSDSocket client;
    transport::BSDSocket server;

    LoopbackPair() {
        transport::Listener listener;
        listener.listen("127.0.0.1", 0);
        client.connect("127.0.0.1", listener.local_port());
        server = listener.accept();
        if (!server.is_connected()) {
            throw std::runtime_error("accept() failed");
        }
    }
};

TEST(deadline_expiry_surfaces_as_eagain) {
    SocketPairHelper sp;
    transport::BSDSocket sock(sp.release_a());

    ASSERT_EQ(sock.set_read_deadline(milliseconds(30)), 0);
    ASSERT_TRUE(sock.read_deadline().has_value());
    // The kernel stores the timeout in jiffies, so allow for rounding
    ASSERT_GT(sock.read_deadline()->count(), 25);
    ASSERT_LT(sock.read_deadline()->count(), 50);

    char buf[16];
    auto start = steady_clock::now();
    ssize_t n = sock.read(buf, sizeof(buf));
    auto elapsed = duration_cast<milliseconds>(steady_clock::now() - start);

    ASSERT_EQ(n, -1);
    ASSERT_TRUE(errno == EAGAIN || errno == EWOULDBLOCK);
    ASSERT_GT(elapsed.count(), 15);
    ASSERT_LT(elapsed.count(), 2000);
}

TEST(deadline_does_not_delay_available_data) {
    SocketPairHelper sp;
    transport::BSDSocket sock(sp.release_a());
    ASSERT_EQ(sock.set_read_deadline(milliseconds(1000)), 0);

    ASSERT_EQ(write(sp.b, "abc", 3), 3);
    char buf[16];
    ASSERT_EQ(sock.read(buf, sizeof(buf)), 3);
    ASSERT_EQ(std::string(buf, 3), std::string("abc"));
}

TEST(clear_deadline) {
    SocketPairHelper sp;
    transport::BSDSocket sock(sp.release_a());

    ASSERT_EQ(sock.set_read_deadline(milliseconds(10)), 0);
    ASSERT_EQ(sock.set_read_deadline(std::nullopt), 0);
    ASSERT_FALSE(sock.read_deadline().has_value());
}

TEST(zero_deadline_rejected) {
    SocketPairHelper sp;
    transport::BSDSocket sock(sp.release_a());

    ASSERT_EQ(sock.set_read_deadline(milliseconds(0)), EINVAL);
    ASSERT_FALSE(sock.read_deadline().has_value());
}

TEST(closed_socket_reports_ebadf) {
    transport::BSDSocket sock;
    ASSERT_EQ(sock.set_read_deadline(milliseconds(10)), EBADF);
    ASSERT_EQ(sock.set_nodelay(true), EBADF);
}

TEST(nodelay_toggle_on_tcp) {
    LoopbackPair pair;

    ASSERT_EQ(pair.client.set_nodelay(true), 0);
    ASSERT_TRUE(pair.client.nodelay());
    ASSERT_EQ(pair.client.set_nodelay(false), 0);
    ASSERT_FALSE(pair.client.nodelay());
}

TEST(nodelay_fails_on_unix_socket) {
    SocketPairHelper sp;
    transport::BSDSocket sock(sp.release_a());
    ASSERT_NE(sock.set_nodelay(true), 0);
}

TEST(tls_stream_unwraps_to_raw_socket) {
    LoopbackPair pair;
    ssl::TlsStream<> tls(std::move(pair.client));

    ASSERT_EQ(tls.set_read_deadline(milliseconds(25)), 0);
    ASSERT_TRUE(tls.get_socket().read_deadline().has_value());
    ASSERT_GT(tls.get_socket().read_deadline()->count(), 20);
    ASSERT_LT(tls.get_socket().read_deadline()->count(), 50);

    ASSERT_EQ(tls.set_nodelay(true), 0);
    ASSERT_TRUE(tls.get_socket().nodelay());

    ASSERT_EQ(tls.set_read_deadline(std::nullopt), 0);
    ASSERT_FALSE(tls.get_socket().read_deadline().has_value());
    ASSERT_EQ(tls.set_nodelay(false), 0);
    ASSERT_FALSE(tls.get_socket().nodelay());
}

TEST(tls_stream_read_before_handshake) {
    LoopbackPair pair;
    ssl::TlsStream<> tls(std::move(pair.client));

    char buf[4];
    ASSERT_EQ(tls.read(buf, sizeof(buf)), -1);
    ASSERT_EQ(errno, EBADF);
}

TEST(tls_handshake_failure_throws) {
    LoopbackPair pair;
    // Peer speaks plain text: the handshake must fail, not hang
    ASSERT_EQ(write(pair.server.get_fd(), "HTTP/1.1 400 Bad Request\r\n\r\n", 28), 28);
    pair.server.shutdown_write();

    ssl::TlsStream<> tls(std::move(pair.client));
    ssl::TlsConfig cfg;
    cfg.verify_peer = false;

    bool threw = false;
    try {
        tls.handshake("localhost", cfg);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    ASSERT_TRUE(threw);
}

TEST(fd_reader_writer_over_pipe) {
    PipeHelper pipe;
    transport::FdReader reader(pipe.release_read(), true);
    transport::FdWriter writer(pipe.release_write(), true);

    const uint8_t data[] = {'r', 'e', 'a', 'd', 'y'};
    ASSERT_TRUE(writer.write_all(data, sizeof(data)));
    writer.close();

    char buf[16];
    ASSERT_EQ(reader.read(buf, sizeof(buf)), 5);
    ASSERT_EQ(std::string(buf, 5), std::string("ready"));
    ASSERT_EQ(reader.read(buf, sizeof(buf)), 0);
}

TEST(fd_writer_reports_broken_pipe) {
    PipeHelper pipe;
    transport::FdWriter writer(pipe.release_write(), true);
    close(pipe.read_fd);
    pipe.read_fd = -1;

    const uint8_t data[] = {'x'};
    ASSERT_FALSE(writer.write_all(data, 1));
    ASSERT_EQ(errno, EPIPE);
}

TEST(fd_writer_epipe_with_default_sigpipe_action) {
    // SIGPIPE at its default action would kill the child with status 141
    int status = run_in_child([]() {
        PipeHelper pipe;
        transport::FdWriter writer(pipe.release_write(), true);
        close(pipe.read_fd);
        pipe.read_fd = -1;

        const uint8_t data[] = {'x', 'y'};
        if (writer.write_all(data, sizeof(data))) return 1;
        if (errno != EPIPE) return 2;

        // Nothing left pending, and the mask is back to what it was
        sigset_t set;
        sigemptyset(&set);
        sigpending(&set);
        if (sigismember(&set, SIGPIPE)) return 3;
        sigemptyset(&set);
        pthread_sigmask(SIG_BLOCK, nullptr, &set);
        if (sigismember(&set, SIGPIPE)) return 4;
        return 0;
    });
    ASSERT_TRUE(exited_cleanly(status));
}

TEST(non_owning_halves_leave_fd_open) {
    PipeHelper pipe;
    {
        transport::FdWriter writer(pipe.write_fd, false);
    }
    ASSERT_EQ(write(pipe.write_fd, "x", 1), 1);
}

int main() {
    return run_all_tests("Stream");
}
