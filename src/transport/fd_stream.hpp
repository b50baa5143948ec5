// src/transport/fd_stream.hpp
// FdReader / FdWriter - halves of a duplex byte endpoint over descriptors
//
// Back either a single bidirectional socket (both halves share one fd, only
// one of them owns it), two process pipes, or the tool's own stdin/stdout
// (non-owning).
//
// FdWriter never raises SIGPIPE: a write to a pipe whose reader is gone
// fails with EPIPE like any other write error, whatever the process-wide
// SIGPIPE disposition is.

#pragma once

#include "transport/stream.hpp"

#include <pthread.h>
#include <signal.h>
#include <time.h>
#include <unistd.h>
#include <errno.h>
#include <cstddef>
#include <cstdint>

namespace wspump {
namespace transport {

namespace detail {

// Move-only descriptor holder; closes on destruction when owning
class FdHandle {
public:
    FdHandle() : fd_(-1), owned_(false) {}
    FdHandle(int fd, bool owned) : fd_(fd), owned_(owned) {}

    ~FdHandle() {
        reset();
    }

    FdHandle(const FdHandle&) = delete;
    FdHandle& operator=(const FdHandle&) = delete;

    FdHandle(FdHandle&& other) noexcept : fd_(other.fd_), owned_(other.owned_) {
        other.fd_ = -1;
        other.owned_ = false;
    }

    FdHandle& operator=(FdHandle&& other) noexcept {
        if (this != &other) {
            reset();
            fd_ = other.fd_;
            owned_ = other.owned_;
            other.fd_ = -1;
            other.owned_ = false;
        }
        return *this;
    }

    void reset() {
        if (owned_ && fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = -1;
        owned_ = false;
    }

    int get() const { return fd_; }
    bool owned() const { return owned_; }

private:
    int fd_;
    bool owned_;
};

/**
 * Blocks SIGPIPE in the calling thread for its lifetime. A SIGPIPE raised
 * meanwhile by our own write is consumed before the old mask is restored;
 * one that was already pending stays pending.
 */
class SigpipeBlock {
public:
    SigpipeBlock() {
        sigemptyset(&pipe_set_);
        sigaddset(&pipe_set_, SIGPIPE);

        sigset_t pending;
        sigemptyset(&pending);
        sigpending(&pending);
        was_pending_ = sigismember(&pending, SIGPIPE) == 1;

        blocked_ = pthread_sigmask(SIG_BLOCK, &pipe_set_, &old_mask_) == 0;
    }

    ~SigpipeBlock() {
        if (!blocked_) return;
        int saved_errno = errno;
        if (raised_ && !was_pending_) {
            struct timespec zero = {0, 0};
            while (sigtimedwait(&pipe_set_, nullptr, &zero) < 0 && errno == EINTR) {}
        }
        pthread_sigmask(SIG_SETMASK, &old_mask_, nullptr);
        errno = saved_errno;
    }

    SigpipeBlock(const SigpipeBlock&) = delete;
    SigpipeBlock& operator=(const SigpipeBlock&) = delete;

    // Record that a write failed with EPIPE
    void note_epipe() { raised_ = true; }

private:
    sigset_t pipe_set_;
    sigset_t old_mask_;
    bool was_pending_ = false;
    bool blocked_ = false;
    bool raised_ = false;
};

}  // namespace detail

/**
 * FdReader - read half (ByteSource)
 */
class FdReader {
public:
    FdReader() = default;

    /**
     * @param fd Descriptor to read from
     * @param owned Close fd when this reader is destroyed
     */
    FdReader(int fd, bool owned) : handle_(fd, owned) {}

    static FdReader stdin_reader() {
        return FdReader(STDIN_FILENO, false);
    }

    /**
     * Blocking read, retried on EINTR
     */
    ssize_t read(void* buf, size_t len) {
        if (handle_.get() < 0) {
            errno = EBADF;
            return -1;
        }
        ssize_t n;
        do {
            n = ::read(handle_.get(), buf, len);
        } while (n < 0 && errno == EINTR);
        return n;
    }

    void close() { handle_.reset(); }
    int get_fd() const { return handle_.get(); }

private:
    detail::FdHandle handle_;
};

/**
 * FdWriter - write half (ByteSink)
 */
class FdWriter {
public:
    FdWriter() = default;
    FdWriter(int fd, bool owned) : handle_(fd, owned) {}

    static FdWriter stdout_writer() {
        return FdWriter(STDOUT_FILENO, false);
    }

    /**
     * Write the whole buffer, looping over short writes
     *
     * @return false on the first failed write (errno preserved, EPIPE
     *         when the reading end is closed)
     */
    bool write_all(const uint8_t* data, size_t len) {
        if (handle_.get() < 0) {
            errno = EBADF;
            return false;
        }
        detail::SigpipeBlock no_sigpipe;
        size_t done = 0;
        while (done < len) {
            ssize_t n = ::write(handle_.get(), data + done, len - done);
            if (n < 0) {
                if (errno == EINTR) continue;
                if (errno == EPIPE) no_sigpipe.note_epipe();
                return false;
            }
            if (n == 0) {
                errno = EIO;
                return false;
            }
            done += static_cast<size_t>(n);
        }
        return true;
    }

    void close() { handle_.reset(); }
    int get_fd() const { return handle_.get(); }

private:
    detail::FdHandle handle_;
};

static_assert(ByteSource<FdReader>);
static_assert(ByteSink<FdWriter>);

}  // namespace transport
}  // namespace wspump
