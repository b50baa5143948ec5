// src/process/child_process.hpp
// ChildProcess - fork/exec a command with piped stdin/stdout
//
//   parent                        child
//   take_stdin()  FdWriter  --->  fd 0
//   take_stdout() FdReader  <---  fd 1
//                                 fd 2 inherited
//
// Exec failures are reported through a close-on-exec pipe: the parent reads
// the child's errno from it, or EOF once exec succeeded.

#pragma once

#include "core/log.hpp"
#include "transport/fd_stream.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <errno.h>
#include <cstdio>
#include <cstring>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

extern char** environ;

namespace wspump {
namespace process {

struct SpawnOptions {
    std::vector<std::string> argv;    // argv[0] is looked up in PATH
    bool pipe_stdin;                  // Otherwise inherited
    bool pipe_stdout;                 // Otherwise inherited
    std::string cwd;                  // Empty = inherit
    std::vector<std::pair<std::string, std::string>> env;  // Added/overridden variables

    SpawnOptions()
        : pipe_stdin(true)
        , pipe_stdout(true)
    {}
};

class ChildProcess {
public:
    ChildProcess() = default;

    ~ChildProcess() {
        if (running()) {
            ::kill(pid_, SIGKILL);
            int status;
            while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {}
        }
        close_fd(stdin_fd_);
        close_fd(stdout_fd_);
    }

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    ChildProcess(ChildProcess&& other) noexcept
        : pid_(other.pid_)
        , reaped_(other.reaped_)
        , stdin_fd_(other.stdin_fd_)
        , stdout_fd_(other.stdout_fd_)
    {
        other.pid_ = -1;
        other.reaped_ = false;
        other.stdin_fd_ = -1;
        other.stdout_fd_ = -1;
    }

    ChildProcess& operator=(ChildProcess&& other) noexcept {
        if (this != &other) {
            ChildProcess tmp(std::move(*this));
            pid_ = other.pid_;
            reaped_ = other.reaped_;
            stdin_fd_ = other.stdin_fd_;
            stdout_fd_ = other.stdout_fd_;
            other.pid_ = -1;
            other.reaped_ = false;
            other.stdin_fd_ = -1;
            other.stdout_fd_ = -1;
        }
        return *this;
    }

    /**
     * Start a command
     *
     * @throws std::runtime_error if argv is empty, pipes or fork fail, or
     *         the command cannot be executed
     */
    static ChildProcess spawn(const SpawnOptions& options) {
        if (options.argv.empty()) {
            throw std::runtime_error("spawn: empty command");
        }

        // Everything the child needs is prepared before fork
        std::vector<char*> argv;
        for (const auto& arg : options.argv) {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }
        argv.push_back(nullptr);

        std::vector<std::string> env_storage;
        std::vector<char*> envp;
        if (!options.env.empty()) {
            env_storage = merged_environment(options.env);
            for (auto& entry : env_storage) {
                envp.push_back(const_cast<char*>(entry.c_str()));
            }
            envp.push_back(nullptr);
        }

        int in_pipe[2] = {-1, -1};
        int out_pipe[2] = {-1, -1};
        int err_pipe[2] = {-1, -1};
        auto close_all = [&]() {
            for (int* p : {in_pipe, out_pipe, err_pipe}) {
                close_fd(p[0]);
                close_fd(p[1]);
            }
        };

        if ((options.pipe_stdin && ::pipe2(in_pipe, O_CLOEXEC) < 0) ||
            (options.pipe_stdout && ::pipe2(out_pipe, O_CLOEXEC) < 0) ||
            ::pipe2(err_pipe, O_CLOEXEC) < 0) {
            int err = errno;
            close_all();
            throw std::runtime_error(std::string("spawn: pipe2() failed: ") + strerror(err));
        }

        fflush(stdout);
        fflush(stderr);

        pid_t pid = ::fork();
        if (pid < 0) {
            int err = errno;
            close_all();
            throw std::runtime_error(std::string("spawn: fork() failed: ") + strerror(err));
        }

        if (pid == 0) {
            // Child: async-signal-safe calls only
            ::signal(SIGPIPE, SIG_DFL);
            if (in_pipe[0] >= 0 && ::dup2(in_pipe[0], STDIN_FILENO) < 0) exec_failed(err_pipe[1]);
            if (out_pipe[1] >= 0 && ::dup2(out_pipe[1], STDOUT_FILENO) < 0) exec_failed(err_pipe[1]);
            if (!options.cwd.empty() && ::chdir(options.cwd.c_str()) < 0) exec_failed(err_pipe[1]);

            if (envp.empty()) {
                ::execvp(argv[0], argv.data());
            } else {
                ::execvpe(argv[0], argv.data(), envp.data());
            }
            exec_failed(err_pipe[1]);
        }

        // Parent
        close_fd(in_pipe[0]);
        close_fd(out_pipe[1]);
        close_fd(err_pipe[1]);

        int child_errno = 0;
        ssize_t n;
        do {
            n = ::read(err_pipe[0], &child_errno, sizeof(child_errno));
        } while (n < 0 && errno == EINTR);
        close_fd(err_pipe[0]);

        ChildProcess child;
        child.pid_ = pid;
        child.stdin_fd_ = in_pipe[1];
        child.stdout_fd_ = out_pipe[0];

        if (n == static_cast<ssize_t>(sizeof(child_errno))) {
            child.wait();
            throw std::runtime_error("spawn: cannot execute '" + options.argv[0] + "': " +
                                     strerror(child_errno));
        }

        WSPUMP_LOG_INFO("PROCESS", "Spawned '%s' (PID %d)", options.argv[0].c_str(), static_cast<int>(pid));
        return child;
    }

    /**
     * Take ownership of the write end of the child's stdin
     *
     * @return std::nullopt if stdin was not piped or already taken
     */
    std::optional<transport::FdWriter> take_stdin() {
        if (stdin_fd_ < 0) return std::nullopt;
        int fd = stdin_fd_;
        stdin_fd_ = -1;
        return transport::FdWriter(fd, true);
    }

    /**
     * Take ownership of the read end of the child's stdout
     *
     * @return std::nullopt if stdout was not piped or already taken
     */
    std::optional<transport::FdReader> take_stdout() {
        if (stdout_fd_ < 0) return std::nullopt;
        int fd = stdout_fd_;
        stdout_fd_ = -1;
        return transport::FdReader(fd, true);
    }

    /**
     * Send SIGKILL
     *
     * @return 0 or errno (ESRCH once the child has been reaped)
     */
    int kill() {
        if (!running()) return ESRCH;
        return ::kill(pid_, SIGKILL) == 0 ? 0 : errno;
    }

    /**
     * Block until the child exits and reap it
     *
     * @return Exit code, 128 + signal number if killed, -1 on error (errno set)
     */
    int wait() {
        if (!running()) {
            errno = ECHILD;
            return -1;
        }
        int status = 0;
        pid_t r;
        do {
            r = ::waitpid(pid_, &status, 0);
        } while (r < 0 && errno == EINTR);
        if (r < 0) {
            return -1;
        }
        reaped_ = true;

        if (WIFEXITED(status)) return WEXITSTATUS(status);
        if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
        return -1;
    }

    pid_t pid() const { return pid_; }

    /**
     * true from spawn until the child is reaped
     */
    bool running() const { return pid_ > 0 && !reaped_; }

private:
    static void close_fd(int& fd) {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }

    [[noreturn]] static void exec_failed(int err_fd) {
        int err = errno;
        ssize_t ignored = ::write(err_fd, &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    static std::vector<std::string> merged_environment(
            const std::vector<std::pair<std::string, std::string>>& extra) {
        std::vector<std::string> out;
        for (char** e = environ; e && *e; ++e) {
            std::string entry(*e);
            std::string name = entry.substr(0, entry.find('='));
            bool overridden = false;
            for (const auto& kv : extra) {
                if (kv.first == name) {
                    overridden = true;
                    break;
                }
            }
            if (!overridden) {
                out.push_back(std::move(entry));
            }
        }
        for (const auto& kv : extra) {
            out.push_back(kv.first + "=" + kv.second);
        }
        return out;
    }

    pid_t pid_ = -1;
    bool reaped_ = false;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
};

}  // namespace process
}  // namespace wspump
