#pragma once

#include "hostmux/format.hpp"

extern "C" {
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
}

#include <cerrno>
#include <chrono>
#include <cstring>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

extern char** environ;

namespace hostmux::internal::process {

    using namespace hostmux::literals;

    struct child_process {
        pid_t pid{-1};
        int stdin_fd{-1};
        int stdout_fd{-1};
        int stderr_fd{-1};
    };

    struct spawn_result {
        std::optional<child_process> child{};
        std::string error{};
    };

    struct subprocess_result {
        int exit_code{};
        std::string stdout_output{};
        std::string stderr_output{};
        bool timed_out{false};
    };

    inline void ignore_sigpipe() {
        static const bool installed = [] {
            ::signal(SIGPIPE, SIG_IGN);
            return true;
        }();
        (void)installed;
    }

    inline bool set_nonblocking(int fd) {
        int flags = ::fcntl(fd, F_GETFL, 0);
        return flags >= 0 && ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
    }

    inline void close_fd(int& fd) {
        if (fd >= 0) {
            ::close(fd);
        }
        fd = -1;
    }

    inline void close_child_fds(child_process& child) {
        close_fd(child.stdin_fd);
        close_fd(child.stdout_fd);
        close_fd(child.stderr_fd);
    }

    inline bool process_alive(pid_t pid) {
        return pid > 0 && (::kill(pid, 0) == 0 || errno == EPERM);
    }

    inline std::map<std::string, std::string> current_environment() {
        std::map<std::string, std::string> env{};
        for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
            std::string_view kv{*entry};
            auto eq = kv.find('=');
            if (eq == std::string_view::npos || eq == 0) {
                continue;
            }
            env.emplace(std::string{kv.substr(0, eq)}, std::string{kv.substr(eq + 1)});
        }
        return env;
    }

    /*
     * fork/exec `args` with all three standard streams piped back to the parent.
     *
     * A close-on-exec status pipe reports exec failures (for example an unknown command)
     * synchronously: EOF means exec succeeded, an int payload is the child's errno.
     * The parent's ends of stdin/stdout/stderr are returned non-blocking.
     */
    inline spawn_result spawn_piped(
            const std::vector<std::string>& args, const std::optional<std::map<std::string, std::string>>& env) {
        ignore_sigpipe();

        if (args.empty() || args.front().empty()) {
            return {.error = "empty command"};
        }

        int in_pipe[2]{-1, -1};
        int out_pipe[2]{-1, -1};
        int err_pipe[2]{-1, -1};
        int status_pipe[2]{-1, -1};
        auto close_all = [&] {
            for (int* p : {in_pipe, out_pipe, err_pipe, status_pipe}) {
                close_fd(p[0]);
                close_fd(p[1]);
            }
        };

        // every parent end stays close-on-exec so later children never inherit another session's pipes
        if (::pipe2(in_pipe, O_CLOEXEC) != 0 || ::pipe2(out_pipe, O_CLOEXEC) != 0 ||
            ::pipe2(err_pipe, O_CLOEXEC) != 0 || ::pipe2(status_pipe, O_CLOEXEC) != 0) {
            auto msg = "pipe() failed: {}"_format(std::strerror(errno));
            close_all();
            return {.error = std::move(msg)};
        }

        // build argv/envp before fork; only async-signal-safe calls happen in the child
        std::vector<char*> argv{};
        argv.reserve(args.size() + 1);
        for (const auto& arg : args) {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }
        argv.push_back(nullptr);

        std::vector<std::string> env_storage{};
        std::vector<char*> envp{};
        if (env) {
            env_storage.reserve(env->size());
            for (const auto& [key, value] : *env) {
                env_storage.push_back(key + "=" + value);
            }
            envp.reserve(env_storage.size() + 1);
            for (auto& kv : env_storage) {
                envp.push_back(kv.data());
            }
            envp.push_back(nullptr);
        }

        auto pid = ::fork();
        if (pid < 0) {
            auto msg = "fork() failed: {}"_format(std::strerror(errno));
            close_all();
            return {.error = std::move(msg)};
        }

        if (pid == 0) {
            ::close(in_pipe[1]);
            ::close(out_pipe[0]);
            ::close(err_pipe[0]);
            ::close(status_pipe[0]);
            // dup2 clears close-on-exec on the target; a pipe already sitting on it keeps the flag
            auto redirect = [](int fd, int target) {
                if (fd == target) {
                    ::fcntl(fd, F_SETFD, 0);
                    return;
                }
                ::dup2(fd, target);
                ::close(fd);
            };
            redirect(in_pipe[0], STDIN_FILENO);
            redirect(out_pipe[1], STDOUT_FILENO);
            redirect(err_pipe[1], STDERR_FILENO);

            ::signal(SIGPIPE, SIG_DFL);

            if (env) {
                ::execvpe(argv[0], argv.data(), envp.data());
            }
            else {
                ::execvp(argv[0], argv.data());
            }
            int err = errno;
            (void)!::write(status_pipe[1], &err, sizeof(err));
            _exit(127);
        }

        // parent
        close_fd(in_pipe[0]);
        close_fd(out_pipe[1]);
        close_fd(err_pipe[1]);
        close_fd(status_pipe[1]);

        int child_errno = 0;
        ssize_t n = 0;
        do {
            n = ::read(status_pipe[0], &child_errno, sizeof(child_errno));
        } while (n < 0 && errno == EINTR);
        close_fd(status_pipe[0]);

        if (n == static_cast<ssize_t>(sizeof(child_errno))) {
            ::waitpid(pid, nullptr, 0);
            close_all();
            return {.error = "failed to start '{}': {}"_format(args.front(), std::strerror(child_errno))};
        }

        child_process child{.pid = pid, .stdin_fd = in_pipe[1], .stdout_fd = out_pipe[0], .stderr_fd = err_pipe[0]};
        set_nonblocking(child.stdin_fd);
        set_nonblocking(child.stdout_fd);
        set_nonblocking(child.stderr_fd);
        return {.child = child};
    }

    // returns true once `pid` has been reaped
    inline bool try_reap(pid_t pid, int* status = nullptr) {
        int st = 0;
        pid_t r = 0;
        do {
            r = ::waitpid(pid, &st, WNOHANG);
        } while (r < 0 && errno == EINTR);
        if (r == pid || (r < 0 && errno == ECHILD)) {
            if (status != nullptr) {
                *status = st;
            }
            return true;
        }
        return false;
    }

    inline void kill_and_reap(pid_t pid) {
        if (pid <= 0) {
            return;
        }
        ::kill(pid, SIGKILL);
        while (::waitpid(pid, nullptr, 0) < 0 && errno == EINTR) {}
    }

    inline std::string drain_fd_nonblocking(int fd) {
        std::string buf{};
        char chunk[4096]{};
        for (;;) {
            pollfd pfd{.fd = fd, .events = POLLIN, .revents = 0};
            if (::poll(&pfd, 1, 0) <= 0) {
                break;
            }
            auto n = ::read(fd, chunk, sizeof(chunk));
            if (n <= 0) {
                break;
            }
            buf.append(chunk, static_cast<size_t>(n));
        }
        return buf;
    }

    /*
     * Runs a short-lived helper to completion, collecting both output streams.
     * The child is SIGKILLed when `timeout_ms` elapses.
     */
    inline subprocess_result run_subprocess(const std::vector<std::string>& args, int timeout_ms) {
        auto spawned = spawn_piped(args, std::nullopt);
        if (!spawned.child) {
            return {.exit_code = 127, .stderr_output = std::move(spawned.error)};
        }
        auto child = *spawned.child;
        close_fd(child.stdin_fd);

        std::string out_buf{};
        std::string err_buf{};
        bool timed_out = false;
        int fds_open = 2;

        pollfd fds[2]{};
        fds[0] = {.fd = child.stdout_fd, .events = POLLIN, .revents = 0};
        fds[1] = {.fd = child.stderr_fd, .events = POLLIN, .revents = 0};

        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

        while (fds_open > 0) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                                     deadline - std::chrono::steady_clock::now())
                                     .count();
            if (remaining <= 0) {
                timed_out = true;
                break;
            }

            int ret = ::poll(fds, 2, static_cast<int>(remaining));
            if (ret < 0) {
                if (errno == EINTR) {
                    continue;
                }
                break;
            }
            if (ret == 0) {
                timed_out = true;
                break;
            }

            char chunk[4096]{};
            for (int i = 0; i < 2; ++i) {
                if (fds[i].fd < 0) {
                    continue;
                }
                if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
                    auto n = ::read(fds[i].fd, chunk, sizeof(chunk));
                    if (n > 0) {
                        (i == 0 ? out_buf : err_buf).append(chunk, static_cast<size_t>(n));
                    }
                    else if (n == 0 || (errno != EAGAIN && errno != EINTR)) {
                        fds[i].fd = -1;
                        --fds_open;
                    }
                }
            }
        }

        if (timed_out) {
            ::kill(child.pid, SIGKILL);
        }

        close_child_fds(child);

        int status = 0;
        while (::waitpid(child.pid, &status, 0) < 0 && errno == EINTR) {}

        if (timed_out) {
            return {.exit_code = 1, .stdout_output = std::move(out_buf), .stderr_output = "subprocess timed out",
                    .timed_out = true};
        }

        int exit_code = 1;
        if (WIFEXITED(status)) {
            exit_code = WEXITSTATUS(status);
        }
        else if (WIFSIGNALED(status)) {
            exit_code = 128 + WTERMSIG(status);
        }

        return {.exit_code = exit_code, .stdout_output = std::move(out_buf), .stderr_output = std::move(err_buf)};
    }

}  // namespace hostmux::internal::process
