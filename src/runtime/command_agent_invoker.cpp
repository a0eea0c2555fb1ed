#include "runtime/command_agent_invoker.hpp"

#include <chrono>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <fcntl.h>
#include <initializer_list>
#include <poll.h>
#include <signal.h>
#include <string>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>
#include "core/logging/logger.hpp"
#include "protocol/json_codec.hpp"

namespace conductor::runtime {

using core::errors::ConductorError;
using core::errors::ErrorCategory;

namespace {

struct ProcessCapture {
    int exit_code = -1;
    bool timed_out = false;
    bool cancelled = false;
    std::string stdout_text;
    std::string stderr_text;
    double duration_ms = 0.0;
};

std::string trim_excerpt(const std::string& text) {
    constexpr std::size_t kMaxLength = 240;
    if (text.size() <= kMaxLength) {
        return text;
    }
    return text.substr(0, kMaxLength) + "...";
}

std::string trim_trailing_whitespace(std::string text) {
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r' ||
                             text.back() == ' ' || text.back() == '\t')) {
        text.pop_back();
    }
    return text;
}

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void close_fd(int& fd) {
    if (fd >= 0) {
        static_cast<void>(close(fd));
        fd = -1;
    }
}

void drain_pipe(int& fd, std::string& out) {
    if (fd < 0) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        close_fd(fd);
        return;
    }
}

// Pushes as much of the payload as the pipe takes; closes stdin when done or
// when the child stopped reading.
void feed_pipe(int& fd, const std::string& payload, std::size_t& written) {
    if (fd < 0) {
        return;
    }
    while (written < payload.size()) {
        const ssize_t n = write(fd, payload.data() + written, payload.size() - written);
        if (n > 0) {
            written += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        break;
    }
    close_fd(fd);
}

core::errors::Result<ProcessCapture> run_agent_process(
    const CommandInvokerOptions& options, const std::string& agent_name,
    const std::string& payload, const std::uint32_t timeout_ms,
    const std::shared_ptr<std::atomic_bool>& cancel_token) {
    if (cancel_token && cancel_token->load()) {
        ProcessCapture capture;
        capture.cancelled = true;
        capture.stderr_text = "Agent call cancelled before start.";
        return capture;
    }

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if (pipe(stdin_pipe) != 0 || pipe(stdout_pipe) != 0 || pipe(stderr_pipe) != 0) {
        for (int* fds : {stdin_pipe, stdout_pipe, stderr_pipe}) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }
        return ConductorError{ErrorCategory::AgentInvocation,
                              "Failed to create agent process pipes.",
                              "agent_transport_failed"};
    }

    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        for (int* fds : {stdin_pipe, stdout_pipe, stderr_pipe}) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }
        return ConductorError{ErrorCategory::AgentInvocation,
                              "Failed to fork agent process.",
                              "agent_transport_failed"};
    }

    if (pid == 0) {
        // Own process group, so a kill also reaches backgrounded grandchildren.
        static_cast<void>(setpgid(0, 0));
        if (chdir(options.working_directory.c_str()) != 0) {
            _exit(126);
        }
        static_cast<void>(setenv(core::config::kEndpointEnv,
                                 options.connection.endpoint.c_str(), 1));
        static_cast<void>(setenv(core::config::kDeploymentEnv,
                                 options.connection.deployment.c_str(), 1));
        static_cast<void>(setenv("CONDUCTOR_AGENT_NAME", agent_name.c_str(), 1));
        static_cast<void>(dup2(stdin_pipe[0], STDIN_FILENO));
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        for (int* fds : {stdin_pipe, stdout_pipe, stderr_pipe}) {
            static_cast<void>(close(fds[0]));
            static_cast<void>(close(fds[1]));
        }
        execl("/bin/sh", "sh", "-c", options.command.c_str(), static_cast<char*>(nullptr));
        _exit(127);
    }

    static_cast<void>(setpgid(pid, pid));
    close_fd(stdin_pipe[0]);
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    set_nonblocking(stdin_pipe[1]);
    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);

    int in_fd = stdin_pipe[1];
    int out_fd = stdout_pipe[0];
    int err_fd = stderr_pipe[0];
    std::size_t written = 0;

    ProcessCapture capture;
    bool child_exited = false;
    int status = 0;

    while (out_fd >= 0 || err_fd >= 0 || !child_exited) {
        if (cancel_token && cancel_token->load() && !child_exited && !capture.cancelled) {
            capture.cancelled = true;
            static_cast<void>(kill(-pid, SIGKILL));
        }

        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 std::chrono::steady_clock::now() - started)
                                 .count();
        const bool overdue =
            timeout_ms > 0 && elapsed > static_cast<std::int64_t>(timeout_ms);
        if (!capture.timed_out && overdue && !child_exited) {
            capture.timed_out = true;
            static_cast<void>(kill(-pid, SIGKILL));
        }
        // The shell is gone but something it spawned still holds the pipes.
        if (child_exited && (overdue || (cancel_token && cancel_token->load()))) {
            if (cancel_token && cancel_token->load()) {
                capture.cancelled = true;
            } else {
                capture.timed_out = true;
            }
            static_cast<void>(kill(-pid, SIGKILL));
            close_fd(out_fd);
            close_fd(err_fd);
            break;
        }

        pollfd fds[3];
        nfds_t nfds = 0;
        if (in_fd >= 0) {
            fds[nfds].fd = in_fd;
            fds[nfds].events = POLLOUT;
            ++nfds;
        }
        if (out_fd >= 0) {
            fds[nfds].fd = out_fd;
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (err_fd >= 0) {
            fds[nfds].fd = err_fd;
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        // With every pipe closed this still waits, so reaping the child never spins.
        static_cast<void>(poll(fds, nfds, 50));

        feed_pipe(in_fd, payload, written);
        drain_pipe(out_fd, capture.stdout_text);
        drain_pipe(err_fd, capture.stderr_text);

        if (!child_exited) {
            const pid_t waited = waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                child_exited = true;
                close_fd(in_fd);
            }
        }
    }
    close_fd(in_fd);

    if (WIFEXITED(status)) {
        capture.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        capture.exit_code = 128 + WTERMSIG(status);
    }

    capture.duration_ms = std::chrono::duration<double, std::milli>(
                              std::chrono::steady_clock::now() - started)
                              .count();
    return capture;
}

}  // namespace

CommandAgentInvoker::CommandAgentInvoker(CommandInvokerOptions options)
    : options_(std::move(options)) {
    // A child that exits without reading stdin must not kill this process.
    static_cast<void>(signal(SIGPIPE, SIG_IGN));
}

nlohmann::json CommandAgentInvoker::build_payload(
    const InvocationRequest& request, const core::config::ConnectionSettings& connection) {
    nlohmann::json payload;
    payload["agent"] = request.agent_name;
    payload["instructions"] = request.instructions;
    payload["transcript"] = nlohmann::json::array();
    if (request.transcript) {
        for (const auto& message : *request.transcript) {
            payload["transcript"].push_back(protocol::to_json(message));
        }
    }
    payload["connection"] = {{"endpoint", connection.endpoint},
                             {"deployment", connection.deployment}};
    return payload;
}

core::errors::Result<std::string> CommandAgentInvoker::call(
    const InvocationRequest& request) {
    if (options_.command.empty()) {
        return ConductorError{ErrorCategory::Configuration,
                              "No agent command configured.", "missing_agent_command",
                              "Pass --agent-command."};
    }

    // Agent output is arbitrary bytes; invalid UTF-8 becomes U+FFFD.
    const std::string payload = build_payload(request, options_.connection)
                                    .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    auto capture_result = run_agent_process(options_, request.agent_name, payload,
                                            request.timeout_ms, request.cancel_token);
    if (core::errors::is_error(capture_result)) {
        return core::errors::get_error(capture_result);
    }
    const auto& capture = core::errors::get_value(capture_result);
    LOG_DEBUG("CommandAgentInvoker: " + request.agent_name + " finished in " +
              std::to_string(static_cast<long long>(capture.duration_ms)) + " ms");

    if (capture.cancelled) {
        return ConductorError{ErrorCategory::Cancelled,
                              "Agent call for " + request.agent_name + " cancelled.",
                              "run_cancelled"};
    }
    if (capture.timed_out) {
        return ConductorError{ErrorCategory::AgentInvocation,
                              "Agent " + request.agent_name + " timed out after " +
                                  std::to_string(request.timeout_ms) + " ms.",
                              "agent_timeout"};
    }
    if (capture.exit_code != 0) {
        std::string message = "Agent " + request.agent_name +
                              " exited with code " + std::to_string(capture.exit_code);
        const std::string detail = trim_trailing_whitespace(capture.stderr_text);
        if (!detail.empty()) {
            message += ": " + trim_excerpt(detail);
        }
        return ConductorError{ErrorCategory::AgentInvocation, message,
                              "agent_exit_nonzero"};
    }
    return trim_trailing_whitespace(capture.stdout_text);
}

}  // namespace conductor::runtime
