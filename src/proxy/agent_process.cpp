#include "proxy/agent_process.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include "core/logging/logger.hpp"

namespace acptrace::proxy {

using core::errors::ErrorCategory;
using core::errors::ProxyError;

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        static_cast<void>(close(fd));
        fd = -1;
    }
}

void set_cloexec(const int fd) {
    const int flags = fcntl(fd, F_GETFD, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFD, flags | FD_CLOEXEC));
}

void close_pipe(int (&fds)[2]) {
    close_fd(fds[0]);
    close_fd(fds[1]);
}

}  // namespace

AgentProcess::AgentProcess(const pid_t pid, const int stdin_fd, const int stdout_fd)
    : pid_(pid), stdin_fd_(stdin_fd), stdout_fd_(stdout_fd) {}

AgentProcess::~AgentProcess() {
    close_fd(stdin_fd_);
    close_fd(stdout_fd_);
    if (!exit_status_) {
        static_cast<void>(kill());
        static_cast<void>(wait());
    }
}

core::errors::Result<std::shared_ptr<AgentProcess>> AgentProcess::spawn(
    const std::vector<std::string>& command) {
    if (command.empty()) {
        return ProxyError{ErrorCategory::Input, "No agent command given.", "missing_command",
                          "Pass the agent executable after the proxy options."};
    }

    // argv is built before fork: the child must not allocate.
    std::vector<char*> argv;
    argv.reserve(command.size() + 1);
    for (const auto& arg : command) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};
    if (pipe(stdin_pipe) != 0 || pipe(stdout_pipe) != 0 || pipe(exec_pipe) != 0) {
        const std::string reason = std::strerror(errno);
        close_pipe(stdin_pipe);
        close_pipe(stdout_pipe);
        close_pipe(exec_pipe);
        return ProxyError{ErrorCategory::Spawn, "Failed to create agent pipes: " + reason,
                          "pipe_creation_failed"};
    }
    set_cloexec(stdin_pipe[1]);
    set_cloexec(stdout_pipe[0]);
    set_cloexec(exec_pipe[0]);
    set_cloexec(exec_pipe[1]);

    const pid_t pid = fork();
    if (pid < 0) {
        const std::string reason = std::strerror(errno);
        close_pipe(stdin_pipe);
        close_pipe(stdout_pipe);
        close_pipe(exec_pipe);
        return ProxyError{ErrorCategory::Spawn, "Failed to fork agent process: " + reason,
                          "fork_failed"};
    }

    if (pid == 0) {
        // The proxy ignores SIGPIPE; the agent gets the default back.
        static_cast<void>(std::signal(SIGPIPE, SIG_DFL));
        static_cast<void>(dup2(stdin_pipe[0], STDIN_FILENO));
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(close(stdin_pipe[0]));
        static_cast<void>(close(stdin_pipe[1]));
        static_cast<void>(close(stdout_pipe[0]));
        static_cast<void>(close(stdout_pipe[1]));
        static_cast<void>(close(exec_pipe[0]));
        execvp(argv[0], argv.data());
        const int exec_errno = errno;
        static_cast<void>(write(exec_pipe[1], &exec_errno, sizeof(exec_errno)));
        _exit(127);
    }

    close_fd(stdin_pipe[0]);
    close_fd(stdout_pipe[1]);
    close_fd(exec_pipe[1]);

    // exec_pipe closes on a successful exec; anything read back is errno.
    int exec_errno = 0;
    ssize_t n = 0;
    do {
        n = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        close_fd(stdin_pipe[1]);
        close_fd(stdout_pipe[0]);
        int status = 0;
        static_cast<void>(waitpid(pid, &status, 0));
        return ProxyError{ErrorCategory::Spawn,
                          "Failed to start agent '" + command.front() +
                              "': " + std::strerror(exec_errno),
                          "exec_failed", "Check that the agent command is on PATH."};
    }

    LOG_DEBUG("Spawned agent '" + command.front() + "' as pid " + std::to_string(pid));
    return std::shared_ptr<AgentProcess>(new AgentProcess(pid, stdin_pipe[1], stdout_pipe[0]));
}

void AgentProcess::close_stdin() {
    close_fd(stdin_fd_);
}

void AgentProcess::record_status(const int raw_status) {
    ExitStatus status;
    if (WIFEXITED(raw_status)) {
        status.code = WEXITSTATUS(raw_status);
    } else if (WIFSIGNALED(raw_status)) {
        status.signal = WTERMSIG(raw_status);
    }
    exit_status_ = status;
}

std::optional<ExitStatus> AgentProcess::try_wait() {
    if (exit_status_) {
        return exit_status_;
    }
    int raw_status = 0;
    pid_t waited = 0;
    do {
        waited = waitpid(pid_, &raw_status, WNOHANG);
    } while (waited < 0 && errno == EINTR);
    if (waited == pid_) {
        record_status(raw_status);
    } else if (waited < 0) {
        LOG_WARN("waitpid failed for agent pid " + std::to_string(pid_) + ": " +
                 std::strerror(errno));
        exit_status_ = ExitStatus{};
    }
    return exit_status_;
}

ExitStatus AgentProcess::wait() {
    if (exit_status_) {
        return *exit_status_;
    }
    int raw_status = 0;
    pid_t waited = 0;
    do {
        waited = waitpid(pid_, &raw_status, 0);
    } while (waited < 0 && errno == EINTR);
    if (waited == pid_) {
        record_status(raw_status);
    } else {
        exit_status_ = ExitStatus{};
    }
    return *exit_status_;
}

bool AgentProcess::kill() {
    if (exit_status_) {
        return false;
    }
    return ::kill(pid_, SIGKILL) == 0;
}

int exit_code_for(const ExitStatus& status) {
    return status.code.value_or(0);
}

}  // namespace acptrace::proxy
