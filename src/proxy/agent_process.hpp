#pragma once

#include <memory>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>
#include "core/errors/proxy_errors.hpp"

namespace acptrace::proxy {

struct ExitStatus {
    std::optional<int> code;    // set when the child exited normally
    std::optional<int> signal;  // set when a signal terminated it
};

// The wrapped agent child. stdin and stdout are pipes owned by this object;
// stderr is inherited so agent diagnostics reach the editor's log unchanged.
class AgentProcess {
public:
    static core::errors::Result<std::shared_ptr<AgentProcess>> spawn(
        const std::vector<std::string>& command);

    ~AgentProcess();

    AgentProcess(const AgentProcess&) = delete;
    AgentProcess& operator=(const AgentProcess&) = delete;

    pid_t pid() const { return pid_; }
    int stdin_fd() const { return stdin_fd_; }
    int stdout_fd() const { return stdout_fd_; }

    void close_stdin();

    // Non-blocking reap. nullopt while the child is still running.
    std::optional<ExitStatus> try_wait();
    ExitStatus wait();

    // SIGKILL. False when the child has already been reaped.
    bool kill();

private:
    AgentProcess(pid_t pid, int stdin_fd, int stdout_fd);

    void record_status(int raw_status);

    pid_t pid_;
    int stdin_fd_;
    int stdout_fd_;
    std::optional<ExitStatus> exit_status_;
};

// Exit code to hand back to the editor: the child's own code, or 0 when it
// was terminated by a signal.
int exit_code_for(const ExitStatus& status);

}  // namespace acptrace::proxy
