#pragma once

#include <unistd.h>
#include "proxy/agent_process.hpp"
#include "telemetry/telemetry.hpp"

namespace acptrace::proxy {

// Editor-facing descriptors. Tests substitute pipes for the real stdio.
struct ProxyIo {
    int editor_in = STDIN_FILENO;
    int editor_out = STDOUT_FILENO;
};

// Forwards both directions between the editor and `agent`, feeding every
// line to a span correlator on a dedicated consumer thread. Returns once the
// agent has exited, or was killed after the editor closed its input or
// stopped accepting output, and all tapped lines have been processed and
// flushed. The result is the exit code to report to the editor.
int run_proxy(AgentProcess& agent, telemetry::Telemetry& telemetry, bool record_content,
              const ProxyIo& io = ProxyIo{});

}  // namespace acptrace::proxy
