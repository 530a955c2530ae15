#include "proxy/proxy_runner.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <thread>
#include "core/logging/logger.hpp"
#include "proxy/stream_tap.hpp"
#include "proxy/tap_queue.hpp"
#include "session/span_correlator.hpp"

namespace acptrace::proxy {

namespace {

constexpr std::chrono::milliseconds kWaitInterval{50};

void report_forwarder(const protocol::Direction direction,
                      const core::errors::Result<std::size_t>& result) {
    const std::string label = protocol::to_string(direction);
    if (core::errors::is_error(result)) {
        const auto& error = core::errors::get_error(result);
        LOG_WARN("Forwarder " + label + " stopped: " + error.message);
        return;
    }
    LOG_DEBUG("Forwarder " + label + " finished after " +
              std::to_string(core::errors::get_value(result)) + " lines");
}

ExitStatus wait_for_agent(AgentProcess& agent, const std::atomic_bool& editor_closed,
                          const std::atomic_bool& editor_output_failed) {
    while (true) {
        if (auto status = agent.try_wait()) {
            return *status;
        }
        const bool input_closed = editor_closed.load();
        if (input_closed || editor_output_failed.load()) {
            LOG_INFO(std::string(input_closed ? "Editor closed its input"
                                              : "Editor output is no longer writable") +
                     "; stopping agent pid " + std::to_string(agent.pid()));
            agent.close_stdin();
            static_cast<void>(agent.kill());
            return agent.wait();
        }
        std::this_thread::sleep_for(kWaitInterval);
    }
}

}  // namespace

int run_proxy(AgentProcess& agent, telemetry::Telemetry& telemetry, const bool record_content,
              const ProxyIo& io) {
    // A vanished reader must surface as EPIPE on write, not kill the proxy.
    static_cast<void>(std::signal(SIGPIPE, SIG_IGN));

    TapQueue queue;
    auto stop_token = std::make_shared<std::atomic_bool>(false);
    std::atomic_bool editor_closed{false};
    std::atomic_bool editor_output_failed{false};

    session::SpanCorrelator correlator(telemetry.tracer(), telemetry.meter(), record_content);

    std::thread consumer([&]() {
        while (auto item = queue.pop()) {
            correlator.process(item->direction, item->line);
        }
        correlator.shutdown();
        static_cast<void>(telemetry.force_flush());
    });

    std::thread editor_to_agent([&]() {
        const auto result = forward_lines(io.editor_in, agent.stdin_fd(),
                                          protocol::Direction::EditorToAgent, queue, stop_token);
        report_forwarder(protocol::Direction::EditorToAgent, result);
        editor_closed.store(true);
    });

    std::thread agent_to_editor([&]() {
        const auto result = forward_lines(agent.stdout_fd(), io.editor_out,
                                          protocol::Direction::AgentToEditor, queue, stop_token);
        report_forwarder(protocol::Direction::AgentToEditor, result);
        if (core::errors::is_error(result)) {
            editor_output_failed.store(true);
        }
    });

    const ExitStatus status = wait_for_agent(agent, editor_closed, editor_output_failed);
    if (status.signal) {
        LOG_INFO("Agent terminated by signal " + std::to_string(*status.signal));
    } else {
        LOG_INFO("Agent exited with code " + std::to_string(status.code.value_or(0)));
    }

    stop_token->store(true);
    editor_to_agent.join();
    agent_to_editor.join();

    queue.close();
    consumer.join();

    return exit_code_for(status);
}

}  // namespace acptrace::proxy
