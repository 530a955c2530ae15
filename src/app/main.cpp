#include <iostream>
#include <memory>
#include <string>
#include "app/cli_parser.hpp"
#include "core/config/instance_id.hpp"
#include "core/errors/proxy_errors.hpp"
#include "core/logging/logger.hpp"
#include "proxy/agent_process.hpp"
#include "proxy/proxy_runner.hpp"
#include "telemetry/telemetry.hpp"

namespace {

void log_error(const std::string& what, const acptrace::core::errors::ProxyError& err) {
    LOG_ERROR(what + " [" + err.code + "]: " + err.message);
    if (!err.hint.empty()) {
        LOG_ERROR("Hint: " + err.hint);
    }
}

} // namespace

int main(int argc, char* argv[]) {
    using acptrace::core::logging::Logger;

    // 1. Identify this proxy instance in every log line and in the resource
    const std::string instance_id = acptrace::core::config::generate_instance_id();
    Logger::get().set_instance_id(instance_id);

    // 2. Parse CLI input and return normalized input errors
    auto parsed = acptrace::app::cli::parse_and_validate(argc, argv);
    if (acptrace::core::errors::is_error(parsed)) {
        log_error("Input error", acptrace::core::errors::get_error(parsed));
        return 2;
    }
    const auto& config = acptrace::core::errors::get_value(parsed);
    if (config.show_help) {
        std::cerr << acptrace::app::cli::usage();
        return 0;
    }

    // 3. Log level: ACP_TRACES_LOG wins over -v
    Logger::get().set_min_level(Logger::level_for_verbosity(config.verbosity));
    if (auto env_level = acptrace::app::cli::process_env("ACP_TRACES_LOG")) {
        if (auto level = Logger::parse_level(*env_level)) {
            Logger::get().set_min_level(*level);
        } else {
            LOG_WARN("Ignoring unknown ACP_TRACES_LOG level: " + *env_level);
        }
    }

    // 4. Start the agent first so the editor is never left waiting on telemetry
    LOG_INFO("Starting agent: " + config.agent_command.front());
    auto spawned = acptrace::proxy::AgentProcess::spawn(config.agent_command);
    if (acptrace::core::errors::is_error(spawned)) {
        log_error("Failed to start agent", acptrace::core::errors::get_error(spawned));
        return 3;
    }
    auto agent = acptrace::core::errors::get_value(spawned);

    // 5. Telemetry pipeline
    acptrace::telemetry::install_sdk_log_bridge();
    acptrace::telemetry::TelemetryOptions options;
    options.endpoint = config.otlp_endpoint;
    options.export_protocol = config.otlp_protocol;
    options.service_name = config.service_name;
    options.instance_id = instance_id;
    auto created = acptrace::telemetry::Telemetry::create(options);
    if (acptrace::core::errors::is_error(created)) {
        log_error("Failed to initialize telemetry", acptrace::core::errors::get_error(created));
        return 4;
    }
    auto telemetry = acptrace::core::errors::get_value(created);
    LOG_INFO("Exporting to " + config.otlp_endpoint + " via " +
             acptrace::protocol::to_string(config.otlp_protocol) + " as " + config.service_name);

    // 6. Proxy until the agent is gone, then flush everything
    const int exit_code = acptrace::proxy::run_proxy(*agent, *telemetry, config.record_content);
    telemetry->shutdown();
    return exit_code;
}
