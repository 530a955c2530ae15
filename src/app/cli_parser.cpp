#include "cli_parser.hpp"
#include <cstddef>
#include <cstdlib>
#include <vector>

namespace acptrace::app::cli {

    using namespace acptrace::core::errors;
    using acptrace::protocol::ProxyConfig;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> otlp_endpoint;
        std::optional<std::string> otlp_protocol;
        std::optional<std::string> service_name;
        bool record_content = false;
        unsigned verbosity = 0;
        bool help = false;
        std::vector<std::string> agent_command;
    };

    std::optional<std::string> process_env(const std::string& name) {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr || *value == '\0') {
            return std::nullopt;
        }
        return std::string(value);
    }

    std::string usage() {
        return "Usage: acp-traces [options] [--] <agent-command> [args...]\n"
               "\n"
               "Options:\n"
               "  --otlp-endpoint <url>    OTLP collector endpoint (env OTEL_EXPORTER_OTLP_ENDPOINT,\n"
               "                           default http://localhost:4317)\n"
               "  --otlp-protocol <name>   grpc | http | http-json | console | none (default grpc)\n"
               "  --service-name <name>    service.name resource attribute (env OTEL_SERVICE_NAME,\n"
               "                           default acp-agent)\n"
               "  --record-content         record prompts, responses and tool payloads on spans\n"
               "  -v, --verbose            more logging on stderr; repeat for debug (-vv)\n"
               "  -h, --help               show this help\n";
    }

    namespace {

        bool is_verbosity_cluster(const std::string& arg) {
            if (arg.size() < 2 || arg[0] != '-' || arg[1] == '-') {
                return false;
            }
            for (std::size_t i = 1; i < arg.size(); ++i) {
                if (arg[i] != 'v') return false;
            }
            return true;
        }

        // Accepts "--flag value" and "--flag=value".
        std::optional<Result<std::string>> take_value(const std::vector<std::string>& args,
                                                      std::size_t& i, const std::string& flag) {
            const std::string& arg = args[i];
            if (arg == flag) {
                if (i + 1 < args.size()) return Result<std::string>(args[++i]);
                return Result<std::string>(ProxyError{ErrorCategory::Input, "Missing value for " + flag,
                                                      "missing_value"});
            }
            const std::string prefix = flag + "=";
            if (arg.rfind(prefix, 0) == 0) {
                return Result<std::string>(arg.substr(prefix.size()));
            }
            return std::nullopt;
        }

    } // namespace

    Result<ProxyConfig> parse_and_validate(int argc, char* argv[], const EnvLookup& env) {
        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) { // Start at 1 to skip program name
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: options until the first positional or "--"
        for (std::size_t i = 0; i < args.size(); ++i) {
            const std::string& arg = args[i];
            if (arg == "--") {
                raw.agent_command.assign(args.begin() + static_cast<std::ptrdiff_t>(i + 1), args.end());
                break;
            }
            if (arg.empty() || arg[0] != '-') {
                raw.agent_command.assign(args.begin() + static_cast<std::ptrdiff_t>(i), args.end());
                break;
            }

            if (auto endpoint = take_value(args, i, "--otlp-endpoint")) {
                if (is_error(*endpoint)) return get_error(*endpoint);
                raw.otlp_endpoint = get_value(*endpoint);
            } else if (auto protocol_name = take_value(args, i, "--otlp-protocol")) {
                if (is_error(*protocol_name)) return get_error(*protocol_name);
                raw.otlp_protocol = get_value(*protocol_name);
            } else if (auto service = take_value(args, i, "--service-name")) {
                if (is_error(*service)) return get_error(*service);
                raw.service_name = get_value(*service);
            } else if (arg == "--record-content") {
                raw.record_content = true;
            } else if (arg == "--verbose") {
                ++raw.verbosity;
            } else if (is_verbosity_cluster(arg)) {
                raw.verbosity += static_cast<unsigned>(arg.size() - 1);
            } else if (arg == "-h" || arg == "--help") {
                raw.help = true;
            } else {
                return ProxyError{ErrorCategory::Input, "Unknown argument: " + arg, "unknown_argument",
                                  "Run 'acp-traces --help' for the list of options."};
            }
        }

        // 3. Validator Phase: flags override environment, environment overrides defaults
        ProxyConfig config;
        config.record_content = raw.record_content;
        config.verbosity = raw.verbosity;
        config.show_help = raw.help;
        if (config.show_help) {
            return config;
        }

        if (raw.agent_command.empty()) {
            return ProxyError{ErrorCategory::Input, "No agent command provided.", "missing_command",
                              "Usage: acp-traces [options] [--] <agent-command> [args...]"};
        }
        config.agent_command = std::move(raw.agent_command);

        if (raw.otlp_protocol) {
            auto parsed_protocol = protocol::parse_export_protocol(*raw.otlp_protocol);
            if (!parsed_protocol) {
                return ProxyError{ErrorCategory::Input, "Invalid value for --otlp-protocol: " + *raw.otlp_protocol,
                                  "invalid_protocol", "Use one of grpc, http, http-json, console, none."};
            }
            config.otlp_protocol = *parsed_protocol;
        }

        if (raw.otlp_endpoint) {
            config.otlp_endpoint = *raw.otlp_endpoint;
        } else if (auto from_env = env("OTEL_EXPORTER_OTLP_ENDPOINT")) {
            config.otlp_endpoint = *from_env;
        }
        if (config.otlp_endpoint.empty()) {
            return ProxyError{ErrorCategory::Input, "OTLP endpoint must not be empty", "invalid_endpoint"};
        }

        if (raw.service_name) {
            config.service_name = *raw.service_name;
        } else if (auto from_env = env("OTEL_SERVICE_NAME")) {
            config.service_name = *from_env;
        }
        if (config.service_name.empty()) {
            return ProxyError{ErrorCategory::Input, "Service name must not be empty", "invalid_service_name"};
        }

        return config;
    }

} // namespace acptrace::app::cli
