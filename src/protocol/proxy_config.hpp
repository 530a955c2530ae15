#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace acptrace::protocol {

    // Span/metric export transport
    enum class ExportProtocol {
        Grpc,       // OTLP over gRPC
        Http,       // OTLP over HTTP, protobuf body
        HttpJson,   // OTLP over HTTP, JSON body
        Console,    // ostream exporter on stderr
        None        // providers without exporters
    };

    // Validated command line + environment needed to run the proxy
    struct ProxyConfig {
        std::vector<std::string> agent_command;   // program followed by its arguments
        std::string otlp_endpoint = "http://localhost:4317";
        ExportProtocol otlp_protocol = ExportProtocol::Grpc;
        std::string service_name = "acp-agent";
        bool record_content = false;
        unsigned verbosity = 0;
        bool show_help = false;
    };

    inline std::optional<ExportProtocol> parse_export_protocol(std::string_view text) {
        if (text == "grpc") return ExportProtocol::Grpc;
        if (text == "http") return ExportProtocol::Http;
        if (text == "http-json") return ExportProtocol::HttpJson;
        if (text == "console") return ExportProtocol::Console;
        if (text == "none") return ExportProtocol::None;
        return std::nullopt;
    }

    inline std::string to_string(const ExportProtocol protocol) {
        switch (protocol) {
            case ExportProtocol::Grpc: return "grpc";
            case ExportProtocol::Http: return "http";
            case ExportProtocol::HttpJson: return "http-json";
            case ExportProtocol::Console: return "console";
            case ExportProtocol::None: return "none";
            default: return "unknown";
        }
    }

} // namespace acptrace::protocol
