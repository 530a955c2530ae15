#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <opentelemetry/metrics/meter.h>
#include <opentelemetry/nostd/shared_ptr.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/trace/tracer_provider.h>
#include <opentelemetry/trace/tracer.h>
#include "core/errors/proxy_errors.hpp"
#include "protocol/proxy_config.hpp"

namespace acptrace::telemetry {

inline constexpr const char* kInstrumentationName = "acp-traces";
inline constexpr const char* kInstrumentationVersion = "0.1.0";

struct TelemetryOptions {
    std::string endpoint = "http://localhost:4317";
    protocol::ExportProtocol export_protocol = protocol::ExportProtocol::Grpc;
    std::string service_name = "acp-agent";
    std::string instance_id;
    std::chrono::milliseconds metric_export_interval{10000};
};

// Owns the SDK tracer and meter providers for one proxy run. Constructed by
// the top-level orchestrator and handed down; nothing is registered globally.
class Telemetry {
public:
    Telemetry(std::shared_ptr<opentelemetry::sdk::trace::TracerProvider> tracer_provider,
              std::shared_ptr<opentelemetry::sdk::metrics::MeterProvider> meter_provider);
    ~Telemetry();

    Telemetry(const Telemetry&) = delete;
    Telemetry& operator=(const Telemetry&) = delete;

    static core::errors::Result<std::shared_ptr<Telemetry>> create(
        const TelemetryOptions& options);

    opentelemetry::nostd::shared_ptr<opentelemetry::trace::Tracer> tracer() const;
    opentelemetry::nostd::shared_ptr<opentelemetry::metrics::Meter> meter() const;

    // Pushes buffered spans and metrics to the exporters. Failures are
    // logged, never propagated.
    bool force_flush();

    // Flushes and shuts both providers down. Safe to call more than once.
    void shutdown();

private:
    std::shared_ptr<opentelemetry::sdk::trace::TracerProvider> tracer_provider_;
    std::shared_ptr<opentelemetry::sdk::metrics::MeterProvider> meter_provider_;
    std::mutex mutex_;
    bool shut_down_ = false;
};

// Routes opentelemetry-cpp SDK diagnostics into the proxy logger.
void install_sdk_log_bridge();

}  // namespace acptrace::telemetry
