#include "telemetry/telemetry.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <utility>
#include <vector>
#include <opentelemetry/exporters/ostream/metric_exporter_factory.h>
#include <opentelemetry/exporters/ostream/span_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/sdk/common/global_log_handler.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_options.h>
#include <opentelemetry/sdk/metrics/push_metric_exporter.h>
#include <opentelemetry/sdk/metrics/view/view_registry.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/exporter.h>
#include <opentelemetry/sdk/trace/processor.h>
#include <opentelemetry/sdk/trace/simple_processor_factory.h>
#include "core/logging/logger.hpp"

namespace acptrace::telemetry {

using core::errors::ErrorCategory;
using core::errors::ProxyError;
using protocol::ExportProtocol;

namespace nostd = opentelemetry::nostd;
namespace otlp = opentelemetry::exporter::otlp;
namespace sdk_metrics = opentelemetry::sdk::metrics;
namespace sdk_trace = opentelemetry::sdk::trace;
namespace internal_log = opentelemetry::sdk::common::internal_log;

namespace {

class SdkLogBridge final : public internal_log::LogHandler {
public:
    void Handle(internal_log::LogLevel level, const char* /*file*/, int /*line*/,
                const char* msg,
                const opentelemetry::sdk::common::AttributeMap& /*attributes*/) noexcept override {
        if (msg == nullptr || *msg == '\0') {
            return;
        }
        const std::string text = std::string("opentelemetry: ") + msg;
        switch (level) {
            case internal_log::LogLevel::Error:
                LOG_ERROR(text);
                break;
            case internal_log::LogLevel::Warning:
                LOG_WARN(text);
                break;
            case internal_log::LogLevel::Info:
                LOG_INFO(text);
                break;
            case internal_log::LogLevel::Debug:
            default:
                LOG_DEBUG(text);
                break;
        }
    }
};

// OTLP/HTTP wants the full signal URL; accept a bare collector address too.
std::string signal_url(const std::string& endpoint, const std::string& path) {
    if (endpoint.size() >= path.size() &&
        endpoint.compare(endpoint.size() - path.size(), path.size(), path) == 0) {
        return endpoint;
    }
    std::string base = endpoint;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base + path;
}

std::unique_ptr<sdk_trace::SpanExporter> make_span_exporter(
    const TelemetryOptions& options) {
    switch (options.export_protocol) {
        case ExportProtocol::Grpc: {
            otlp::OtlpGrpcExporterOptions exporter_options;
            exporter_options.endpoint = options.endpoint;
            return otlp::OtlpGrpcExporterFactory::Create(exporter_options);
        }
        case ExportProtocol::Http:
        case ExportProtocol::HttpJson: {
            otlp::OtlpHttpExporterOptions exporter_options;
            exporter_options.url = signal_url(options.endpoint, "/v1/traces");
            if (options.export_protocol == ExportProtocol::HttpJson) {
                exporter_options.content_type = otlp::HttpRequestContentType::kJson;
            }
            return otlp::OtlpHttpExporterFactory::Create(exporter_options);
        }
        case ExportProtocol::Console:
            return opentelemetry::exporter::trace::OStreamSpanExporterFactory::Create(std::cerr);
        case ExportProtocol::None:
        default:
            return nullptr;
    }
}

std::unique_ptr<sdk_metrics::PushMetricExporter> make_metric_exporter(
    const TelemetryOptions& options) {
    switch (options.export_protocol) {
        case ExportProtocol::Grpc: {
            otlp::OtlpGrpcMetricExporterOptions exporter_options;
            exporter_options.endpoint = options.endpoint;
            return otlp::OtlpGrpcMetricExporterFactory::Create(exporter_options);
        }
        case ExportProtocol::Http:
        case ExportProtocol::HttpJson: {
            otlp::OtlpHttpMetricExporterOptions exporter_options;
            exporter_options.url = signal_url(options.endpoint, "/v1/metrics");
            if (options.export_protocol == ExportProtocol::HttpJson) {
                exporter_options.content_type = otlp::HttpRequestContentType::kJson;
            }
            return otlp::OtlpHttpMetricExporterFactory::Create(exporter_options);
        }
        case ExportProtocol::Console:
            return opentelemetry::exporter::metrics::OStreamMetricExporterFactory::Create(std::cerr);
        case ExportProtocol::None:
        default:
            return nullptr;
    }
}

}  // namespace

Telemetry::Telemetry(
    std::shared_ptr<sdk_trace::TracerProvider> tracer_provider,
    std::shared_ptr<sdk_metrics::MeterProvider> meter_provider)
    : tracer_provider_(std::move(tracer_provider)),
      meter_provider_(std::move(meter_provider)) {}

Telemetry::~Telemetry() {
    shutdown();
}

core::errors::Result<std::shared_ptr<Telemetry>> Telemetry::create(
    const TelemetryOptions& options) {
    if (options.service_name.empty()) {
        return ProxyError{ErrorCategory::Telemetry, "Service name cannot be empty.",
                          "invalid_service_name"};
    }
    if (options.metric_export_interval.count() <= 0) {
        return ProxyError{ErrorCategory::Telemetry,
                          "Metric export interval must be positive.",
                          "invalid_export_interval"};
    }

    try {
        auto resource_attributes = opentelemetry::sdk::resource::ResourceAttributes{};
        resource_attributes.SetAttribute("service.name", options.service_name);
        if (!options.instance_id.empty()) {
            resource_attributes.SetAttribute("service.instance.id", options.instance_id);
        }
        const auto resource =
            opentelemetry::sdk::resource::Resource::Create(resource_attributes);

        std::vector<std::unique_ptr<sdk_trace::SpanProcessor>> processors;
        auto span_exporter = make_span_exporter(options);
        if (span_exporter) {
            if (options.export_protocol == ExportProtocol::Console) {
                processors.push_back(
                    sdk_trace::SimpleSpanProcessorFactory::Create(std::move(span_exporter)));
            } else {
                sdk_trace::BatchSpanProcessorOptions batch_options;
                processors.push_back(sdk_trace::BatchSpanProcessorFactory::Create(
                    std::move(span_exporter), batch_options));
            }
        }
        auto tracer_provider =
            std::make_shared<sdk_trace::TracerProvider>(std::move(processors), resource);

        auto meter_provider = std::make_shared<sdk_metrics::MeterProvider>(
            std::unique_ptr<sdk_metrics::ViewRegistry>(new sdk_metrics::ViewRegistry()),
            resource);
        auto metric_exporter = make_metric_exporter(options);
        if (metric_exporter) {
            sdk_metrics::PeriodicExportingMetricReaderOptions reader_options;
            reader_options.export_interval_millis = options.metric_export_interval;
            reader_options.export_timeout_millis =
                std::max(std::chrono::milliseconds(1), options.metric_export_interval / 2);
            std::shared_ptr<sdk_metrics::MetricReader> reader =
                sdk_metrics::PeriodicExportingMetricReaderFactory::Create(
                    std::move(metric_exporter), reader_options);
            meter_provider->AddMetricReader(reader);
        }

        LOG_INFO("Telemetry: exporter " + protocol::to_string(options.export_protocol) +
                 " endpoint " + options.endpoint + " service " + options.service_name);
        return std::make_shared<Telemetry>(std::move(tracer_provider),
                                           std::move(meter_provider));
    } catch (const std::exception& ex) {
        return ProxyError{ErrorCategory::Telemetry,
                          std::string("Failed to initialize telemetry: ") + ex.what(),
                          "telemetry_init_failed",
                          "Check --otlp-endpoint and --otlp-protocol."};
    }
}

opentelemetry::nostd::shared_ptr<opentelemetry::trace::Tracer> Telemetry::tracer() const {
    return tracer_provider_->GetTracer(kInstrumentationName, kInstrumentationVersion);
}

opentelemetry::nostd::shared_ptr<opentelemetry::metrics::Meter> Telemetry::meter() const {
    return meter_provider_->GetMeter(kInstrumentationName, kInstrumentationVersion);
}

bool Telemetry::force_flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shut_down_) {
        return false;
    }
    bool ok = true;
    if (!tracer_provider_->ForceFlush()) {
        LOG_WARN("Telemetry: tracer flush failed");
        ok = false;
    }
    if (!meter_provider_->ForceFlush()) {
        LOG_WARN("Telemetry: meter flush failed");
        ok = false;
    }
    return ok;
}

void Telemetry::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shut_down_) {
        return;
    }
    shut_down_ = true;
    if (!tracer_provider_->ForceFlush()) {
        LOG_WARN("Telemetry: tracer flush error during shutdown");
    }
    if (!tracer_provider_->Shutdown()) {
        LOG_WARN("Telemetry: tracer shutdown error");
    }
    if (!meter_provider_->Shutdown()) {
        LOG_WARN("Telemetry: meter shutdown error");
    }
}

void install_sdk_log_bridge() {
    nostd::shared_ptr<internal_log::LogHandler> handler(new SdkLogBridge);
    internal_log::GlobalLogHandler::SetLogHandler(handler);
    const auto level = core::logging::Logger::get().min_level();
    internal_log::GlobalLogHandler::SetLogLevel(
        level == core::logging::LogLevel::DEBUG ? internal_log::LogLevel::Debug
                                                : internal_log::LogLevel::Warning);
}

}  // namespace acptrace::telemetry
