#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include <opentelemetry/metrics/meter.h>
#include <opentelemetry/metrics/sync_instruments.h>
#include <opentelemetry/nostd/shared_ptr.h>
#include <opentelemetry/nostd/unique_ptr.h>
#include <opentelemetry/trace/span.h>
#include <opentelemetry/trace/span_context.h>
#include <opentelemetry/trace/tracer.h>
#include "protocol/acp_message.hpp"

namespace acptrace::session {

using SpanPtr = opentelemetry::nostd::shared_ptr<opentelemetry::trace::Span>;
using Clock = std::chrono::steady_clock;

// One in-flight request, keyed by requester direction + canonical id.
struct PendingRequest {
    SpanPtr span;  // null for session/prompt: that span lives on the session
    std::string method;
    std::optional<std::string> session_id;
    Clock::time_point start;
};

struct SessionState {
    SpanPtr prompt_span;
    std::optional<opentelemetry::trace::SpanContext> prompt_span_context;
    std::optional<std::string> prompt_request_key;
    std::optional<Clock::time_point> prompt_start;
    std::optional<Clock::time_point> first_chunk_time;
    std::string accumulated_output;
    std::unordered_map<std::string, SpanPtr> tool_spans;
};

// Turns tapped ACP lines into spans and metrics. Not thread-safe: one
// consumer owns the instance and feeds it lines in arrival order.
class SpanCorrelator {
public:
    SpanCorrelator(
        opentelemetry::nostd::shared_ptr<opentelemetry::trace::Tracer> tracer,
        opentelemetry::nostd::shared_ptr<opentelemetry::metrics::Meter> meter,
        bool record_content);
    ~SpanCorrelator();

    SpanCorrelator(const SpanCorrelator&) = delete;
    SpanCorrelator& operator=(const SpanCorrelator&) = delete;

    void process(protocol::Direction direction, std::string_view line);

    // Ends every span still open: prompt and tool spans first, then pending
    // requests, then the root session span. Later calls are no-ops.
    void shutdown();

    std::size_t pending_count() const;
    std::size_t session_count() const;
    std::size_t open_tool_span_count(const std::string& session_id) const;
    bool has_open_prompt(const std::string& session_id) const;
    bool has_root_span() const;
    const std::optional<protocol::PeerInfo>& agent_identity() const;
    const std::optional<protocol::PeerInfo>& client_identity() const;
    std::optional<std::int64_t> protocol_version() const;

private:
    void handle_request(protocol::Direction direction, const protocol::Request& request);
    void handle_response(protocol::Direction direction, const protocol::Response& response);
    void handle_notification(const protocol::Notification& notification);

    void start_initialize(const std::string& key, const protocol::Request& request);
    void start_prompt(const std::string& key, const protocol::Request& request);
    void start_tool_method(const std::string& key, const protocol::Request& request);
    void start_generic(const std::string& key, const protocol::Request& request);

    void finish_initialize(PendingRequest& pending, const protocol::Response& response);
    void finish_prompt(const std::string& key, const PendingRequest& pending,
                       const protocol::Response& response);
    void finish_tool_method(PendingRequest& pending, const protocol::Response& response);
    void finish_generic(PendingRequest& pending, const protocol::Response& response);

    void on_message_chunk(const std::string& session_id, const nlohmann::json& params);
    void on_tool_call(const std::string& session_id, const nlohmann::json& params);
    void on_tool_call_update(const std::string& session_id, const nlohmann::json& params);

    void ensure_root_span();
    void track_pending(const std::string& key, PendingRequest pending);
    SpanPtr start_span(const std::string& name, opentelemetry::trace::SpanKind kind,
                       const std::optional<opentelemetry::trace::SpanContext>& parent);
    std::optional<opentelemetry::trace::SpanContext> root_context() const;
    std::optional<opentelemetry::trace::SpanContext> prompt_context(
        const std::string& session_id) const;

    static std::string pending_key(protocol::Direction requester,
                                   const protocol::RequestId& id);
    static std::string id_text(const protocol::RequestId& id);
    static void mark_error(opentelemetry::trace::Span& span, const nlohmann::json& error);
    static void end_with_error(const SpanPtr& span, const std::string& description);
    static double seconds_between(Clock::time_point from, Clock::time_point to);

    opentelemetry::nostd::shared_ptr<opentelemetry::trace::Tracer> tracer_;
    opentelemetry::nostd::unique_ptr<opentelemetry::metrics::Histogram<double>> duration_histogram_;
    opentelemetry::nostd::unique_ptr<opentelemetry::metrics::Histogram<double>> ttft_histogram_;
    bool record_content_;
    bool shut_down_ = false;

    std::optional<protocol::PeerInfo> agent_;
    std::optional<protocol::PeerInfo> client_;
    std::optional<std::int64_t> protocol_version_;

    std::unordered_map<std::string, SessionState> sessions_;
    std::unordered_map<std::string, PendingRequest> pending_;

    SpanPtr root_span_;
    std::optional<opentelemetry::trace::SpanContext> root_span_context_;
};

}  // namespace acptrace::session
