#include "session/span_correlator.hpp"

#include <array>
#include <utility>
#include <variant>
#include <opentelemetry/context/context.h>
#include <opentelemetry/nostd/span.h>
#include <opentelemetry/nostd/string_view.h>
#include <opentelemetry/trace/span_metadata.h>
#include <opentelemetry/trace/span_startoptions.h>
#include "core/logging/logger.hpp"
#include "telemetry/semconv.hpp"

namespace acptrace::session {

namespace nostd = opentelemetry::nostd;
namespace trace_api = opentelemetry::trace;
namespace semconv = telemetry::semconv;

using core::logging::Logger;
using core::logging::LogLevel;
using nlohmann::json;
using protocol::Direction;

namespace {

constexpr const char* kInitializeMethod = "initialize";
constexpr const char* kPromptMethod = "session/prompt";
constexpr const char* kUpdateMethod = "session/update";
constexpr const char* kTransportPipe = "pipe";
constexpr const char* kUnknownSession = "unknown";

constexpr const char* kSessionEndedUnexpectedly = "session ended unexpectedly";
constexpr const char* kExitedBeforeResponse = "process exited before response";

bool debug_enabled() {
    return Logger::get().enabled(LogLevel::DEBUG);
}

Direction opposite(const Direction direction) {
    return direction == Direction::EditorToAgent ? Direction::AgentToEditor
                                                 : Direction::EditorToAgent;
}

std::string output_messages(const std::string& text,
                            const std::optional<std::string>& finish_reason) {
    json message;
    message["role"] = "assistant";
    message["parts"] = json::array({json{{"type", "text"}, {"content", text}}});
    if (finish_reason.has_value()) {
        message["finish_reason"] = finish_reason.value();
    }
    return json::array({message}).dump();
}

std::string input_messages(const std::string& text) {
    json message;
    message["role"] = "user";
    message["parts"] = json::array({json{{"type", "text"}, {"content", text}}});
    return json::array({message}).dump();
}

}  // namespace

SpanCorrelator::SpanCorrelator(
    nostd::shared_ptr<trace_api::Tracer> tracer,
    nostd::shared_ptr<opentelemetry::metrics::Meter> meter,
    const bool record_content)
    : tracer_(std::move(tracer)),
      duration_histogram_(meter->CreateDoubleHistogram(
          semconv::kDurationHistogram, "GenAI operation duration", "s")),
      ttft_histogram_(meter->CreateDoubleHistogram(
          semconv::kTimeToFirstTokenHistogram, "Time to generate first token", "s")),
      record_content_(record_content) {}

SpanCorrelator::~SpanCorrelator() {
    shutdown();
}

void SpanCorrelator::process(const Direction direction, const std::string_view line) {
    if (shut_down_) {
        return;
    }

    auto message = protocol::parse_line(line);
    if (!message.has_value()) {
        if (debug_enabled()) {
            LOG_DEBUG("SpanCorrelator: unclassified line from " +
                      protocol::to_string(direction) + " ignored");
        }
        return;
    }

    if (const auto* request = std::get_if<protocol::Request>(&message.value())) {
        handle_request(direction, *request);
    } else if (const auto* response = std::get_if<protocol::Response>(&message.value())) {
        handle_response(direction, *response);
    } else {
        handle_notification(std::get<protocol::Notification>(message.value()));
    }
}

void SpanCorrelator::handle_request(const Direction direction,
                                    const protocol::Request& request) {
    if (debug_enabled()) {
        LOG_DEBUG("SpanCorrelator: request " + request.method + " id " + request.id.key +
                  " (" + protocol::to_string(direction) + ")");
    }

    const std::string key = pending_key(direction, request.id);
    if (request.method == kInitializeMethod) {
        start_initialize(key, request);
    } else if (request.method == kPromptMethod) {
        start_prompt(key, request);
    } else if (protocol::is_fs_or_terminal_method(request.method)) {
        start_tool_method(key, request);
    } else {
        start_generic(key, request);
    }
}

void SpanCorrelator::start_initialize(const std::string& key,
                                      const protocol::Request& request) {
    if (auto client = protocol::extract_client_info(request.params)) {
        client_ = std::move(client);
    }
    ensure_root_span();

    auto span = start_span(kInitializeMethod, trace_api::SpanKind::kInternal, root_context());
    span->SetAttribute(semconv::kRpcSystem, "jsonrpc");
    span->SetAttribute(semconv::kRpcMethod, kInitializeMethod);
    span->SetAttribute(semconv::kAcpMethodName, kInitializeMethod);
    span->SetAttribute(semconv::kNetworkTransport, kTransportPipe);
    track_pending(key, PendingRequest{span, request.method, std::nullopt, Clock::now()});
}

void SpanCorrelator::start_prompt(const std::string& key, const protocol::Request& request) {
    const std::string session_id =
        protocol::extract_session_id(request.params).value_or(kUnknownSession);
    const std::string span_name =
        agent_.has_value() ? std::string(semconv::kOperationInvokeAgent) + " " + agent_->name
                           : std::string(semconv::kOperationInvokeAgent);

    auto span = start_span(span_name, trace_api::SpanKind::kClient, root_context());
    span->SetAttribute(semconv::kOperationName, semconv::kOperationInvokeAgent);
    span->SetAttribute(semconv::kConversationId, session_id);
    span->SetAttribute(semconv::kAcpMethodName, kPromptMethod);
    span->SetAttribute(semconv::kNetworkTransport, kTransportPipe);
    if (agent_.has_value()) {
        span->SetAttribute(semconv::kProviderName, "acp." + agent_->name);
        span->SetAttribute(semconv::kAgentName, agent_->name);
        span->SetAttribute(semconv::kAgentId, agent_->name);
        if (agent_->version.has_value()) {
            span->SetAttribute(semconv::kAcpAgentVersion, agent_->version.value());
        }
    }
    if (client_.has_value()) {
        span->SetAttribute(semconv::kAcpClientName, client_->name);
        if (client_->version.has_value()) {
            span->SetAttribute(semconv::kAcpClientVersion, client_->version.value());
        }
    }
    if (record_content_) {
        if (auto text = protocol::extract_prompt_text(request.params)) {
            span->SetAttribute(semconv::kInputMessages, input_messages(text.value()));
        }
    }

    const auto now = Clock::now();
    SessionState& session = sessions_[session_id];
    if (session.prompt_span) {
        LOG_WARN("SpanCorrelator: session " + session_id +
                 " received a new prompt while one is open; ending the earlier span");
        end_with_error(session.prompt_span, "superseded by a newer prompt");
    }
    session.prompt_span = span;
    session.prompt_span_context = span->GetContext();
    session.prompt_request_key = key;
    session.prompt_start = now;
    session.first_chunk_time.reset();
    session.accumulated_output.clear();

    track_pending(key, PendingRequest{SpanPtr(), request.method, session_id, now});
}

void SpanCorrelator::start_tool_method(const std::string& key,
                                       const protocol::Request& request) {
    const auto session_id = protocol::extract_session_id(request.params);
    std::optional<trace_api::SpanContext> parent;
    if (session_id.has_value()) {
        parent = prompt_context(session_id.value());
    }
    if (!parent.has_value()) {
        parent = root_context();
    }

    auto span = start_span(std::string(semconv::kOperationExecuteTool) + " " + request.method,
                           trace_api::SpanKind::kInternal, parent);
    span->SetAttribute(semconv::kOperationName, semconv::kOperationExecuteTool);
    span->SetAttribute(semconv::kToolName, request.method);
    span->SetAttribute(semconv::kToolCallId, id_text(request.id));
    span->SetAttribute(semconv::kToolType, "function");
    span->SetAttribute(semconv::kAcpMethodName, request.method);
    span->SetAttribute(semconv::kNetworkTransport, kTransportPipe);
    if (session_id.has_value()) {
        span->SetAttribute(semconv::kConversationId, session_id.value());
    }
    if (record_content_) {
        span->SetAttribute(semconv::kToolCallArguments, request.params.dump());
    }
    track_pending(key, PendingRequest{span, request.method, session_id, Clock::now()});
}

void SpanCorrelator::start_generic(const std::string& key, const protocol::Request& request) {
    auto span = start_span(request.method, trace_api::SpanKind::kInternal, root_context());
    span->SetAttribute(semconv::kRpcSystem, "jsonrpc");
    span->SetAttribute(semconv::kRpcMethod, request.method);
    span->SetAttribute(semconv::kAcpMethodName, request.method);
    span->SetAttribute(semconv::kNetworkTransport, kTransportPipe);
    span->SetAttribute(semconv::kJsonRpcRequestId, id_text(request.id));
    track_pending(key, PendingRequest{span, request.method,
                                      protocol::extract_session_id(request.params),
                                      Clock::now()});
}

void SpanCorrelator::handle_response(const Direction direction,
                                     const protocol::Response& response) {
    const std::string key = pending_key(opposite(direction), response.id);
    auto it = pending_.find(key);
    if (it == pending_.end()) {
        if (debug_enabled()) {
            LOG_DEBUG("SpanCorrelator: response id " + response.id.key +
                      " has no pending request");
        }
        return;
    }
    PendingRequest pending = std::move(it->second);
    pending_.erase(it);

    if (debug_enabled()) {
        LOG_DEBUG("SpanCorrelator: response " + pending.method + " id " + response.id.key);
    }

    if (pending.method == kInitializeMethod) {
        finish_initialize(pending, response);
    } else if (pending.method == kPromptMethod) {
        finish_prompt(key, pending, response);
    } else if (protocol::is_fs_or_terminal_method(pending.method)) {
        finish_tool_method(pending, response);
    } else {
        finish_generic(pending, response);
    }
}

void SpanCorrelator::finish_initialize(PendingRequest& pending,
                                       const protocol::Response& response) {
    if (!pending.span) {
        return;
    }
    auto& span = *pending.span;

    if (response.result.has_value()) {
        const auto& result = response.result.value();
        if (auto agent = protocol::extract_agent_info(result)) {
            agent_ = std::move(agent);
            span.SetAttribute(semconv::kAgentName, agent_->name);
            span.SetAttribute(semconv::kAgentId, agent_->name);
        }
        if (auto version = protocol::extract_protocol_version(result)) {
            protocol_version_ = version;
            span.SetAttribute(semconv::kAcpProtocolVersion, version.value());
        }
    }
    if (response.error.has_value()) {
        mark_error(span, response.error.value());
    }

    if (agent_.has_value() && root_span_) {
        root_span_->SetAttribute(semconv::kAgentName, agent_->name);
        if (agent_->version.has_value()) {
            root_span_->SetAttribute(semconv::kAcpAgentVersion, agent_->version.value());
        }
    }
    span.End();
}

void SpanCorrelator::finish_prompt(const std::string& key, const PendingRequest& pending,
                                   const protocol::Response& response) {
    if (!pending.session_id.has_value()) {
        return;
    }
    auto it = sessions_.find(pending.session_id.value());
    if (it == sessions_.end()) {
        return;
    }
    SessionState& session = it->second;
    if (!session.prompt_span || session.prompt_request_key != key) {
        // Superseded by a later prompt; that span was already ended.
        return;
    }

    SpanPtr span = std::move(session.prompt_span);
    session.prompt_span = SpanPtr();
    session.prompt_span_context.reset();
    session.prompt_request_key.reset();

    const auto now = Clock::now();
    const double duration = seconds_between(pending.start, now);

    std::optional<std::string> stop_reason;
    if (response.result.has_value()) {
        stop_reason = protocol::extract_stop_reason(response.result.value());
    }

    if (stop_reason.has_value()) {
        const std::string finish_reason =
            protocol::map_stop_reason_to_finish_reason(stop_reason.value());
        const std::array<nostd::string_view, 1> finish_reasons{
            nostd::string_view(finish_reason)};
        span->SetAttribute(semconv::kFinishReasons,
                           nostd::span<const nostd::string_view>(finish_reasons.data(),
                                                                 finish_reasons.size()));
        span->SetAttribute(semconv::kAcpStopReason, stop_reason.value());
        if (record_content_ && !session.accumulated_output.empty()) {
            span->SetAttribute(semconv::kOutputMessages,
                               output_messages(session.accumulated_output, finish_reason));
        }
    } else if (record_content_ && !session.accumulated_output.empty()) {
        span->SetAttribute(semconv::kOutputMessages,
                           output_messages(session.accumulated_output, std::nullopt));
    }

    if (session.first_chunk_time.has_value() && session.prompt_start.has_value()) {
        const double ttft =
            seconds_between(session.prompt_start.value(), session.first_chunk_time.value());
        span->SetAttribute(semconv::kAcpTimeToFirstTokenMs,
                           static_cast<std::int64_t>(ttft * 1000.0));
        ttft_histogram_->Record(
            ttft, {{semconv::kOperationName, semconv::kOperationInvokeAgent}},
            opentelemetry::context::Context{});
    }

    if (response.error.has_value()) {
        mark_error(*span, response.error.value());
    }
    span->End();
    duration_histogram_->Record(
        duration, {{semconv::kOperationName, semconv::kOperationInvokeAgent}},
        opentelemetry::context::Context{});

    session.prompt_start.reset();
    session.first_chunk_time.reset();
    session.accumulated_output.clear();
}

void SpanCorrelator::finish_tool_method(PendingRequest& pending,
                                        const protocol::Response& response) {
    if (!pending.span) {
        return;
    }
    if (record_content_ && response.result.has_value()) {
        pending.span->SetAttribute(semconv::kToolCallResult, response.result->dump());
    }
    if (response.error.has_value()) {
        mark_error(*pending.span, response.error.value());
    }
    pending.span->End();
}

void SpanCorrelator::finish_generic(PendingRequest& pending,
                                    const protocol::Response& response) {
    if (!pending.span) {
        return;
    }
    if (response.error.has_value()) {
        pending.span->SetStatus(trace_api::StatusCode::kError, response.error->dump());
    }
    pending.span->End();
}

void SpanCorrelator::handle_notification(const protocol::Notification& notification) {
    if (notification.method != kUpdateMethod) {
        return;
    }

    const auto session_id = protocol::extract_session_id(notification.params);
    const auto update_type = protocol::extract_update_type(notification.params);
    if (!session_id.has_value() || !update_type.has_value()) {
        return;
    }

    if (debug_enabled()) {
        LOG_DEBUG("SpanCorrelator: session " + session_id.value() + " update " +
                  update_type.value());
    }

    if (update_type.value() == "agent_message_chunk") {
        on_message_chunk(session_id.value(), notification.params);
    } else if (update_type.value() == "tool_call") {
        on_tool_call(session_id.value(), notification.params);
    } else if (update_type.value() == "tool_call_update") {
        on_tool_call_update(session_id.value(), notification.params);
    }
}

void SpanCorrelator::on_message_chunk(const std::string& session_id, const json& params) {
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return;
    }
    SessionState& session = it->second;
    if (!session.first_chunk_time.has_value()) {
        session.first_chunk_time = Clock::now();
    }
    if (auto text = protocol::extract_chunk_text(params)) {
        session.accumulated_output += text.value();
    }
}

void SpanCorrelator::on_tool_call(const std::string& session_id, const json& params) {
    const auto tool_call_id = protocol::extract_tool_call_id(params);
    if (!tool_call_id.has_value()) {
        return;
    }
    const std::string title = protocol::extract_tool_call_title(params).value_or("unknown tool");
    const std::string kind = protocol::extract_tool_call_kind(params).value_or("other");

    std::optional<trace_api::SpanContext> parent = prompt_context(session_id);
    if (!parent.has_value()) {
        parent = root_context();
    }

    auto span = start_span(std::string(semconv::kOperationExecuteTool) + " " + title,
                           trace_api::SpanKind::kInternal, parent);
    span->SetAttribute(semconv::kOperationName, semconv::kOperationExecuteTool);
    span->SetAttribute(semconv::kToolName, title);
    span->SetAttribute(semconv::kToolCallId, tool_call_id.value());
    span->SetAttribute(semconv::kToolType, protocol::map_tool_kind_to_type(kind));
    span->SetAttribute(semconv::kConversationId, session_id);
    span->SetAttribute(semconv::kAcpMethodName, kUpdateMethod);
    span->SetAttribute(semconv::kAcpToolKind, kind);
    span->SetAttribute(semconv::kNetworkTransport, kTransportPipe);
    if (record_content_) {
        if (auto raw_input = protocol::extract_raw_input(params)) {
            span->SetAttribute(semconv::kToolCallArguments, raw_input->dump());
        }
    }

    // A tool_call for a session without a prompt still gets tracked so that
    // shutdown can close it.
    SessionState& session = sessions_[session_id];
    auto existing = session.tool_spans.find(tool_call_id.value());
    if (existing != session.tool_spans.end()) {
        LOG_WARN("SpanCorrelator: tool call id " + tool_call_id.value() +
                 " reused in session " + session_id + "; ending the earlier span");
        end_with_error(existing->second, "tool call id reused");
        existing->second = span;
        return;
    }
    session.tool_spans.emplace(tool_call_id.value(), span);
}

void SpanCorrelator::on_tool_call_update(const std::string& session_id, const json& params) {
    const auto tool_call_id = protocol::extract_tool_call_id(params);
    if (!tool_call_id.has_value()) {
        return;
    }
    const std::string status = protocol::extract_tool_call_status(params).value_or("");
    if (status != "completed" && status != "failed") {
        return;
    }

    auto session_it = sessions_.find(session_id);
    if (session_it == sessions_.end()) {
        return;
    }
    auto& tool_spans = session_it->second.tool_spans;
    auto span_it = tool_spans.find(tool_call_id.value());
    if (span_it == tool_spans.end()) {
        return;
    }
    SpanPtr span = std::move(span_it->second);
    tool_spans.erase(span_it);

    if (status == "failed") {
        span->SetStatus(trace_api::StatusCode::kError, "tool call failed");
        span->SetAttribute(semconv::kErrorType, "tool_error");
    }
    if (record_content_) {
        if (auto raw_output = protocol::extract_raw_output(params)) {
            span->SetAttribute(semconv::kToolCallResult, raw_output->dump());
        }
    }
    span->End();
}

void SpanCorrelator::shutdown() {
    if (shut_down_) {
        return;
    }
    shut_down_ = true;

    std::size_t forced = 0;
    for (auto& entry : sessions_) {
        SessionState& session = entry.second;
        if (session.prompt_span) {
            end_with_error(session.prompt_span, kSessionEndedUnexpectedly);
            session.prompt_span = SpanPtr();
            ++forced;
        }
        for (auto& tool : session.tool_spans) {
            end_with_error(tool.second, kSessionEndedUnexpectedly);
            ++forced;
        }
        session.tool_spans.clear();
    }
    sessions_.clear();

    for (auto& entry : pending_) {
        if (entry.second.span) {
            end_with_error(entry.second.span, kExitedBeforeResponse);
            ++forced;
        }
    }
    pending_.clear();

    if (forced > 0) {
        LOG_INFO("SpanCorrelator: force-closed " + std::to_string(forced) +
                 " open span(s) at shutdown");
    }

    if (root_span_) {
        root_span_->End();
        root_span_ = SpanPtr();
    }
}

std::size_t SpanCorrelator::pending_count() const {
    return pending_.size();
}

std::size_t SpanCorrelator::session_count() const {
    return sessions_.size();
}

std::size_t SpanCorrelator::open_tool_span_count(const std::string& session_id) const {
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return 0;
    }
    return it->second.tool_spans.size();
}

bool SpanCorrelator::has_open_prompt(const std::string& session_id) const {
    auto it = sessions_.find(session_id);
    return it != sessions_.end() && static_cast<bool>(it->second.prompt_span);
}

bool SpanCorrelator::has_root_span() const {
    return static_cast<bool>(root_span_);
}

const std::optional<protocol::PeerInfo>& SpanCorrelator::agent_identity() const {
    return agent_;
}

const std::optional<protocol::PeerInfo>& SpanCorrelator::client_identity() const {
    return client_;
}

std::optional<std::int64_t> SpanCorrelator::protocol_version() const {
    return protocol_version_;
}

void SpanCorrelator::ensure_root_span() {
    if (root_span_) {
        return;
    }
    root_span_ = start_span(semconv::kRootSpanName, trace_api::SpanKind::kInternal,
                            std::nullopt);
    root_span_->SetAttribute(semconv::kAcpMethodName, "session");
    root_span_->SetAttribute(semconv::kNetworkTransport, kTransportPipe);
    root_span_context_ = root_span_->GetContext();
    LOG_INFO("SpanCorrelator: root session span started");
}

void SpanCorrelator::track_pending(const std::string& key, PendingRequest pending) {
    auto existing = pending_.find(key);
    if (existing != pending_.end()) {
        LOG_WARN("SpanCorrelator: request id " + key +
                 " reused before its response; ending the earlier span");
        if (existing->second.span) {
            end_with_error(existing->second.span, "request id reused before response");
        }
        existing->second = std::move(pending);
        return;
    }
    pending_.emplace(key, std::move(pending));
}

SpanPtr SpanCorrelator::start_span(const std::string& name, const trace_api::SpanKind kind,
                                   const std::optional<trace_api::SpanContext>& parent) {
    trace_api::StartSpanOptions options;
    options.kind = kind;
    if (parent.has_value() && parent->IsValid()) {
        options.parent = parent.value();
    }
    return tracer_->StartSpan(name, options);
}

std::optional<trace_api::SpanContext> SpanCorrelator::root_context() const {
    return root_span_context_;
}

std::optional<trace_api::SpanContext> SpanCorrelator::prompt_context(
    const std::string& session_id) const {
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second.prompt_span_context;
}

std::string SpanCorrelator::pending_key(const Direction requester,
                                        const protocol::RequestId& id) {
    return (requester == Direction::EditorToAgent ? "e:" : "a:") + id.key;
}

std::string SpanCorrelator::id_text(const protocol::RequestId& id) {
    if (id.value.is_string()) {
        return id.value.get<std::string>();
    }
    return id.key;
}

void SpanCorrelator::mark_error(trace_api::Span& span, const json& error) {
    span.SetStatus(trace_api::StatusCode::kError, error.dump());
    std::string error_type = "_OTHER";
    if (error.is_object()) {
        auto code = error.find("code");
        if (code != error.end()) {
            error_type = code->dump();
        }
    }
    span.SetAttribute(semconv::kErrorType, error_type);
}

void SpanCorrelator::end_with_error(const SpanPtr& span, const std::string& description) {
    span->SetStatus(trace_api::StatusCode::kError, description);
    span->End();
}

double SpanCorrelator::seconds_between(const Clock::time_point from,
                                       const Clock::time_point to) {
    if (to < from) {
        return 0.0;
    }
    return std::chrono::duration<double>(to - from).count();
}

}  // namespace acptrace::session
