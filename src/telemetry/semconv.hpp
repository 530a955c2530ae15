#pragma once

// Attribute, span and instrument names emitted by the correlator.
namespace acptrace::telemetry::semconv {

inline constexpr const char* kOperationName = "gen_ai.operation.name";
inline constexpr const char* kConversationId = "gen_ai.conversation.id";
inline constexpr const char* kProviderName = "gen_ai.provider.name";
inline constexpr const char* kAgentName = "gen_ai.agent.name";
inline constexpr const char* kAgentId = "gen_ai.agent.id";
inline constexpr const char* kInputMessages = "gen_ai.input.messages";
inline constexpr const char* kOutputMessages = "gen_ai.output.messages";
inline constexpr const char* kFinishReasons = "gen_ai.response.finish_reasons";
inline constexpr const char* kToolName = "gen_ai.tool.name";
inline constexpr const char* kToolCallId = "gen_ai.tool.call.id";
inline constexpr const char* kToolType = "gen_ai.tool.type";
inline constexpr const char* kToolCallArguments = "gen_ai.tool.call.arguments";
inline constexpr const char* kToolCallResult = "gen_ai.tool.call.result";

inline constexpr const char* kAcpMethodName = "acp.method.name";
inline constexpr const char* kAcpProtocolVersion = "acp.protocol.version";
inline constexpr const char* kAcpAgentVersion = "acp.agent.version";
inline constexpr const char* kAcpClientName = "acp.client.name";
inline constexpr const char* kAcpClientVersion = "acp.client.version";
inline constexpr const char* kAcpTimeToFirstTokenMs = "acp.time_to_first_token_ms";
inline constexpr const char* kAcpToolKind = "acp.tool.kind";
inline constexpr const char* kAcpStopReason = "acp.stop_reason";

inline constexpr const char* kRpcSystem = "rpc.system";
inline constexpr const char* kRpcMethod = "rpc.method";
inline constexpr const char* kJsonRpcRequestId = "jsonrpc.request.id";
inline constexpr const char* kNetworkTransport = "network.transport";
inline constexpr const char* kErrorType = "error.type";

inline constexpr const char* kOperationInvokeAgent = "invoke_agent";
inline constexpr const char* kOperationExecuteTool = "execute_tool";

inline constexpr const char* kRootSpanName = "acp_session";

inline constexpr const char* kDurationHistogram = "gen_ai.client.operation.duration";
inline constexpr const char* kTimeToFirstTokenHistogram = "gen_ai.server.time_to_first_token";

}  // namespace acptrace::telemetry::semconv
