#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <opentelemetry/trace/span_metadata.h>
#include "session/span_correlator.hpp"
#include "telemetry_harness.hpp"

namespace {

using acptrace::protocol::Direction;
using acptrace::session::SpanCorrelator;
using acptrace::testing::find_span;
using acptrace::testing::has_attribute;
using acptrace::testing::is_child_of;
using acptrace::testing::SpanList;
using acptrace::testing::string_array_attribute;
using acptrace::testing::string_attribute;
using acptrace::testing::TelemetryHarness;
using opentelemetry::trace::StatusCode;

constexpr Direction kFromEditor = Direction::EditorToAgent;
constexpr Direction kFromAgent = Direction::AgentToEditor;

const char* kInitialize =
    R"({"jsonrpc":"2.0","id":0,"method":"initialize","params":{"protocolVersion":1,"clientInfo":{"name":"zed","version":"0.200.0"}}})";
const char* kInitializeResult =
    R"({"jsonrpc":"2.0","id":0,"result":{"protocolVersion":1,"agentInfo":{"name":"test-agent","version":"1.2.3"}}})";
const char* kNewSession =
    R"({"jsonrpc":"2.0","id":1,"method":"session/new","params":{"cwd":"/tmp","mcpServers":[]}})";
const char* kNewSessionResult = R"({"jsonrpc":"2.0","id":1,"result":{"sessionId":"s1"}})";
const char* kPrompt =
    R"({"jsonrpc":"2.0","id":2,"method":"session/prompt","params":{"sessionId":"s1","prompt":[{"type":"text","text":"Summarize the repo"}]}})";
const char* kChunkHello =
    R"({"jsonrpc":"2.0","method":"session/update","params":{"sessionId":"s1","update":{"sessionUpdate":"agent_message_chunk","content":{"type":"text","text":"Hello "}}}})";
const char* kChunkWorld =
    R"({"jsonrpc":"2.0","method":"session/update","params":{"sessionId":"s1","update":{"sessionUpdate":"agent_message_chunk","content":{"type":"text","text":"world"}}}})";
const char* kToolCall =
    R"({"jsonrpc":"2.0","method":"session/update","params":{"sessionId":"s1","update":{"sessionUpdate":"tool_call","toolCallId":"t1","title":"Read README","kind":"read","status":"pending","rawInput":{"path":"README.md"}}}})";
const char* kToolCallDone =
    R"({"jsonrpc":"2.0","method":"session/update","params":{"sessionId":"s1","update":{"sessionUpdate":"tool_call_update","toolCallId":"t1","status":"completed","rawOutput":{"lines":42}}}})";
const char* kPromptResult = R"({"jsonrpc":"2.0","id":2,"result":{"stopReason":"end_turn"}})";

class SpanCorrelatorTest : public ::testing::Test {
protected:
    std::unique_ptr<SpanCorrelator> make_correlator(bool record_content) {
        return std::make_unique<SpanCorrelator>(harness_.telemetry->tracer(),
                                                harness_.telemetry->meter(), record_content);
    }

    void handshake(SpanCorrelator& correlator) {
        correlator.process(kFromEditor, kInitialize);
        correlator.process(kFromAgent, kInitializeResult);
        correlator.process(kFromEditor, kNewSession);
        correlator.process(kFromAgent, kNewSessionResult);
    }

    TelemetryHarness harness_;
};

TEST_F(SpanCorrelatorTest, FullPromptTurnProducesSpanTree) {
    auto correlator = make_correlator(true);
    handshake(*correlator);
    correlator->process(kFromEditor, kPrompt);
    correlator->process(kFromAgent, kChunkHello);
    correlator->process(kFromAgent, kToolCall);
    EXPECT_EQ(correlator->open_tool_span_count("s1"), 1u);
    correlator->process(kFromAgent, kToolCallDone);
    correlator->process(kFromAgent, kChunkWorld);
    correlator->process(kFromAgent, kPromptResult);
    EXPECT_EQ(correlator->pending_count(), 0u);
    EXPECT_FALSE(correlator->has_open_prompt("s1"));
    correlator->shutdown();

    const SpanList spans = harness_.spans();
    ASSERT_EQ(spans.size(), 5u);
    EXPECT_EQ(std::string(spans.back()->GetName()), "acp_session");

    const auto* root = find_span(spans, "acp_session");
    const auto* init = find_span(spans, "initialize");
    const auto* new_session = find_span(spans, "session/new");
    const auto* prompt = find_span(spans, "invoke_agent test-agent");
    const auto* tool = find_span(spans, "execute_tool Read README");
    ASSERT_NE(root, nullptr);
    ASSERT_NE(init, nullptr);
    ASSERT_NE(new_session, nullptr);
    ASSERT_NE(prompt, nullptr);
    ASSERT_NE(tool, nullptr);

    EXPECT_TRUE(is_child_of(*init, *root));
    EXPECT_TRUE(is_child_of(*new_session, *root));
    EXPECT_TRUE(is_child_of(*prompt, *root));
    EXPECT_TRUE(is_child_of(*tool, *prompt));

    EXPECT_EQ(string_attribute(*root, "gen_ai.agent.name"), "test-agent");
    EXPECT_EQ(string_attribute(*init, "gen_ai.agent.name"), "test-agent");
    EXPECT_EQ(string_attribute(*new_session, "rpc.method"), "session/new");
    EXPECT_EQ(string_attribute(*new_session, "jsonrpc.request.id"), "1");

    EXPECT_EQ(prompt->GetSpanKind(), opentelemetry::trace::SpanKind::kClient);
    EXPECT_EQ(string_attribute(*prompt, "gen_ai.operation.name"), "invoke_agent");
    EXPECT_EQ(string_attribute(*prompt, "gen_ai.conversation.id"), "s1");
    EXPECT_EQ(string_attribute(*prompt, "gen_ai.provider.name"), "acp.test-agent");
    EXPECT_EQ(string_attribute(*prompt, "acp.agent.version"), "1.2.3");
    EXPECT_EQ(string_attribute(*prompt, "acp.client.name"), "zed");
    EXPECT_EQ(string_attribute(*prompt, "acp.stop_reason"), "end_turn");
    EXPECT_EQ(string_array_attribute(*prompt, "gen_ai.response.finish_reasons"),
              std::vector<std::string>({"stop"}));
    EXPECT_TRUE(has_attribute(*prompt, "acp.time_to_first_token_ms"));
    EXPECT_NE(string_attribute(*prompt, "gen_ai.input.messages").find("Summarize the repo"),
              std::string::npos);
    EXPECT_NE(string_attribute(*prompt, "gen_ai.output.messages").find("Hello world"),
              std::string::npos);
    EXPECT_NE(prompt->GetStatus(), StatusCode::kError);

    EXPECT_EQ(string_attribute(*tool, "gen_ai.tool.call.id"), "t1");
    EXPECT_EQ(string_attribute(*tool, "gen_ai.tool.type"), "datastore");
    EXPECT_EQ(string_attribute(*tool, "acp.tool.kind"), "read");
    EXPECT_NE(string_attribute(*tool, "gen_ai.tool.call.arguments").find("README.md"),
              std::string::npos);
    EXPECT_NE(string_attribute(*tool, "gen_ai.tool.call.result").find("42"), std::string::npos);

    EXPECT_EQ(correlator->agent_identity()->name, "test-agent");
    EXPECT_EQ(correlator->client_identity()->name, "zed");
    EXPECT_EQ(correlator->protocol_version(), 1);
}

TEST_F(SpanCorrelatorTest, OutputMessageCarriesFinishReason) {
    auto correlator = make_correlator(true);
    handshake(*correlator);
    correlator->process(kFromEditor, kPrompt);
    correlator->process(kFromAgent,
        R"({"method":"session/update","params":{"sessionId":"s1","update":{"sessionUpdate":"agent_message_chunk","content":{"type":"text","text":"hi"}}}})");
    correlator->process(kFromAgent, kPromptResult);

    const SpanList spans = harness_.spans();
    const auto* prompt = find_span(spans, "invoke_agent test-agent");
    ASSERT_NE(prompt, nullptr);
    const auto output = nlohmann::json::parse(string_attribute(*prompt, "gen_ai.output.messages"));
    ASSERT_TRUE(output.is_array());
    ASSERT_EQ(output.size(), 1u);
    EXPECT_EQ(output[0]["role"], "assistant");
    EXPECT_EQ(output[0]["finish_reason"], "stop");
    EXPECT_EQ(output[0]["parts"][0]["content"], "hi");
}

TEST_F(SpanCorrelatorTest, OutputMessageWithoutStopReasonOmitsFinishReason) {
    auto correlator = make_correlator(true);
    handshake(*correlator);
    correlator->process(kFromEditor, kPrompt);
    correlator->process(kFromAgent, kChunkHello);
    correlator->process(kFromAgent, R"({"jsonrpc":"2.0","id":2,"result":{}})");

    const SpanList spans = harness_.spans();
    const auto* prompt = find_span(spans, "invoke_agent test-agent");
    ASSERT_NE(prompt, nullptr);
    EXPECT_FALSE(has_attribute(*prompt, "gen_ai.response.finish_reasons"));
    EXPECT_FALSE(has_attribute(*prompt, "acp.stop_reason"));
    const auto output = nlohmann::json::parse(string_attribute(*prompt, "gen_ai.output.messages"));
    ASSERT_EQ(output.size(), 1u);
    EXPECT_FALSE(output[0].contains("finish_reason"));
    EXPECT_EQ(output[0]["parts"][0]["content"], "Hello ");
}

TEST_F(SpanCorrelatorTest, InitializeWithoutJsonrpcField) {
    auto correlator = make_correlator(false);
    correlator->process(kFromEditor,
                        R"({"id":1,"method":"initialize","params":{"clientInfo":{"name":"zed"}}})");
    EXPECT_TRUE(correlator->has_root_span());
    correlator->process(kFromAgent,
                        R"({"id":1,"result":{"agentInfo":{"name":"kiro","version":"1.0"}}})");

    const SpanList spans = harness_.spans();
    ASSERT_EQ(spans.size(), 1u);
    EXPECT_EQ(std::string(spans.front()->GetName()), "initialize");
    EXPECT_EQ(string_attribute(*spans.front(), "gen_ai.agent.name"), "kiro");
    ASSERT_TRUE(correlator->agent_identity().has_value());
    EXPECT_EQ(correlator->agent_identity()->version, "1.0");
    EXPECT_FALSE(correlator->protocol_version().has_value());
}

TEST_F(SpanCorrelatorTest, AgentFileReadNestsUnderPrompt) {
    auto correlator = make_correlator(true);
    handshake(*correlator);
    correlator->process(kFromEditor, kPrompt);
    correlator->process(kFromAgent,
        R"({"jsonrpc":"2.0","id":5,"method":"fs/read_text_file","params":{"sessionId":"s1","path":"/etc/hosts"}})");
    EXPECT_EQ(correlator->pending_count(), 2u);
    correlator->process(kFromEditor,
        R"({"jsonrpc":"2.0","id":5,"result":{"content":"127.0.0.1 localhost"}})");
    correlator->process(kFromAgent, kPromptResult);
    correlator->shutdown();

    const SpanList spans = harness_.spans();
    const auto* prompt = find_span(spans, "invoke_agent test-agent");
    const auto* read = find_span(spans, "execute_tool fs/read_text_file");
    ASSERT_NE(prompt, nullptr);
    ASSERT_NE(read, nullptr);
    EXPECT_TRUE(is_child_of(*read, *prompt));
    EXPECT_EQ(string_attribute(*read, "gen_ai.tool.name"), "fs/read_text_file");
    EXPECT_EQ(string_attribute(*read, "gen_ai.tool.call.id"), "5");
    EXPECT_EQ(string_attribute(*read, "gen_ai.tool.type"), "function");
    EXPECT_NE(string_attribute(*read, "gen_ai.tool.call.arguments").find("/etc/hosts"),
              std::string::npos);
    EXPECT_NE(string_attribute(*read, "gen_ai.tool.call.result").find("localhost"),
              std::string::npos);
}

TEST_F(SpanCorrelatorTest, ErrorResponseMarksSpan) {
    auto correlator = make_correlator(false);
    handshake(*correlator);
    correlator->process(kFromEditor, R"({"jsonrpc":"2.0","id":3,"method":"session/load","params":{"sessionId":"old"}})");
    correlator->process(kFromAgent,
        R"({"jsonrpc":"2.0","id":3,"error":{"code":-32601,"message":"Method not found"}})");
    correlator->process(kFromEditor, kPrompt);
    correlator->process(kFromAgent,
        R"({"jsonrpc":"2.0","id":2,"error":{"code":-32603,"message":"model overloaded"}})");
    correlator->shutdown();

    const SpanList spans = harness_.spans();
    const auto* load = find_span(spans, "session/load");
    ASSERT_NE(load, nullptr);
    EXPECT_EQ(load->GetStatus(), StatusCode::kError);
    EXPECT_NE(std::string(load->GetDescription()).find("Method not found"), std::string::npos);

    const auto* prompt = find_span(spans, "invoke_agent test-agent");
    ASSERT_NE(prompt, nullptr);
    EXPECT_EQ(prompt->GetStatus(), StatusCode::kError);
    EXPECT_EQ(string_attribute(*prompt, "error.type"), "-32603");
    EXPECT_FALSE(has_attribute(*prompt, "gen_ai.response.finish_reasons"));
}

TEST_F(SpanCorrelatorTest, SameIdFromBothPeersStaysSeparate) {
    auto correlator = make_correlator(false);
    handshake(*correlator);
    correlator->process(kFromEditor, R"({"jsonrpc":"2.0","id":7,"method":"session/set_mode","params":{"sessionId":"s1","modeId":"ask"}})");
    correlator->process(kFromAgent, R"({"jsonrpc":"2.0","id":7,"method":"terminal/create","params":{"sessionId":"s1","command":"ls"}})");
    EXPECT_EQ(correlator->pending_count(), 2u);

    // The editor answers the agent's request 7.
    correlator->process(kFromEditor, R"({"jsonrpc":"2.0","id":7,"result":{"terminalId":"term-1"}})");
    EXPECT_EQ(correlator->pending_count(), 1u);

    const SpanList ended = harness_.spans();
    ASSERT_EQ(ended.size(), 3u);
    EXPECT_NE(find_span(ended, "execute_tool terminal/create"), nullptr);
    EXPECT_EQ(find_span(ended, "session/set_mode"), nullptr);

    correlator->process(kFromAgent, R"({"jsonrpc":"2.0","id":7,"result":{}})");
    EXPECT_EQ(correlator->pending_count(), 0u);
    const SpanList rest = harness_.spans();
    ASSERT_EQ(rest.size(), 1u);
    EXPECT_EQ(std::string(rest.front()->GetName()), "session/set_mode");
}

TEST_F(SpanCorrelatorTest, NumericAndStringIdsDoNotMatch) {
    auto correlator = make_correlator(false);
    correlator->process(kFromEditor, R"({"jsonrpc":"2.0","id":9,"method":"authenticate","params":{}})");
    correlator->process(kFromAgent, R"({"jsonrpc":"2.0","id":"9","result":{}})");
    EXPECT_EQ(correlator->pending_count(), 1u);
    correlator->process(kFromAgent, R"({"jsonrpc":"2.0","id":9,"result":{}})");
    EXPECT_EQ(correlator->pending_count(), 0u);
}

TEST_F(SpanCorrelatorTest, UnknownResponseAndGarbageAreIgnored) {
    auto correlator = make_correlator(false);
    correlator->process(kFromAgent, R"({"jsonrpc":"2.0","id":99,"result":{}})");
    correlator->process(kFromAgent, "this is not json");
    correlator->process(kFromEditor, "");
    correlator->process(kFromAgent, R"({"jsonrpc":"2.0","method":"session/update","params":{"sessionId":"ghost","update":{"sessionUpdate":"agent_message_chunk","content":{"type":"text","text":"x"}}}})");
    EXPECT_EQ(correlator->pending_count(), 0u);
    EXPECT_EQ(correlator->session_count(), 0u);
    EXPECT_FALSE(correlator->has_root_span());
    EXPECT_TRUE(harness_.spans().empty());
}

TEST_F(SpanCorrelatorTest, ShutdownForceClosesOpenSpansRootLast) {
    auto correlator = make_correlator(false);
    handshake(*correlator);
    correlator->process(kFromEditor, kPrompt);
    correlator->process(kFromAgent, kToolCall);
    correlator->process(kFromEditor, R"({"jsonrpc":"2.0","id":4,"method":"session/cancel_all","params":{}})");
    static_cast<void>(harness_.spans());

    correlator->shutdown();
    EXPECT_FALSE(correlator->has_root_span());
    EXPECT_EQ(correlator->pending_count(), 0u);
    EXPECT_EQ(correlator->session_count(), 0u);

    const SpanList spans = harness_.spans();
    ASSERT_EQ(spans.size(), 4u);
    EXPECT_EQ(std::string(spans.back()->GetName()), "acp_session");

    const auto* prompt = find_span(spans, "invoke_agent test-agent");
    const auto* tool = find_span(spans, "execute_tool Read README");
    const auto* pending = find_span(spans, "session/cancel_all");
    ASSERT_NE(prompt, nullptr);
    ASSERT_NE(tool, nullptr);
    ASSERT_NE(pending, nullptr);
    EXPECT_EQ(prompt->GetStatus(), StatusCode::kError);
    EXPECT_EQ(std::string(prompt->GetDescription()), "session ended unexpectedly");
    EXPECT_EQ(tool->GetStatus(), StatusCode::kError);
    EXPECT_EQ(std::string(tool->GetDescription()), "session ended unexpectedly");
    EXPECT_EQ(pending->GetStatus(), StatusCode::kError);
    EXPECT_EQ(std::string(pending->GetDescription()), "process exited before response");

    // Idempotent; nothing further is emitted or processed.
    correlator->shutdown();
    correlator->process(kFromEditor, kInitialize);
    EXPECT_TRUE(harness_.spans().empty());
}

TEST_F(SpanCorrelatorTest, NewPromptSupersedesOpenOne) {
    auto correlator = make_correlator(false);
    handshake(*correlator);
    correlator->process(kFromEditor, kPrompt);
    correlator->process(kFromEditor, R"({"jsonrpc":"2.0","id":3,"method":"session/prompt","params":{"sessionId":"s1","prompt":[{"type":"text","text":"again"}]}})");

    SpanList superseded = harness_.spans();
    ASSERT_EQ(superseded.size(), 3u);
    const auto* first = find_span(superseded, "invoke_agent test-agent");
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(std::string(first->GetDescription()), "superseded by a newer prompt");

    // The stale response must not close the newer prompt.
    correlator->process(kFromAgent, kPromptResult);
    EXPECT_TRUE(correlator->has_open_prompt("s1"));
    EXPECT_TRUE(harness_.spans().empty());

    correlator->process(kFromAgent, R"({"jsonrpc":"2.0","id":3,"result":{"stopReason":"cancelled"}})");
    EXPECT_FALSE(correlator->has_open_prompt("s1"));
    const SpanList second = harness_.spans();
    ASSERT_EQ(second.size(), 1u);
    EXPECT_EQ(string_array_attribute(*second.front(), "gen_ai.response.finish_reasons"),
              std::vector<std::string>({"cancelled"}));
}

TEST_F(SpanCorrelatorTest, ReusedToolCallIdEndsEarlierSpan) {
    auto correlator = make_correlator(false);
    handshake(*correlator);
    correlator->process(kFromEditor, kPrompt);
    correlator->process(kFromAgent, kToolCall);
    static_cast<void>(harness_.spans());

    correlator->process(kFromAgent, kToolCall);
    EXPECT_EQ(correlator->open_tool_span_count("s1"), 1u);
    const SpanList spans = harness_.spans();
    ASSERT_EQ(spans.size(), 1u);
    EXPECT_EQ(std::string(spans.front()->GetDescription()), "tool call id reused");
}

TEST_F(SpanCorrelatorTest, FailedToolCallIsMarked) {
    auto correlator = make_correlator(false);
    handshake(*correlator);
    correlator->process(kFromEditor, kPrompt);
    correlator->process(kFromAgent, kToolCall);
    correlator->process(kFromAgent, R"({"jsonrpc":"2.0","method":"session/update","params":{"sessionId":"s1","update":{"sessionUpdate":"tool_call_update","toolCallId":"t1","status":"in_progress"}}})");
    EXPECT_EQ(correlator->open_tool_span_count("s1"), 1u);
    correlator->process(kFromAgent, R"({"jsonrpc":"2.0","method":"session/update","params":{"sessionId":"s1","update":{"sessionUpdate":"tool_call_update","toolCallId":"t1","status":"failed"}}})");
    EXPECT_EQ(correlator->open_tool_span_count("s1"), 0u);

    const SpanList spans = harness_.spans();
    const auto* tool = find_span(spans, "execute_tool Read README");
    ASSERT_NE(tool, nullptr);
    EXPECT_EQ(tool->GetStatus(), StatusCode::kError);
    EXPECT_EQ(string_attribute(*tool, "error.type"), "tool_error");
}

TEST_F(SpanCorrelatorTest, ToolCallOutsidePromptHangsOffRoot) {
    auto correlator = make_correlator(false);
    handshake(*correlator);
    correlator->process(kFromAgent, R"({"jsonrpc":"2.0","method":"session/update","params":{"sessionId":"s2","update":{"sessionUpdate":"tool_call","toolCallId":"bg","title":"Index"}}})");
    EXPECT_EQ(correlator->open_tool_span_count("s2"), 1u);
    correlator->shutdown();

    const SpanList spans = harness_.spans();
    const auto* root = find_span(spans, "acp_session");
    const auto* tool = find_span(spans, "execute_tool Index");
    ASSERT_NE(root, nullptr);
    ASSERT_NE(tool, nullptr);
    EXPECT_TRUE(is_child_of(*tool, *root));
    EXPECT_EQ(string_attribute(*tool, "gen_ai.tool.type"), "extension");
}

TEST_F(SpanCorrelatorTest, ContentStaysOffByDefault) {
    auto correlator = make_correlator(false);
    handshake(*correlator);
    correlator->process(kFromEditor, kPrompt);
    correlator->process(kFromAgent, kChunkHello);
    correlator->process(kFromAgent, kToolCall);
    correlator->process(kFromAgent, kToolCallDone);
    correlator->process(kFromAgent, kPromptResult);
    correlator->shutdown();

    const SpanList spans = harness_.spans();
    for (const auto& span : spans) {
        EXPECT_FALSE(has_attribute(*span, "gen_ai.input.messages"));
        EXPECT_FALSE(has_attribute(*span, "gen_ai.output.messages"));
        EXPECT_FALSE(has_attribute(*span, "gen_ai.tool.call.arguments"));
        EXPECT_FALSE(has_attribute(*span, "gen_ai.tool.call.result"));
    }
}

TEST_F(SpanCorrelatorTest, RecordsDurationAndFirstTokenMetrics) {
    auto correlator = make_correlator(false);
    handshake(*correlator);

    correlator->process(kFromEditor, kPrompt);
    correlator->process(kFromAgent, kChunkHello);
    correlator->process(kFromAgent, kPromptResult);

    // Second turn without any streamed chunk: duration only.
    correlator->process(kFromEditor, R"({"jsonrpc":"2.0","id":8,"method":"session/prompt","params":{"sessionId":"s1","prompt":[]}})");
    correlator->process(kFromAgent, R"({"jsonrpc":"2.0","id":8,"result":{"stopReason":"max_tokens"}})");

    EXPECT_EQ(harness_.metric_reader->histogram_count("gen_ai.client.operation.duration"), 2u);
    EXPECT_EQ(harness_.metric_reader->histogram_count("gen_ai.server.time_to_first_token"), 1u);
}

}  // namespace
