#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <nlohmann/json.hpp>

namespace acptrace::protocol {

enum class Direction {
    EditorToAgent,
    AgentToEditor
};

// JSON-RPC id as sent by the peer. `key` is the compact JSON serialization,
// so 1 and "1" stay distinct and compare the same way from both directions.
struct RequestId {
    nlohmann::json value;
    std::string key;
};

struct Request {
    RequestId id;
    std::string method;
    nlohmann::json params;
};

struct Response {
    RequestId id;
    std::optional<nlohmann::json> result;
    std::optional<nlohmann::json> error;
};

struct Notification {
    std::string method;
    nlohmann::json params;
};

using Message = std::variant<Request, Response, Notification>;

struct PeerInfo {
    std::string name;
    std::optional<std::string> version;
};

// Classifies one protocol line. Returns nullopt for anything that is not a
// JSON object shaped like a request, response or notification.
std::optional<Message> parse_line(std::string_view line);

RequestId make_request_id(const nlohmann::json& value);

std::optional<std::string> extract_session_id(const nlohmann::json& params);
std::optional<std::string> extract_prompt_text(const nlohmann::json& params);
std::optional<std::string> extract_update_type(const nlohmann::json& params);
std::optional<std::string> extract_chunk_text(const nlohmann::json& params);
std::optional<std::string> extract_tool_call_id(const nlohmann::json& params);
std::optional<std::string> extract_tool_call_title(const nlohmann::json& params);
std::optional<std::string> extract_tool_call_kind(const nlohmann::json& params);
std::optional<std::string> extract_tool_call_status(const nlohmann::json& params);
std::optional<nlohmann::json> extract_raw_input(const nlohmann::json& params);
std::optional<nlohmann::json> extract_raw_output(const nlohmann::json& params);
std::optional<PeerInfo> extract_agent_info(const nlohmann::json& result);
std::optional<PeerInfo> extract_client_info(const nlohmann::json& params);
std::optional<std::string> extract_stop_reason(const nlohmann::json& result);
std::optional<std::int64_t> extract_protocol_version(const nlohmann::json& result);

// "datastore" for read/search/fetch, "extension" for everything else.
std::string map_tool_kind_to_type(std::string_view kind);

bool is_fs_or_terminal_method(std::string_view method);

std::string map_stop_reason_to_finish_reason(std::string_view stop_reason);

inline std::string to_string(const Direction direction) {
    switch (direction) {
        case Direction::EditorToAgent:
            return "editor->agent";
        case Direction::AgentToEditor:
            return "agent->editor";
        default:
            return "unknown";
    }
}

}  // namespace acptrace::protocol
