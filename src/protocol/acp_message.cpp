#include "protocol/acp_message.hpp"

#include <array>
#include <limits>
#include <utility>

namespace acptrace::protocol {

using nlohmann::json;

namespace {

const json* member(const json& value, const char* key) {
    if (!value.is_object()) {
        return nullptr;
    }
    const auto it = value.find(key);
    if (it == value.end()) {
        return nullptr;
    }
    return &(*it);
}

json* mutable_member(json& value, const char* key) {
    if (!value.is_object()) {
        return nullptr;
    }
    const auto it = value.find(key);
    if (it == value.end()) {
        return nullptr;
    }
    return &(*it);
}

std::optional<std::string> string_member(const json& value, const char* key) {
    const json* field = member(value, key);
    if (field == nullptr || !field->is_string()) {
        return std::nullopt;
    }
    return field->get<std::string>();
}

const json* update_of(const json& params) {
    return member(params, "update");
}

std::optional<std::string> update_string(const json& params, const char* key) {
    const json* update = update_of(params);
    if (update == nullptr) {
        return std::nullopt;
    }
    return string_member(*update, key);
}

std::optional<PeerInfo> peer_info(const json& holder, const char* key) {
    const json* info = member(holder, key);
    if (info == nullptr) {
        return std::nullopt;
    }
    auto name = string_member(*info, "name");
    if (!name.has_value()) {
        return std::nullopt;
    }
    return PeerInfo{std::move(*name), string_member(*info, "version")};
}

constexpr int kMaxNestingDepth = 128;

constexpr std::array<std::string_view, 6> kFsTerminalMethods = {
    "fs/read_text_file", "fs/write_text_file", "terminal/create",
    "terminal/write",    "terminal/resize",    "terminal/release"};

}  // namespace

RequestId make_request_id(const json& value) {
    return RequestId{value, value.dump()};
}

std::optional<Message> parse_line(const std::string_view line) {
    // Deep nesting is dropped while parsing so later copies and dumps stay
    // bounded; the line itself is still forwarded by the tap.
    bool too_deep = false;
    const json::parser_callback_t depth_guard =
        [&too_deep](const int depth, const json::parse_event_t /*event*/, json& /*parsed*/) {
            if (depth > kMaxNestingDepth) {
                too_deep = true;
                return false;
            }
            return true;
        };
    json value = json::parse(line.begin(), line.end(), depth_guard, false);
    if (too_deep || value.is_discarded() || !value.is_object()) {
        return std::nullopt;
    }

    json* id = mutable_member(value, "id");
    const json* method = member(value, "method");

    if (method != nullptr && method->is_string()) {
        std::string method_name = method->get<std::string>();
        json params_value(nullptr);
        if (json* params = mutable_member(value, "params")) {
            params_value = std::move(*params);
        }
        if (id != nullptr) {
            return Message{Request{make_request_id(*id), std::move(method_name),
                                   std::move(params_value)}};
        }
        return Message{Notification{std::move(method_name), std::move(params_value)}};
    }

    if (id == nullptr) {
        return std::nullopt;
    }

    Response response;
    response.id = make_request_id(*id);
    if (json* result = mutable_member(value, "result")) {
        response.result = std::move(*result);
    }
    if (json* error = mutable_member(value, "error")) {
        response.error = std::move(*error);
    }
    return Message{std::move(response)};
}

std::optional<std::string> extract_session_id(const json& params) {
    return string_member(params, "sessionId");
}

std::optional<std::string> extract_prompt_text(const json& params) {
    const json* prompt = member(params, "prompt");
    if (prompt == nullptr || !prompt->is_array()) {
        return std::nullopt;
    }

    std::string joined;
    bool found = false;
    for (const auto& block : *prompt) {
        const auto type = string_member(block, "type");
        if (!type.has_value() || *type != "text") {
            continue;
        }
        const auto text = string_member(block, "text");
        if (!text.has_value()) {
            continue;
        }
        if (found) {
            joined.push_back('\n');
        }
        joined += *text;
        found = true;
    }

    if (!found) {
        return std::nullopt;
    }
    return joined;
}

std::optional<std::string> extract_update_type(const json& params) {
    return update_string(params, "sessionUpdate");
}

std::optional<std::string> extract_chunk_text(const json& params) {
    const json* update = update_of(params);
    if (update == nullptr) {
        return std::nullopt;
    }
    const json* content = member(*update, "content");
    if (content == nullptr) {
        return std::nullopt;
    }
    return string_member(*content, "text");
}

std::optional<std::string> extract_tool_call_id(const json& params) {
    return update_string(params, "toolCallId");
}

std::optional<std::string> extract_tool_call_title(const json& params) {
    return update_string(params, "title");
}

std::optional<std::string> extract_tool_call_kind(const json& params) {
    return update_string(params, "kind");
}

std::optional<std::string> extract_tool_call_status(const json& params) {
    return update_string(params, "status");
}

std::optional<json> extract_raw_input(const json& params) {
    const json* update = update_of(params);
    if (update == nullptr) {
        return std::nullopt;
    }
    const json* raw = member(*update, "rawInput");
    if (raw == nullptr) {
        return std::nullopt;
    }
    return *raw;
}

std::optional<json> extract_raw_output(const json& params) {
    const json* update = update_of(params);
    if (update == nullptr) {
        return std::nullopt;
    }
    const json* raw = member(*update, "rawOutput");
    if (raw == nullptr) {
        return std::nullopt;
    }
    return *raw;
}

std::optional<PeerInfo> extract_agent_info(const json& result) {
    return peer_info(result, "agentInfo");
}

std::optional<PeerInfo> extract_client_info(const json& params) {
    return peer_info(params, "clientInfo");
}

std::optional<std::string> extract_stop_reason(const json& result) {
    return string_member(result, "stopReason");
}

std::optional<std::int64_t> extract_protocol_version(const json& result) {
    const json* version = member(result, "protocolVersion");
    if (version == nullptr || !version->is_number_integer()) {
        return std::nullopt;
    }
    if (version->is_number_unsigned() &&
        version->get<std::uint64_t>() >
            static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        return std::nullopt;
    }
    return version->get<std::int64_t>();
}

std::string map_tool_kind_to_type(const std::string_view kind) {
    if (kind == "read" || kind == "search" || kind == "fetch") {
        return "datastore";
    }
    // edit, delete, move, execute, think, other and anything unrecognized
    return "extension";
}

bool is_fs_or_terminal_method(const std::string_view method) {
    for (const auto candidate : kFsTerminalMethods) {
        if (candidate == method) {
            return true;
        }
    }
    return false;
}

std::string map_stop_reason_to_finish_reason(const std::string_view stop_reason) {
    if (stop_reason == "end_turn") {
        return "stop";
    }
    if (stop_reason == "max_tokens" || stop_reason == "max_turn_requests") {
        return "length";
    }
    if (stop_reason == "refusal") {
        return "content_filter";
    }
    if (stop_reason == "cancelled") {
        return "cancelled";
    }
    return "unknown";
}

}  // namespace acptrace::protocol
