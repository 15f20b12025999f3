#include "mcplink/protocol/json_rpc.hpp"

#include "mcplink/json/fast_json.hpp"

#include <charconv>
#include <limits>

namespace mcplink {
namespace {

FrameError frame_error(FrameError::Code code, std::string message) {
    return FrameError{code, std::move(message)};
}

bool has_non_null(const Json& frame, const char* key) {
    const auto it = frame.find(key);
    return (it != frame.end()) && (it->is_null() == false);
}

FrameResult<RequestId> parse_id(const Json& id_node) {
    if (id_node.is_number_integer() == true) {
        if (id_node.is_number_unsigned() == true) {
            const auto value = id_node.get<std::uint64_t>();
            if (value > static_cast<std::uint64_t>(std::numeric_limits<RequestId>::max())) {
                return tl::unexpected(frame_error(FrameError::Code::InvalidId, "id out of range"));
            }
            return static_cast<RequestId>(value);
        }
        return id_node.get<RequestId>();
    }

    if (id_node.is_string() == true) {
        const auto& text = id_node.get_ref<const std::string&>();
        RequestId value = 0;
        const auto* first = text.data();
        const auto* last = text.data() + text.size();
        const auto [ptr, ec] = std::from_chars(first, last, value);
        const bool parsed_whole = (ec == std::errc{}) && (ptr == last) && (text.empty() == false);
        if (parsed_whole) {
            return value;
        }
        return tl::unexpected(frame_error(
            FrameError::Code::InvalidId,
            "string id is not a decimal integer: \"" + text + "\""));
    }

    return tl::unexpected(frame_error(FrameError::Code::InvalidId, "id must be an integer or a decimal string"));
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Encoding
// ─────────────────────────────────────────────────────────────────────────────

Json RpcError::to_json() const {
    Json payload = {{"code", code}, {"message", message}};
    if (data.has_value()) {
        payload["data"] = *data;
    }
    return payload;
}

Json Request::to_json() const {
    Json payload = Json::object();
    payload["jsonrpc"] = JSONRPC_VERSION;
    payload["id"] = id;
    payload["method"] = method;
    if (params.has_value()) {
        payload["params"] = *params;
    }
    return payload;
}

Json Notification::to_json() const {
    Json payload = Json::object();
    payload["jsonrpc"] = JSONRPC_VERSION;
    payload["method"] = method;
    if (params.has_value()) {
        payload["params"] = *params;
    }
    return payload;
}

Json Response::to_json() const {
    Json payload = Json::object();
    payload["jsonrpc"] = JSONRPC_VERSION;
    payload["id"] = id;
    if (error.has_value()) {
        payload["error"] = error->to_json();
    } else {
        payload["result"] = result;
    }
    return payload;
}

std::string encode(const Json& message) {
    // dump() never emits raw newlines, so one message stays on one line
    return message.dump(-1, ' ', false, Json::error_handler_t::replace);
}

// ─────────────────────────────────────────────────────────────────────────────
// Decoding
// ─────────────────────────────────────────────────────────────────────────────

FrameResult<RpcError> parse_rpc_error(const Json& node) {
    if (node.is_object() == false) {
        return tl::unexpected(frame_error(FrameError::Code::InvalidErrorObject, "error must be an object"));
    }

    const auto code_it = node.find("code");
    if (code_it == node.end() || code_it->is_number_integer() == false) {
        return tl::unexpected(frame_error(FrameError::Code::InvalidErrorObject, "error.code must be an integer"));
    }

    const auto message_it = node.find("message");
    if (message_it == node.end() || message_it->is_string() == false) {
        return tl::unexpected(frame_error(FrameError::Code::InvalidErrorObject, "error.message must be a string"));
    }

    RpcError error;
    error.code = code_it->get<std::int64_t>();
    error.message = message_it->get<std::string>();
    if (const auto data_it = node.find("data"); data_it != node.end()) {
        error.data = *data_it;
    }
    return error;
}

FrameResult<IncomingMessage> classify_incoming(const Json& frame) {
    if (frame.is_object() == false) {
        return tl::unexpected(frame_error(FrameError::Code::Malformed, "frame is not a JSON object"));
    }

    const auto version_it = frame.find("jsonrpc");
    if (version_it == frame.end() || version_it->is_string() == false || *version_it != JSONRPC_VERSION) {
        return tl::unexpected(frame_error(FrameError::Code::InvalidVersion, "jsonrpc must equal \"2.0\""));
    }

    const bool has_id = has_non_null(frame, "id");
    const bool has_method = frame.contains("method");

    if (has_method == true) {
        const Json& method_node = frame.at("method");
        if (method_node.is_string() == false) {
            return tl::unexpected(frame_error(FrameError::Code::InvalidMethod, "method must be a string"));
        }
        if (has_id == true) {
            return tl::unexpected(frame_error(
                FrameError::Code::UnexpectedRequest,
                "peer sent a request (\"" + method_node.get<std::string>() + "\"); server requests are not served"));
        }

        Notification notification;
        notification.method = method_node.get<std::string>();
        if (const auto params_it = frame.find("params"); params_it != frame.end()) {
            notification.params = *params_it;
        }
        return IncomingMessage{std::move(notification)};
    }

    if (has_id == false) {
        return tl::unexpected(frame_error(FrameError::Code::UnknownShape, "frame has neither an id nor a method"));
    }

    auto id = parse_id(frame.at("id"));
    if (id.has_value() == false) {
        return tl::unexpected(id.error());
    }

    // A null member counts as absent; some servers send "error":null on success
    const bool has_result = has_non_null(frame, "result");
    const bool has_error = has_non_null(frame, "error");
    if (has_result == true && has_error == true) {
        return tl::unexpected(frame_error(FrameError::Code::InvalidResponse, "response carries both result and error"));
    }

    Response response;
    response.id = *id;
    if (has_error == true) {
        auto error = parse_rpc_error(frame.at("error"));
        if (error.has_value() == false) {
            return tl::unexpected(error.error());
        }
        response.error = std::move(*error);
    } else if (has_result == true) {
        response.result = frame.at("result");
    }
    return IncomingMessage{std::move(response)};
}

FrameResult<IncomingMessage> parse_incoming(std::string_view raw) {
    auto parsed = fast_parse(raw);
    if (parsed.has_value() == false) {
        return tl::unexpected(frame_error(FrameError::Code::Malformed, "invalid JSON: " + parsed.error().message));
    }
    return classify_incoming(*parsed);
}

}  // namespace mcplink
