#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// JSON-RPC 2.0 Message Model
// ═══════════════════════════════════════════════════════════════════════════
// Outbound: Request and Notification are built here and dumped as one line.
// Inbound: classify_incoming() sorts a parsed frame into a Response or a
// Notification; anything else is a FrameError, which the connection treats
// as a fatal protocol violation.

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace mcplink {

using Json = nlohmann::json;

inline constexpr std::string_view JSONRPC_VERSION{"2.0"};

using RequestId = std::int64_t;

// ─────────────────────────────────────────────────────────────────────────────
// RpcError
// ─────────────────────────────────────────────────────────────────────────────

struct RpcError {
    std::int64_t code{};
    std::string message;
    std::optional<Json> data{};

    // Standard codes
    static constexpr std::int64_t PARSE_ERROR      = -32700;
    static constexpr std::int64_t INVALID_REQUEST  = -32600;
    static constexpr std::int64_t METHOD_NOT_FOUND = -32601;
    static constexpr std::int64_t INVALID_PARAMS   = -32602;
    static constexpr std::int64_t INTERNAL_ERROR   = -32603;

    [[nodiscard]] Json to_json() const;
};

// ─────────────────────────────────────────────────────────────────────────────
// Messages
// ─────────────────────────────────────────────────────────────────────────────

struct Request {
    RequestId id{};
    std::string method;
    std::optional<Json> params{};

    [[nodiscard]] Json to_json() const;
};

struct Notification {
    std::string method;
    std::optional<Json> params{};

    [[nodiscard]] Json to_json() const;
};

/// Exactly one of result/error is meaningful. A peer reply carrying
/// neither is decoded as a null result.
struct Response {
    RequestId id{};
    Json result{};
    std::optional<RpcError> error{};

    [[nodiscard]] bool is_error() const noexcept { return error.has_value(); }
    [[nodiscard]] Json to_json() const;
};

// ─────────────────────────────────────────────────────────────────────────────
// Frame classification
// ─────────────────────────────────────────────────────────────────────────────

struct FrameError {
    enum class Code {
        Malformed,          ///< not JSON, or not a JSON object
        InvalidVersion,     ///< "jsonrpc" missing or not "2.0"
        InvalidId,          ///< id neither an integer nor a decimal string
        InvalidMethod,      ///< method present but not a string
        InvalidResponse,    ///< both result and error present
        InvalidErrorObject, ///< error lacks an integer code or string message
        UnexpectedRequest,  ///< carries both id and method
        UnknownShape        ///< neither a response nor a notification
    };

    Code code{Code::Malformed};
    std::string message;
};

[[nodiscard]] constexpr std::string_view to_string(FrameError::Code code) noexcept {
    switch (code) {
        case FrameError::Code::Malformed:          return "Malformed";
        case FrameError::Code::InvalidVersion:     return "InvalidVersion";
        case FrameError::Code::InvalidId:          return "InvalidId";
        case FrameError::Code::InvalidMethod:      return "InvalidMethod";
        case FrameError::Code::InvalidResponse:    return "InvalidResponse";
        case FrameError::Code::InvalidErrorObject: return "InvalidErrorObject";
        case FrameError::Code::UnexpectedRequest:  return "UnexpectedRequest";
        case FrameError::Code::UnknownShape:       return "UnknownShape";
    }
    return "Unknown";
}

template <typename T>
using FrameResult = tl::expected<T, FrameError>;

using IncomingMessage = std::variant<Response, Notification>;

/// Classify an already parsed frame
[[nodiscard]] FrameResult<IncomingMessage> classify_incoming(const Json& frame);

/// Parse (simdjson) and classify one raw frame
[[nodiscard]] FrameResult<IncomingMessage> parse_incoming(std::string_view raw);

/// Decode an error object. Used for Response.error and for tests.
[[nodiscard]] FrameResult<RpcError> parse_rpc_error(const Json& node);

/// Compact single-line encoding
[[nodiscard]] std::string encode(const Json& message);

}  // namespace mcplink
