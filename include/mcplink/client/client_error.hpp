#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Client Error
// ═══════════════════════════════════════════════════════════════════════════
// One error type for everything above the transport: the connection, the
// server wrapper and the tool registry all return ClientResult<T>.

#include "mcplink/protocol/json_rpc.hpp"

#include <tl/expected.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace mcplink {

enum class ClientErrorCode {
    TransportError,   ///< stream closed, process exited, I/O failure
    ProtocolError,    ///< malformed frame, or a result that does not decode
    ServerError,      ///< peer replied with a JSON-RPC error object
    Cancelled,        ///< caller's stop token fired
    Timeout,          ///< caller's deadline passed
    Closed,           ///< connection is closing or closed
    NotStarted,       ///< server wrapper is not running
    SpawnFailed,      ///< child process could not be started
    InvalidArgument   ///< bad input: empty command, unknown tool, double start
};

[[nodiscard]] constexpr std::string_view to_string(ClientErrorCode code) noexcept {
    switch (code) {
        case ClientErrorCode::TransportError:  return "TransportError";
        case ClientErrorCode::ProtocolError:   return "ProtocolError";
        case ClientErrorCode::ServerError:     return "ServerError";
        case ClientErrorCode::Cancelled:       return "Cancelled";
        case ClientErrorCode::Timeout:         return "Timeout";
        case ClientErrorCode::Closed:          return "Closed";
        case ClientErrorCode::NotStarted:      return "NotStarted";
        case ClientErrorCode::SpawnFailed:     return "SpawnFailed";
        case ClientErrorCode::InvalidArgument: return "InvalidArgument";
    }
    return "Unknown";
}

struct ClientError {
    ClientErrorCode code;
    std::string message;
    std::optional<RpcError> rpc_error;  ///< set for ServerError

    [[nodiscard]] std::string describe() const {
        return std::string(to_string(code)) + ": " + message;
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Factory Methods
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] static ClientError transport_error(std::string msg) {
        return {ClientErrorCode::TransportError, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static ClientError protocol_error(std::string msg) {
        return {ClientErrorCode::ProtocolError, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static ClientError from_rpc_error(const RpcError& err) {
        return {ClientErrorCode::ServerError, err.message, err};
    }

    [[nodiscard]] static ClientError cancelled() {
        return {ClientErrorCode::Cancelled, "call was cancelled", std::nullopt};
    }

    [[nodiscard]] static ClientError timeout() {
        return {ClientErrorCode::Timeout, "deadline exceeded", std::nullopt};
    }

    /// `cause` empty for an explicit close
    [[nodiscard]] static ClientError closed(std::string_view cause = {}) {
        std::string msg = "connection closed";
        if (cause.empty() == false) {
            msg += ": ";
            msg += cause;
        }
        return {ClientErrorCode::Closed, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static ClientError not_started() {
        return {ClientErrorCode::NotStarted, "server is not running", std::nullopt};
    }

    [[nodiscard]] static ClientError spawn_failed(std::string msg) {
        return {ClientErrorCode::SpawnFailed, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static ClientError invalid_argument(std::string msg) {
        return {ClientErrorCode::InvalidArgument, std::move(msg), std::nullopt};
    }
};

template <typename T>
using ClientResult = tl::expected<T, ClientError>;

}  // namespace mcplink
