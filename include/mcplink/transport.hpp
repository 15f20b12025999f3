#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Transport
// ═══════════════════════════════════════════════════════════════════════════
// A transport moves whole logical messages (one serialized JSON-RPC frame
// each) over a duplex byte stream. Framing is the transport's business; the
// connection above only sees complete messages.
//
// Concrete transports:
//   mcplink/transport/pipe_transport.hpp    newline-delimited JSON over fds
//   mcplink/transport/memory_transport.hpp  in-process pair

#include "mcplink/context.hpp"

#include <tl/expected.hpp>

#include <string>
#include <string_view>

namespace mcplink {

struct TransportError {
    enum class Category {
        Network,    ///< I/O failure
        Timeout,    ///< context deadline passed
        Protocol,   ///< framing violation (oversized frame)
        Closed,     ///< end of stream, or the transport was closed
        Cancelled   ///< context stop requested
    };

    Category category{};
    std::string message;

    [[nodiscard]] static TransportError network(std::string msg) {
        return {Category::Network, std::move(msg)};
    }
    [[nodiscard]] static TransportError protocol(std::string msg) {
        return {Category::Protocol, std::move(msg)};
    }
    [[nodiscard]] static TransportError closed(std::string msg = "end of stream") {
        return {Category::Closed, std::move(msg)};
    }

    /// Cancelled or Timeout depending on why `ctx` fired
    [[nodiscard]] static TransportError from_context(const Context& ctx) {
        if (ctx.reason() == CancelReason::DeadlineExceeded) {
            return {Category::Timeout, "deadline exceeded"};
        }
        return {Category::Cancelled, "operation cancelled"};
    }
};

[[nodiscard]] constexpr std::string_view to_string(TransportError::Category category) noexcept {
    switch (category) {
        case TransportError::Category::Network:   return "Network";
        case TransportError::Category::Timeout:   return "Timeout";
        case TransportError::Category::Protocol:  return "Protocol";
        case TransportError::Category::Closed:    return "Closed";
        case TransportError::Category::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

template <typename T>
using TransportResult = tl::expected<T, TransportError>;

// ─────────────────────────────────────────────────────────────────────────────
// ITransport
// ─────────────────────────────────────────────────────────────────────────────
// send() and receive() may run concurrently with each other; concurrent
// send() calls are serialized internally and never interleave bytes.

class ITransport {
public:
    virtual ~ITransport() = default;

    /// Deliver one complete message
    [[nodiscard]] virtual TransportResult<void> send(const Context& ctx, std::string_view message) = 0;

    /// Block until one complete message arrives, the stream ends, or ctx fires
    [[nodiscard]] virtual TransportResult<std::string> receive(const Context& ctx) = 0;

    /// Release the stream and wake a blocked receive(). A second call is a no-op.
    [[nodiscard]] virtual TransportResult<void> close() = 0;

    [[nodiscard]] virtual bool is_open() const noexcept = 0;
};

}  // namespace mcplink
