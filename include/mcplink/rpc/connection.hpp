#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Connection
// ═══════════════════════════════════════════════════════════════════════════
// JSON-RPC 2.0 request/response correlation over one ITransport.
//
// One dedicated thread runs the receive loop for the connection's whole
// lifetime. call(), notify() and close() are safe from any number of threads.
// Responses are matched to callers by id; notifications go to subscribed
// handlers, each subscription on its own strand of a small thread pool so a
// slow handler never stalls the loop or other subscribers.
//
// Shutdown: the closing signal fires once (explicit close() or a fatal
// receive/protocol error). The loop then exits and a single finalizer
// resolves every pending call with ClientErrorCode::Closed, tears down the
// subscriptions and marks shutdown complete.
//
//   Connection conn(std::move(transport));
//   auto tools = conn.call<ListToolsResult>(ctx, "tools/list", Json::object());
//   (void)conn.close();

#include "mcplink/client/client_error.hpp"
#include "mcplink/context.hpp"
#include "mcplink/protocol/json_rpc.hpp"
#include "mcplink/transport.hpp"

#include <asio/strand.hpp>
#include <asio/thread_pool.hpp>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <vector>

namespace mcplink {

struct ConnectionConfig {
    /// Log component for this connection ("rpc", "server:fs", ...)
    std::string name{"rpc"};

    /// Threads serving notification handlers
    std::size_t notification_threads{1};

    /// Log every inbound/outbound frame at Trace level
    bool trace_frames{false};
};

enum class ConnectionState {
    Open,
    Closing,  ///< closing signal raised, loop still draining
    Closed    ///< loop exited, every pending call resolved
};

[[nodiscard]] constexpr std::string_view to_string(ConnectionState state) noexcept {
    switch (state) {
        case ConnectionState::Open:    return "Open";
        case ConnectionState::Closing: return "Closing";
        case ConnectionState::Closed:  return "Closed";
    }
    return "Unknown";
}

using NotificationHandler = std::function<void(const Notification&)>;
using SubscriptionId = std::uint64_t;

class Connection {
public:
    /// Starts the receive loop immediately
    explicit Connection(std::unique_ptr<ITransport> transport, ConnectionConfig config = {});

    /// close(), then joins the receive loop and the handler pool. When the
    /// last owner lets go from inside a notification handler, the pool is
    /// joined on a detached thread instead.
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;
    Connection(Connection&&) = delete;
    Connection& operator=(Connection&&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Calls
    // ─────────────────────────────────────────────────────────────────────────

    /// Send a request and block for its response, ctx cancellation, or
    /// shutdown. The raw `result` is returned on success; an error reply
    /// becomes ClientErrorCode::ServerError with the RpcError attached.
    [[nodiscard]] ClientResult<Json> call(
        const Context& ctx,
        std::string_view method,
        std::optional<Json> params = std::nullopt
    );

    /// call() and decode the result with T::from_json. A decode failure is
    /// a ProtocolError for this caller only.
    template <typename T>
    [[nodiscard]] ClientResult<T> call(
        const Context& ctx,
        std::string_view method,
        std::optional<Json> params = std::nullopt
    ) {
        auto raw = call(ctx, method, std::move(params));
        if (raw.has_value() == false) {
            return tl::unexpected(std::move(raw.error()));
        }
        try {
            return T::from_json(*raw);
        } catch (const Json::exception& e) {
            return tl::unexpected(ClientError::protocol_error(
                "cannot decode result of " + std::string(method) + ": " + e.what()));
        }
    }

    /// Fire-and-forget notification
    [[nodiscard]] ClientResult<void> notify(
        const Context& ctx,
        std::string_view method,
        std::optional<Json> params = std::nullopt
    );

    // ─────────────────────────────────────────────────────────────────────────
    // Notifications
    // ─────────────────────────────────────────────────────────────────────────

    SubscriptionId on_notification(std::string method, NotificationHandler handler);

    /// Receives every notification regardless of method
    SubscriptionId on_any_notification(NotificationHandler handler);

    /// Returns false if the id is unknown or the registry is already torn down
    bool remove_notification_handler(SubscriptionId id);

    // ─────────────────────────────────────────────────────────────────────────
    // Lifecycle
    // ─────────────────────────────────────────────────────────────────────────

    /// Raise the closing signal, wait for shutdown to complete, then close
    /// the transport. Only the first call touches the transport and can
    /// report its error; later calls succeed immediately.
    [[nodiscard]] ClientResult<void> close();

    /// Block until shutdown completes or ctx fires; true if closed
    [[nodiscard]] bool wait_closed(const Context& ctx);

    [[nodiscard]] ConnectionState state() const;

    /// The fatal cause, if the connection died on its own
    [[nodiscard]] std::optional<ClientError> error() const;

    [[nodiscard]] std::size_t pending_count() const;

    [[nodiscard]] const std::string& name() const noexcept { return config_.name; }

private:
    struct PendingCall {
        std::mutex mutex;
        std::condition_variable cv;
        std::optional<ClientResult<Json>> outcome;
    };

    struct Subscription {
        SubscriptionId id{};
        std::optional<std::string> method;  ///< nullopt matches every method
        NotificationHandler handler;
        asio::strand<asio::thread_pool::executor_type> strand;
    };

    void receive_loop();
    void finalize();

    void handle_response(Response response);
    void handle_notification(Notification notification);

    /// Record `cause` (first one wins) and raise the closing signal
    void fail(ClientError cause);

    [[nodiscard]] ClientError closed_error() const;
    [[nodiscard]] std::shared_ptr<PendingCall> take_pending(RequestId id);
    [[nodiscard]] TransportResult<void> send_frame(const Json& frame);

    SubscriptionId subscribe(std::optional<std::string> method, NotificationHandler handler);

    static void deliver(PendingCall& slot, ClientResult<Json> outcome);

    std::unique_ptr<ITransport> transport_;
    ConnectionConfig config_;

    std::atomic<RequestId> next_id_{1};

    mutable std::mutex pending_mutex_;
    std::unordered_map<RequestId, std::shared_ptr<PendingCall>> pending_;
    bool pending_closed_{false};

    std::mutex write_mutex_;

    std::stop_source closing_;

    mutable std::mutex state_mutex_;
    std::condition_variable_any shutdown_cv_;
    bool shutdown_complete_{false};
    std::optional<ClientError> fatal_error_;

    std::mutex close_mutex_;
    bool transport_released_{false};

    // Shared so a destructor running on one of its own threads can hand
    // the join to another thread
    std::shared_ptr<asio::thread_pool> handler_pool_;
    std::mutex subscriptions_mutex_;
    std::vector<std::shared_ptr<Subscription>> subscriptions_;
    SubscriptionId next_subscription_id_{1};
    bool subscriptions_closed_{false};

    std::thread receive_thread_;
};

}  // namespace mcplink
