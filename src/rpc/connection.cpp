#include "mcplink/rpc/connection.hpp"
#include "mcplink/log/logger.hpp"

#include <asio/post.hpp>

#include <algorithm>
#include <format>
#include <type_traits>
#include <variant>

namespace mcplink {

namespace {

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

constexpr std::size_t kMaxLoggedFrame = 256;

std::string truncate_for_log(std::string_view frame) {
    if (frame.size() <= kMaxLoggedFrame) {
        return std::string(frame);
    }
    return std::string(frame.substr(0, kMaxLoggedFrame)) + "...";
}

ClientError from_context(const Context& ctx) {
    if (ctx.reason() == CancelReason::DeadlineExceeded) {
        return ClientError::timeout();
    }
    return ClientError::cancelled();
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Construction / Destruction
// ─────────────────────────────────────────────────────────────────────────────

Connection::Connection(std::unique_ptr<ITransport> transport, ConnectionConfig config)
    : transport_(std::move(transport))
    , config_(std::move(config))
    , handler_pool_(std::make_shared<asio::thread_pool>(
          config_.notification_threads == 0 ? 1 : config_.notification_threads))
{
    receive_thread_ = std::thread([this] { receive_loop(); });
}

Connection::~Connection() {
    if (auto result = close(); result.has_value() == false) {
        MCPLINK_LOG_WARN(config_.name, "close in destructor: " + result.error().message);
    }
    if (receive_thread_.joinable()) {
        receive_thread_.join();
    }

    // A pool thread cannot join its own pool
    if (handler_pool_->get_executor().running_in_this_thread()) {
        MCPLINK_LOG_DEBUG(config_.name, "destroyed from a notification handler, joining handlers off-thread");
        std::thread([pool = std::move(handler_pool_)] { pool->join(); }).detach();
        return;
    }
    handler_pool_->join();
}

// ─────────────────────────────────────────────────────────────────────────────
// Calls
// ─────────────────────────────────────────────────────────────────────────────

ClientResult<Json> Connection::call(
    const Context& ctx,
    std::string_view method,
    std::optional<Json> params
) {
    if (closing_.stop_requested()) {
        return tl::unexpected(closed_error());
    }
    if (ctx.cancelled()) {
        return tl::unexpected(from_context(ctx));
    }

    const RequestId id = next_id_.fetch_add(1, std::memory_order_relaxed);
    auto slot = std::make_shared<PendingCall>();

    // Registered before sending so a fast reply always finds its slot
    {
        std::lock_guard lock(pending_mutex_);
        if (pending_closed_) {
            return tl::unexpected(closed_error());
        }
        pending_.emplace(id, slot);
    }

    Request request{id, std::string(method), std::move(params)};
    if (auto sent = send_frame(request.to_json()); sent.has_value() == false) {
        (void)take_pending(id);
        if (closing_.stop_requested()) {
            return tl::unexpected(closed_error());
        }
        auto cause = ClientError::transport_error("send failed: " + sent.error().message);
        fail(cause);
        return tl::unexpected(std::move(cause));
    }

    // stop_callback may run inline when already stopped, so it is set up
    // before slot->mutex is taken.
    const auto wake = [&slot] {
        std::lock_guard lock(slot->mutex);
        slot->cv.notify_all();
    };
    std::stop_callback wake_on_cancel(ctx.stop_token(), wake);
    std::stop_callback wake_on_close(closing_.get_token(), wake);

    std::unique_lock lock(slot->mutex);
    while (true) {
        if (slot->outcome.has_value()) {
            return std::move(*slot->outcome);
        }
        if (ctx.cancelled() || closing_.stop_requested()) {
            break;
        }
        if (ctx.deadline().has_value()) {
            slot->cv.wait_until(lock, *ctx.deadline());
        } else {
            slot->cv.wait(lock);
        }
    }
    lock.unlock();

    // The receive loop may have taken the entry in the meantime; a reply that
    // lands after this point is logged as an orphan.
    (void)take_pending(id);

    if (ctx.cancelled()) {
        MCPLINK_LOG_DEBUG(config_.name, std::format("call {} ({}) abandoned by caller", id, method));
        return tl::unexpected(from_context(ctx));
    }
    return tl::unexpected(closed_error());
}

ClientResult<void> Connection::notify(
    const Context& ctx,
    std::string_view method,
    std::optional<Json> params
) {
    if (closing_.stop_requested()) {
        return tl::unexpected(closed_error());
    }
    if (ctx.cancelled()) {
        return tl::unexpected(from_context(ctx));
    }

    Notification notification{std::string(method), std::move(params)};
    if (auto sent = send_frame(notification.to_json()); sent.has_value() == false) {
        if (closing_.stop_requested()) {
            return tl::unexpected(closed_error());
        }
        auto cause = ClientError::transport_error("send failed: " + sent.error().message);
        fail(cause);
        return tl::unexpected(std::move(cause));
    }
    return {};
}

TransportResult<void> Connection::send_frame(const Json& frame) {
    const std::string payload = encode(frame);
    if (config_.trace_frames) {
        MCPLINK_LOG_TRACE(config_.name, "--> " + truncate_for_log(payload));
    }

    // Only close() interrupts a send; a half-written frame would corrupt the stream
    const auto send_ctx = Context::background().with_stop_token(closing_.get_token());

    std::lock_guard lock(write_mutex_);
    return transport_->send(send_ctx, payload);
}

std::shared_ptr<Connection::PendingCall> Connection::take_pending(RequestId id) {
    std::lock_guard lock(pending_mutex_);
    const auto it = pending_.find(id);
    if (it == pending_.end()) {
        return nullptr;
    }
    auto slot = std::move(it->second);
    pending_.erase(it);
    return slot;
}

void Connection::deliver(PendingCall& slot, ClientResult<Json> outcome) {
    {
        std::lock_guard lock(slot.mutex);
        if (slot.outcome.has_value() == false) {
            slot.outcome = std::move(outcome);
        }
    }
    slot.cv.notify_all();
}

// ─────────────────────────────────────────────────────────────────────────────
// Receive Loop
// ─────────────────────────────────────────────────────────────────────────────

void Connection::receive_loop() {
    struct Finalizer {
        Connection& connection;
        ~Finalizer() { connection.finalize(); }
    } finalizer{*this};

    const auto loop_ctx = Context::background().with_stop_token(closing_.get_token());

    while (true) {
        auto frame = transport_->receive(loop_ctx);
        if (frame.has_value() == false) {
            if (closing_.stop_requested()) {
                return;
            }
            const auto& error = frame.error();
            if (error.category == TransportError::Category::Closed) {
                fail(ClientError::transport_error("transport closed: " + error.message));
            } else {
                fail(ClientError::transport_error(
                    std::string(to_string(error.category)) + " error: " + error.message));
            }
            return;
        }

        if (config_.trace_frames) {
            MCPLINK_LOG_TRACE(config_.name, "<-- " + truncate_for_log(*frame));
        }

        auto message = parse_incoming(*frame);
        if (message.has_value() == false) {
            MCPLINK_LOG_ERROR(config_.name, "protocol violation in frame: " + truncate_for_log(*frame));
            fail(ClientError::protocol_error(message.error().message));
            return;
        }

        std::visit(overloaded{
            [this](Response& response) { handle_response(std::move(response)); },
            [this](Notification& notification) { handle_notification(std::move(notification)); }
        }, *message);
    }
}

void Connection::handle_response(Response response) {
    auto slot = take_pending(response.id);
    if (slot == nullptr) {
        MCPLINK_LOG_DEBUG(config_.name, std::format("dropping response for unknown id {}", response.id));
        return;
    }

    if (response.error.has_value()) {
        deliver(*slot, tl::unexpected(ClientError::from_rpc_error(*response.error)));
    } else {
        deliver(*slot, std::move(response.result));
    }
}

void Connection::handle_notification(Notification notification) {
    std::vector<std::shared_ptr<Subscription>> targets;
    {
        std::lock_guard lock(subscriptions_mutex_);
        for (const auto& subscription : subscriptions_) {
            const bool matches = (subscription->method.has_value() == false)
                || (*subscription->method == notification.method);
            if (matches) {
                targets.push_back(subscription);
            }
        }
    }

    if (targets.empty()) {
        MCPLINK_LOG_DEBUG(config_.name, "no handler for notification " + notification.method);
        return;
    }

    auto shared = std::make_shared<const Notification>(std::move(notification));
    for (auto& subscription : targets) {
        // The handler may destroy this connection, so nothing after it touches `this`
        asio::post(subscription->strand, [name = config_.name, subscription, shared] {
            try {
                subscription->handler(*shared);
            } catch (const std::exception& e) {
                MCPLINK_LOG_ERROR(name, std::format(
                    "notification handler for {} threw: {}", shared->method, e.what()));
            }
        });
    }
}

void Connection::fail(ClientError cause) {
    {
        std::lock_guard lock(state_mutex_);
        if (fatal_error_.has_value() == false) {
            MCPLINK_LOG_ERROR(config_.name, "connection failed: " + cause.describe());
            fatal_error_ = std::move(cause);
        }
    }
    closing_.request_stop();
}

void Connection::finalize() {
    closing_.request_stop();

    std::unordered_map<RequestId, std::shared_ptr<PendingCall>> orphaned;
    {
        std::lock_guard lock(pending_mutex_);
        pending_closed_ = true;
        orphaned.swap(pending_);
    }

    const auto error = closed_error();
    for (auto& [id, slot] : orphaned) {
        deliver(*slot, tl::unexpected(error));
    }
    if (orphaned.empty() == false) {
        MCPLINK_LOG_DEBUG(config_.name, std::format("resolved {} pending call(s) on shutdown", orphaned.size()));
    }

    {
        std::lock_guard lock(subscriptions_mutex_);
        subscriptions_closed_ = true;
        subscriptions_.clear();
    }

    {
        std::lock_guard lock(state_mutex_);
        shutdown_complete_ = true;
    }
    shutdown_cv_.notify_all();
}

// ─────────────────────────────────────────────────────────────────────────────
// Notifications
// ─────────────────────────────────────────────────────────────────────────────

SubscriptionId Connection::on_notification(std::string method, NotificationHandler handler) {
    return subscribe(std::move(method), std::move(handler));
}

SubscriptionId Connection::on_any_notification(NotificationHandler handler) {
    return subscribe(std::nullopt, std::move(handler));
}

SubscriptionId Connection::subscribe(std::optional<std::string> method, NotificationHandler handler) {
    std::lock_guard lock(subscriptions_mutex_);
    const SubscriptionId id = next_subscription_id_++;
    if (subscriptions_closed_) {
        MCPLINK_LOG_DEBUG(config_.name, "subscription after shutdown is never served");
        return id;
    }

    auto subscription = std::make_shared<Subscription>(Subscription{
        id,
        std::move(method),
        std::move(handler),
        asio::make_strand(*handler_pool_)
    });
    subscriptions_.push_back(std::move(subscription));
    return id;
}

bool Connection::remove_notification_handler(SubscriptionId id) {
    std::lock_guard lock(subscriptions_mutex_);
    const auto it = std::find_if(subscriptions_.begin(), subscriptions_.end(),
        [id](const auto& subscription) { return subscription->id == id; });
    if (it == subscriptions_.end()) {
        return false;
    }
    subscriptions_.erase(it);
    return true;
}

// ─────────────────────────────────────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────────────────────────────────────

ClientResult<void> Connection::close() {
    closing_.request_stop();

    {
        std::unique_lock lock(state_mutex_);
        shutdown_cv_.wait(lock, [this] { return shutdown_complete_; });
    }

    std::lock_guard lock(close_mutex_);
    if (transport_released_) {
        return {};
    }
    transport_released_ = true;

    if (auto closed = transport_->close(); closed.has_value() == false) {
        return tl::unexpected(ClientError::transport_error("transport close failed: " + closed.error().message));
    }
    MCPLINK_LOG_DEBUG(config_.name, "connection closed");
    return {};
}

bool Connection::wait_closed(const Context& ctx) {
    std::unique_lock lock(state_mutex_);
    const auto done = [this] { return shutdown_complete_; };
    if (ctx.deadline().has_value()) {
        return shutdown_cv_.wait_until(lock, ctx.stop_token(), *ctx.deadline(), done);
    }
    return shutdown_cv_.wait(lock, ctx.stop_token(), done);
}

ConnectionState Connection::state() const {
    std::lock_guard lock(state_mutex_);
    if (shutdown_complete_) {
        return ConnectionState::Closed;
    }
    if (closing_.stop_requested()) {
        return ConnectionState::Closing;
    }
    return ConnectionState::Open;
}

std::optional<ClientError> Connection::error() const {
    std::lock_guard lock(state_mutex_);
    return fatal_error_;
}

std::size_t Connection::pending_count() const {
    std::lock_guard lock(pending_mutex_);
    return pending_.size();
}

ClientError Connection::closed_error() const {
    std::lock_guard lock(state_mutex_);
    if (fatal_error_.has_value()) {
        return ClientError::closed(fatal_error_->message);
    }
    return ClientError::closed();
}

}  // namespace mcplink
