#include "mcplink/transport/memory_transport.hpp"
#include "mcplink/log/logger.hpp"

namespace mcplink {

MemoryTransport::Pair MemoryTransport::make_pair() {
    auto a_to_b = std::make_shared<Channel>();
    auto b_to_a = std::make_shared<Channel>();

    return {
        std::make_unique<MemoryTransport>(ConstructionKey{}, b_to_a, a_to_b),
        std::make_unique<MemoryTransport>(ConstructionKey{}, a_to_b, b_to_a)
    };
}

MemoryTransport::MemoryTransport(ConstructionKey, std::shared_ptr<Channel> inbox, std::shared_ptr<Channel> outbox)
    : inbox_(std::move(inbox))
    , outbox_(std::move(outbox))
{}

MemoryTransport::~MemoryTransport() {
    if (auto result = close(); result.has_value() == false) {
        MCPLINK_LOG_WARN("transport", "memory transport close failed: " + result.error().message);
    }
}

void MemoryTransport::shut(Channel& channel) {
    {
        std::lock_guard lock(channel.mutex);
        channel.closed = true;
    }
    channel.cv.notify_all();
}

TransportResult<void> MemoryTransport::send(const Context& ctx, std::string_view message) {
    if (ctx.cancelled()) {
        return tl::unexpected(TransportError::from_context(ctx));
    }
    {
        std::lock_guard lock(outbox_->mutex);
        if (outbox_->closed) {
            return tl::unexpected(TransportError::closed("transport closed"));
        }
        outbox_->queue.emplace_back(message);
    }
    outbox_->cv.notify_all();
    return {};
}

TransportResult<std::string> MemoryTransport::receive(const Context& ctx) {
    std::unique_lock lock(inbox_->mutex);

    const auto ready = [this] {
        return inbox_->queue.empty() == false || inbox_->closed;
    };

    if (ctx.deadline().has_value()) {
        inbox_->cv.wait_until(lock, ctx.stop_token(), *ctx.deadline(), ready);
    } else {
        inbox_->cv.wait(lock, ctx.stop_token(), ready);
    }

    if (inbox_->queue.empty() == false) {
        std::string message = std::move(inbox_->queue.front());
        inbox_->queue.pop_front();
        return message;
    }
    if (inbox_->closed) {
        return tl::unexpected(TransportError::closed("end of stream"));
    }
    return tl::unexpected(TransportError::from_context(ctx));
}

TransportResult<void> MemoryTransport::close() {
    if (closed_.exchange(true, std::memory_order_acq_rel)) {
        return {};
    }
    close_count_.fetch_add(1);
    shut(*inbox_);
    shut(*outbox_);
    return {};
}

}  // namespace mcplink
