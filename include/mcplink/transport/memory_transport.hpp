#pragma once

#include "mcplink/transport.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

namespace mcplink {

// ═══════════════════════════════════════════════════════════════════════════
// MemoryTransport
// ═══════════════════════════════════════════════════════════════════════════
// Two connected in-process endpoints. send() on one end enqueues onto the
// other end's inbox. Closing either end closes both directions; queued
// messages are still delivered before receive() reports end of stream.

class MemoryTransport final : public ITransport {
    struct Channel;
    struct ConstructionKey {
        explicit ConstructionKey() = default;
    };

public:
    using Pair = std::pair<std::unique_ptr<MemoryTransport>, std::unique_ptr<MemoryTransport>>;

    [[nodiscard]] static Pair make_pair();

    /// Only reachable through make_pair()
    MemoryTransport(ConstructionKey, std::shared_ptr<Channel> inbox, std::shared_ptr<Channel> outbox);

    ~MemoryTransport() override;

    MemoryTransport(const MemoryTransport&) = delete;
    MemoryTransport& operator=(const MemoryTransport&) = delete;

    [[nodiscard]] TransportResult<void> send(const Context& ctx, std::string_view message) override;
    [[nodiscard]] TransportResult<std::string> receive(const Context& ctx) override;
    [[nodiscard]] TransportResult<void> close() override;

    [[nodiscard]] bool is_open() const noexcept override {
        return closed_.load(std::memory_order_acquire) == false;
    }

    /// Number of times close() actually released this endpoint (0 or 1)
    [[nodiscard]] int close_count() const noexcept { return close_count_.load(); }

private:
    struct Channel {
        std::mutex mutex;
        std::condition_variable_any cv;
        std::deque<std::string> queue;
        bool closed{false};
    };

    static void shut(Channel& channel);

    std::shared_ptr<Channel> inbox_;
    std::shared_ptr<Channel> outbox_;
    std::atomic<bool> closed_{false};
    std::atomic<int> close_count_{0};
};

}  // namespace mcplink
