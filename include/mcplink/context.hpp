#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Call Context
// ═══════════════════════════════════════════════════════════════════════════
// Carries cancellation (a std::stop_token) and an optional deadline into
// every blocking operation. Contexts are cheap values; derive new ones with
// the with_* helpers.
//
//   std::stop_source stop;
//   auto ctx = Context::with_timeout(std::chrono::seconds(5))
//                  .with_stop_token(stop.get_token());
//   auto tools = server.list_tools(ctx);

#include <chrono>
#include <optional>
#include <stop_token>

namespace mcplink {

enum class CancelReason {
    None,
    Stopped,           ///< stop token triggered
    DeadlineExceeded   ///< deadline passed
};

class Context {
public:
    using Clock = std::chrono::steady_clock;

    Context() = default;

    /// Never cancelled, no deadline
    [[nodiscard]] static Context background() { return Context{}; }

    [[nodiscard]] static Context with_timeout(Clock::duration timeout) {
        Context ctx;
        ctx.deadline_ = Clock::now() + timeout;
        return ctx;
    }

    [[nodiscard]] Context with_stop_token(std::stop_token token) const {
        Context ctx = *this;
        ctx.stop_token_ = std::move(token);
        return ctx;
    }

    /// Keeps the earlier of the current and the given deadline
    [[nodiscard]] Context with_deadline(Clock::time_point deadline) const {
        Context ctx = *this;
        if (ctx.deadline_.has_value() == false || deadline < *ctx.deadline_) {
            ctx.deadline_ = deadline;
        }
        return ctx;
    }

    [[nodiscard]] Context with_timeout_from_now(Clock::duration timeout) const {
        return with_deadline(Clock::now() + timeout);
    }

    [[nodiscard]] const std::stop_token& stop_token() const noexcept { return stop_token_; }
    [[nodiscard]] const std::optional<Clock::time_point>& deadline() const noexcept { return deadline_; }

    [[nodiscard]] bool stop_requested() const noexcept { return stop_token_.stop_requested(); }

    [[nodiscard]] bool expired() const noexcept {
        return deadline_.has_value() && Clock::now() >= *deadline_;
    }

    [[nodiscard]] bool cancelled() const noexcept {
        return stop_requested() || expired();
    }

    /// Stop wins over an expired deadline when both hold
    [[nodiscard]] CancelReason reason() const noexcept {
        if (stop_requested()) {
            return CancelReason::Stopped;
        }
        if (expired()) {
            return CancelReason::DeadlineExceeded;
        }
        return CancelReason::None;
    }

    /// Time left until the deadline (zero when passed), nullopt without one
    [[nodiscard]] std::optional<Clock::duration> remaining() const noexcept {
        if (deadline_.has_value() == false) {
            return std::nullopt;
        }
        const auto now = Clock::now();
        if (now >= *deadline_) {
            return Clock::duration::zero();
        }
        return *deadline_ - now;
    }

private:
    std::stop_token stop_token_;
    std::optional<Clock::time_point> deadline_;
};

}  // namespace mcplink
