#include <catch2/catch_test_macros.hpp>

#include "mcplink/context.hpp"

#include <thread>

using namespace mcplink;
using namespace std::chrono_literals;

TEST_CASE("Background context never cancels", "[context]") {
    auto ctx = Context::background();

    REQUIRE(ctx.cancelled() == false);
    REQUIRE(ctx.reason() == CancelReason::None);
    REQUIRE(ctx.remaining().has_value() == false);
    REQUIRE(ctx.stop_token().stop_possible() == false);
}

TEST_CASE("Timeout context expires", "[context]") {
    auto ctx = Context::with_timeout(20ms);

    REQUIRE(ctx.expired() == false);
    REQUIRE(ctx.remaining().has_value());

    std::this_thread::sleep_for(40ms);

    REQUIRE(ctx.expired());
    REQUIRE(ctx.reason() == CancelReason::DeadlineExceeded);
    REQUIRE(*ctx.remaining() == Context::Clock::duration::zero());
}

TEST_CASE("Stop token cancels and wins over the deadline", "[context]") {
    std::stop_source stop;
    auto ctx = Context::with_timeout(1ms).with_stop_token(stop.get_token());

    std::this_thread::sleep_for(5ms);
    REQUIRE(ctx.reason() == CancelReason::DeadlineExceeded);

    stop.request_stop();
    REQUIRE(ctx.stop_requested());
    REQUIRE(ctx.reason() == CancelReason::Stopped);
}

TEST_CASE("with_deadline keeps the earlier deadline", "[context]") {
    const auto now = Context::Clock::now();
    auto ctx = Context::background().with_deadline(now + 10s);

    auto tighter = ctx.with_deadline(now + 1s);
    REQUIRE(*tighter.deadline() == now + 1s);

    auto looser = tighter.with_deadline(now + 60s);
    REQUIRE(*looser.deadline() == now + 1s);
}

TEST_CASE("Derived contexts share the stop token", "[context]") {
    std::stop_source stop;
    auto parent = Context::background().with_stop_token(stop.get_token());
    auto child = parent.with_timeout_from_now(10s);

    stop.request_stop();

    REQUIRE(parent.cancelled());
    REQUIRE(child.cancelled());
    REQUIRE(child.reason() == CancelReason::Stopped);
}
