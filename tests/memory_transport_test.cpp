#include <catch2/catch_test_macros.hpp>

#include "mcplink/transport/memory_transport.hpp"

#include <chrono>
#include <thread>

using namespace mcplink;
using namespace std::chrono_literals;

TEST_CASE("MemoryTransport delivers in order", "[transport][memory]") {
    auto [left, right] = MemoryTransport::make_pair();
    const auto ctx = Context::background();

    REQUIRE(left->send(ctx, "one").has_value());
    REQUIRE(left->send(ctx, "two").has_value());

    REQUIRE(*right->receive(ctx) == "one");
    REQUIRE(*right->receive(ctx) == "two");
}

TEST_CASE("MemoryTransport receive blocks until a message arrives", "[transport][memory]") {
    auto [left, right] = MemoryTransport::make_pair();

    std::thread sender([&left = left] {
        std::this_thread::sleep_for(20ms);
        (void)left->send(Context::background(), "late");
    });

    auto message = right->receive(Context::with_timeout(2s));
    sender.join();

    REQUIRE(message.has_value());
    REQUIRE(*message == "late");
}

TEST_CASE("MemoryTransport receive honours deadline and stop token", "[transport][memory]") {
    auto [left, right] = MemoryTransport::make_pair();

    auto timed_out = right->receive(Context::with_timeout(10ms));
    REQUIRE(timed_out.has_value() == false);
    REQUIRE(timed_out.error().category == TransportError::Category::Timeout);

    std::stop_source stop;
    std::thread canceller([&stop] {
        std::this_thread::sleep_for(10ms);
        stop.request_stop();
    });
    auto cancelled = right->receive(Context::background().with_stop_token(stop.get_token()));
    canceller.join();

    REQUIRE(cancelled.has_value() == false);
    REQUIRE(cancelled.error().category == TransportError::Category::Cancelled);
}

TEST_CASE("MemoryTransport close wakes the peer after draining", "[transport][memory]") {
    auto [left, right] = MemoryTransport::make_pair();
    const auto ctx = Context::background();

    REQUIRE(left->send(ctx, "queued").has_value());
    REQUIRE(left->close().has_value());

    REQUIRE(*right->receive(ctx) == "queued");

    auto eof = right->receive(ctx);
    REQUIRE(eof.has_value() == false);
    REQUIRE(eof.error().category == TransportError::Category::Closed);

    auto send = right->send(ctx, "nobody");
    REQUIRE(send.has_value() == false);
    REQUIRE(send.error().category == TransportError::Category::Closed);
}

TEST_CASE("MemoryTransport close is counted once", "[transport][memory]") {
    auto [left, right] = MemoryTransport::make_pair();

    REQUIRE(left->close().has_value());
    REQUIRE(left->close().has_value());

    REQUIRE(left->close_count() == 1);
    REQUIRE(left->is_open() == false);
}
