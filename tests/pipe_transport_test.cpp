#include <catch2/catch_test_macros.hpp>

#include "mcplink/transport/pipe_transport.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <chrono>
#include <string>
#include <thread>

using namespace mcplink;
using namespace std::chrono_literals;

namespace {

// Transport reading from `in` and writing to `out`, plus the peer ends
struct PipeFixture {
    std::unique_ptr<PipeTransport> transport;
    int peer_write{-1};  ///< feeds transport->receive()
    int peer_read{-1};   ///< drains transport->send()

    explicit PipeFixture(PipeTransportConfig config = {}) {
        int in[2];
        int out[2];
        REQUIRE(::pipe2(in, O_CLOEXEC) == 0);
        REQUIRE(::pipe2(out, O_CLOEXEC) == 0);
        peer_write = in[1];
        peer_read = out[0];

        auto created = PipeTransport::create(in[0], out[1], config);
        REQUIRE(created.has_value());
        transport = std::move(*created);
    }

    ~PipeFixture() {
        transport.reset();
        close_peer_write();
        if (peer_read >= 0) {
            ::close(peer_read);
        }
    }

    void feed(const std::string& bytes) const {
        REQUIRE(::write(peer_write, bytes.data(), bytes.size()) == static_cast<ssize_t>(bytes.size()));
    }

    void close_peer_write() {
        if (peer_write >= 0) {
            ::close(peer_write);
            peer_write = -1;
        }
    }

    std::string drain(std::size_t n) const {
        std::string data(n, '\0');
        std::size_t got = 0;
        while (got < n) {
            const ssize_t r = ::read(peer_read, data.data() + got, n - got);
            REQUIRE(r > 0);
            got += static_cast<std::size_t>(r);
        }
        return data;
    }
};

}  // namespace

TEST_CASE("PipeTransport splits newline-delimited frames", "[transport][pipe]") {
    PipeFixture pipe;
    pipe.feed("{\"a\":1}\n\n   \n{\"b\":2}\r\n{\"c\"");
    pipe.feed(":3}\n");

    const auto ctx = Context::with_timeout(2s);
    REQUIRE(*pipe.transport->receive(ctx) == "{\"a\":1}");
    REQUIRE(*pipe.transport->receive(ctx) == "{\"b\":2}");
    REQUIRE(*pipe.transport->receive(ctx) == "{\"c\":3}");
}

TEST_CASE("PipeTransport delivers an unterminated final line at EOF", "[transport][pipe]") {
    PipeFixture pipe;
    pipe.feed("{\"last\":true}");
    pipe.close_peer_write();

    const auto ctx = Context::with_timeout(2s);
    REQUIRE(*pipe.transport->receive(ctx) == "{\"last\":true}");

    auto eof = pipe.transport->receive(ctx);
    REQUIRE(eof.has_value() == false);
    REQUIRE(eof.error().category == TransportError::Category::Closed);
}

TEST_CASE("PipeTransport send appends exactly one newline", "[transport][pipe]") {
    PipeFixture pipe;
    const std::string message = R"({"jsonrpc":"2.0","method":"x"})";

    REQUIRE(pipe.transport->send(Context::background(), message).has_value());
    REQUIRE(pipe.drain(message.size() + 1) == message + "\n");
}

TEST_CASE("PipeTransport refuses messages containing newlines", "[transport][pipe]") {
    PipeFixture pipe;

    auto sent = pipe.transport->send(Context::background(), "a\nb");
    REQUIRE(sent.has_value() == false);
    REQUIRE(sent.error().category == TransportError::Category::Protocol);
}

TEST_CASE("PipeTransport rejects oversized frames", "[transport][pipe]") {
    PipeFixture pipe(PipeTransportConfig{16});
    pipe.feed(std::string(64, 'x') + "\n");

    auto frame = pipe.transport->receive(Context::with_timeout(2s));
    REQUIRE(frame.has_value() == false);
    REQUIRE(frame.error().category == TransportError::Category::Protocol);
}

TEST_CASE("PipeTransport receive times out and can be cancelled", "[transport][pipe]") {
    PipeFixture pipe;

    auto timed_out = pipe.transport->receive(Context::with_timeout(20ms));
    REQUIRE(timed_out.has_value() == false);
    REQUIRE(timed_out.error().category == TransportError::Category::Timeout);

    std::stop_source stop;
    std::thread canceller([&stop] {
        std::this_thread::sleep_for(20ms);
        stop.request_stop();
    });
    auto cancelled = pipe.transport->receive(Context::background().with_stop_token(stop.get_token()));
    canceller.join();

    REQUIRE(cancelled.has_value() == false);
    REQUIRE(cancelled.error().category == TransportError::Category::Cancelled);
}

TEST_CASE("PipeTransport close interrupts a blocked receive", "[transport][pipe]") {
    PipeFixture pipe;

    std::thread reader([&pipe] {
        auto frame = pipe.transport->receive(Context::background());
        CHECK(frame.has_value() == false);
        CHECK(frame.error().category == TransportError::Category::Closed);
    });

    std::this_thread::sleep_for(20ms);
    REQUIRE(pipe.transport->close().has_value());
    reader.join();

    REQUIRE(pipe.transport->is_open() == false);
    REQUIRE(pipe.transport->close().has_value());
}

TEST_CASE("PipeTransport send reports a closed peer", "[transport][pipe]") {
    PipeFixture pipe;
    ::close(pipe.peer_read);
    pipe.peer_read = -1;

    auto sent = pipe.transport->send(Context::with_timeout(2s), "{}");
    REQUIRE(sent.has_value() == false);
    REQUIRE(sent.error().category == TransportError::Category::Closed);
}
