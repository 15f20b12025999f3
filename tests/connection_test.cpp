// ─────────────────────────────────────────────────────────────────────────────
// Connection Tests
// ─────────────────────────────────────────────────────────────────────────────
// The client side runs over one end of a MemoryTransport pair; the test plays
// the server on the other end.

#include <catch2/catch_test_macros.hpp>

#include "mcplink/protocol/mcp_types.hpp"
#include "mcplink/rpc/connection.hpp"
#include "mcplink/transport/memory_transport.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace mcplink;
using namespace std::chrono_literals;

namespace {

// Server side of the pair
class ScriptedPeer {
public:
    explicit ScriptedPeer(std::unique_ptr<MemoryTransport> end)
        : end_(std::move(end))
    {}

    /// Next frame sent by the client, parsed
    Json next_frame(std::chrono::milliseconds timeout = 2s) {
        auto raw = end_->receive(Context::with_timeout(timeout));
        REQUIRE(raw.has_value());
        return Json::parse(*raw);
    }

    void send(const Json& frame) {
        REQUIRE(end_->send(Context::background(), encode(frame)).has_value());
    }

    void send_raw(std::string_view line) {
        REQUIRE(end_->send(Context::background(), line).has_value());
    }

    void respond(const Json& id, Json result) {
        send({{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}});
    }

    void respond_error(const Json& id, int code, const std::string& message) {
        send({{"jsonrpc", "2.0"}, {"id", id}, {"error", {{"code", code}, {"message", message}}}});
    }

    void notify(const std::string& method, Json params = Json::object()) {
        send({{"jsonrpc", "2.0"}, {"method", method}, {"params", std::move(params)}});
    }

    void hang_up() {
        REQUIRE(end_->close().has_value());
    }

private:
    std::unique_ptr<MemoryTransport> end_;
};

struct ConnectionFixture {
    MemoryTransport* client_end{nullptr};
    std::unique_ptr<ScriptedPeer> peer;
    std::unique_ptr<Connection> connection;

    explicit ConnectionFixture(ConnectionConfig config = {}) {
        auto [client, server] = MemoryTransport::make_pair();
        client_end = client.get();
        peer = std::make_unique<ScriptedPeer>(std::move(server));
        connection = std::make_unique<Connection>(std::move(client), std::move(config));
    }
};

// Waits for a counter to reach a value
class Latch {
public:
    void arrive() {
        {
            std::lock_guard lock(mutex_);
            ++count_;
        }
        cv_.notify_all();
    }

    bool wait_for(int expected, std::chrono::milliseconds timeout = 2s) {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return count_ >= expected; });
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    int count_{0};
};

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Request / Response
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Connection sends a well-formed request and returns the result", "[connection]") {
    ConnectionFixture fx;

    auto pending = std::async(std::launch::async, [&] {
        return fx.connection->call(Context::with_timeout(2s), "ping", Json{{"x", 1}});
    });

    auto request = fx.peer->next_frame();
    REQUIRE(request["jsonrpc"] == "2.0");
    REQUIRE(request["method"] == "ping");
    REQUIRE(request["params"]["x"] == 1);
    REQUIRE(request["id"].is_number_integer());

    fx.peer->respond(request["id"], Json{{"pong", true}});

    auto result = pending.get();
    REQUIRE(result.has_value());
    REQUIRE((*result)["pong"] == true);
    REQUIRE(fx.connection->pending_count() == 0);
}

TEST_CASE("tools/list reply with one tool decodes to that tool", "[connection][scenario]") {
    ConnectionFixture fx;

    auto pending = std::async(std::launch::async, [&] {
        return fx.connection->call<ListToolsResult>(Context::with_timeout(2s), methods::TOOLS_LIST, Json::object());
    });

    auto request = fx.peer->next_frame();
    REQUIRE(request["method"] == "tools/list");
    fx.peer->respond(request["id"], Json::parse(R"({
        "tools": [{"name": "read_file", "description": "Read a file",
                   "inputSchema": {"type": "object"}}]
    })"));

    auto result = pending.get();
    REQUIRE(result.has_value());
    REQUIRE(result->tools.size() == 1);
    REQUIRE(result->tools[0].name == "read_file");
    REQUIRE(result->tools[0].description == "Read a file");
}

TEST_CASE("Error reply becomes a ServerError carrying the RpcError", "[connection][scenario]") {
    ConnectionFixture fx;

    auto pending = std::async(std::launch::async, [&] {
        return fx.connection->call(Context::with_timeout(2s), "resources/list");
    });

    auto request = fx.peer->next_frame();
    REQUIRE(request.contains("params") == false);
    fx.peer->respond_error(request["id"], -32601, "Method not found");

    auto result = pending.get();
    REQUIRE(result.has_value() == false);
    REQUIRE(result.error().code == ClientErrorCode::ServerError);
    REQUIRE(result.error().message == "Method not found");
    REQUIRE(result.error().rpc_error.has_value());
    REQUIRE(result.error().rpc_error->code == -32601);

    REQUIRE(fx.connection->state() == ConnectionState::Open);
}

TEST_CASE("String ids in replies are matched", "[connection]") {
    ConnectionFixture fx;

    auto pending = std::async(std::launch::async, [&] {
        return fx.connection->call(Context::with_timeout(2s), "ping");
    });

    auto request = fx.peer->next_frame();
    fx.peer->respond(std::to_string(request["id"].get<std::int64_t>()), "ok");

    auto result = pending.get();
    REQUIRE(result.has_value());
    REQUIRE(*result == "ok");
}

TEST_CASE("Concurrent calls receive their own responses out of order", "[connection][concurrency]") {
    ConnectionFixture fx;
    constexpr int kCalls = 8;

    std::vector<std::future<ClientResult<Json>>> calls;
    for (int i = 0; i < kCalls; ++i) {
        calls.push_back(std::async(std::launch::async, [&fx, i] {
            return fx.connection->call(Context::with_timeout(5s), "echo", Json{{"n", i}});
        }));
    }

    std::vector<Json> requests;
    for (int i = 0; i < kCalls; ++i) {
        requests.push_back(fx.peer->next_frame());
    }

    for (auto it = requests.rbegin(); it != requests.rend(); ++it) {
        fx.peer->respond((*it)["id"], Json{{"n", (*it)["params"]["n"]}});
    }

    for (int i = 0; i < kCalls; ++i) {
        auto result = calls[i].get();
        REQUIRE(result.has_value());
        REQUIRE((*result)["n"] == i);
    }
}

TEST_CASE("Request ids are unique across calls", "[connection]") {
    ConnectionFixture fx;
    std::vector<std::int64_t> ids;

    for (int i = 0; i < 3; ++i) {
        auto pending = std::async(std::launch::async, [&] {
            return fx.connection->call(Context::with_timeout(2s), "ping");
        });
        auto request = fx.peer->next_frame();
        ids.push_back(request["id"].get<std::int64_t>());
        fx.peer->respond(request["id"], nullptr);
        REQUIRE(pending.get().has_value());
    }

    REQUIRE(ids[0] != ids[1]);
    REQUIRE(ids[1] != ids[2]);
    REQUIRE(ids[0] != ids[2]);
}

TEST_CASE("Typed decode failure fails only that call", "[connection]") {
    ConnectionFixture fx;

    auto pending = std::async(std::launch::async, [&] {
        return fx.connection->call<Tool>(Context::with_timeout(2s), "describe");
    });
    auto request = fx.peer->next_frame();
    fx.peer->respond(request["id"], Json{{"unexpected", true}});

    auto result = pending.get();
    REQUIRE(result.has_value() == false);
    REQUIRE(result.error().code == ClientErrorCode::ProtocolError);
    REQUIRE(fx.connection->state() == ConnectionState::Open);
}

// ═══════════════════════════════════════════════════════════════════════════
// Cancellation
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Cancelled call returns promptly and its late reply is dropped", "[connection][cancel]") {
    ConnectionFixture fx;
    std::stop_source stop;

    auto pending = std::async(std::launch::async, [&] {
        return fx.connection->call(Context::background().with_stop_token(stop.get_token()), "slow");
    });

    auto request = fx.peer->next_frame();
    stop.request_stop();

    REQUIRE(pending.wait_for(2s) == std::future_status::ready);
    auto result = pending.get();
    REQUIRE(result.has_value() == false);
    REQUIRE(result.error().code == ClientErrorCode::Cancelled);
    REQUIRE(fx.connection->pending_count() == 0);

    // Orphan reply, then a normal call on the same connection
    fx.peer->respond(request["id"], "too late");

    auto next = std::async(std::launch::async, [&] {
        return fx.connection->call(Context::with_timeout(2s), "fast");
    });
    auto second = fx.peer->next_frame();
    REQUIRE(second["method"] == "fast");
    fx.peer->respond(second["id"], "on time");

    auto second_result = next.get();
    REQUIRE(second_result.has_value());
    REQUIRE(*second_result == "on time");
}

TEST_CASE("Call past its deadline reports Timeout", "[connection][cancel]") {
    ConnectionFixture fx;

    const auto started = std::chrono::steady_clock::now();
    auto result = fx.connection->call(Context::with_timeout(50ms), "never_answered");
    const auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(result.has_value() == false);
    REQUIRE(result.error().code == ClientErrorCode::Timeout);
    REQUIRE(elapsed < 2s);
    REQUIRE(fx.connection->pending_count() == 0);
    REQUIRE(fx.connection->state() == ConnectionState::Open);
}

TEST_CASE("Already cancelled context sends nothing", "[connection][cancel]") {
    ConnectionFixture fx;
    std::stop_source stop;
    stop.request_stop();

    auto result = fx.connection->call(Context::background().with_stop_token(stop.get_token()), "ping");
    REQUIRE(result.has_value() == false);
    REQUIRE(result.error().code == ClientErrorCode::Cancelled);

    auto notified = fx.connection->notify(Context::background().with_stop_token(stop.get_token()), "x");
    REQUIRE(notified.has_value() == false);
    REQUIRE(notified.error().code == ClientErrorCode::Cancelled);
}

// ═══════════════════════════════════════════════════════════════════════════
// Notifications
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Notification is delivered with no call in flight", "[connection][notify]") {
    ConnectionFixture fx;
    std::promise<Json> received;

    fx.connection->on_notification(methods::TOOLS_LIST_CHANGED, [&](const Notification& n) {
        received.set_value(n.params.value_or(Json()));
    });

    fx.peer->notify(methods::TOOLS_LIST_CHANGED, Json{{"reason", "reload"}});

    auto future = received.get_future();
    REQUIRE(future.wait_for(2s) == std::future_status::ready);
    REQUIRE(future.get()["reason"] == "reload");
}

TEST_CASE("Notifications keep peer order per subscription", "[connection][notify]") {
    ConnectionFixture fx(ConnectionConfig{"rpc", 4, false});
    constexpr int kCount = 50;

    std::mutex mutex;
    std::vector<int> seen;
    Latch latch;

    fx.connection->on_any_notification([&](const Notification& n) {
        {
            std::lock_guard lock(mutex);
            seen.push_back((*n.params)["n"].get<int>());
        }
        latch.arrive();
    });

    for (int i = 0; i < kCount; ++i) {
        fx.peer->notify("progress", Json{{"n", i}});
    }

    REQUIRE(latch.wait_for(kCount));
    std::lock_guard lock(mutex);
    for (int i = 0; i < kCount; ++i) {
        REQUIRE(seen[i] == i);
    }
}

TEST_CASE("Method subscriptions only see their method", "[connection][notify]") {
    ConnectionFixture fx;
    std::atomic<int> list_changed{0};
    Latch any;

    fx.connection->on_notification(methods::TOOLS_LIST_CHANGED, [&](const Notification&) { ++list_changed; });
    fx.connection->on_any_notification([&](const Notification&) { any.arrive(); });

    fx.peer->notify("notifications/progress");
    fx.peer->notify(methods::TOOLS_LIST_CHANGED);

    REQUIRE(any.wait_for(2));
    for (int i = 0; i < 200 && list_changed.load() == 0; ++i) {
        std::this_thread::sleep_for(5ms);
    }
    REQUIRE(list_changed.load() == 1);
}

TEST_CASE("A throwing handler does not stop delivery", "[connection][notify]") {
    ConnectionFixture fx;
    Latch latch;

    fx.connection->on_any_notification([&](const Notification& n) {
        latch.arrive();
        if (n.method == "boom") {
            throw std::runtime_error("handler failure");
        }
    });

    fx.peer->notify("boom");
    fx.peer->notify("fine");

    REQUIRE(latch.wait_for(2));
    REQUIRE(fx.connection->state() == ConnectionState::Open);
}

TEST_CASE("Removed handlers are no longer called", "[connection][notify]") {
    ConnectionFixture fx;
    std::atomic<int> removed_calls{0};
    Latch kept;

    const auto id = fx.connection->on_any_notification([&](const Notification&) { ++removed_calls; });
    fx.connection->on_any_notification([&](const Notification&) { kept.arrive(); });

    REQUIRE(fx.connection->remove_notification_handler(id));
    REQUIRE(fx.connection->remove_notification_handler(id) == false);

    fx.peer->notify("ping");
    REQUIRE(kept.wait_for(1));
    REQUIRE(removed_calls.load() == 0);
}

// ═══════════════════════════════════════════════════════════════════════════
// Shutdown
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("close is idempotent and closes the transport once", "[connection][close]") {
    ConnectionFixture fx;

    REQUIRE(fx.connection->close().has_value());
    REQUIRE(fx.connection->close().has_value());

    REQUIRE(fx.client_end->close_count() == 1);
    REQUIRE(fx.connection->state() == ConnectionState::Closed);
    REQUIRE(fx.connection->error().has_value() == false);
}

TEST_CASE("Calls after close fail with Closed without blocking", "[connection][close]") {
    ConnectionFixture fx;
    REQUIRE(fx.connection->close().has_value());

    const auto started = std::chrono::steady_clock::now();
    auto result = fx.connection->call(Context::background(), "ping");
    auto notified = fx.connection->notify(Context::background(), "ping");
    REQUIRE(std::chrono::steady_clock::now() - started < 1s);

    REQUIRE(result.has_value() == false);
    REQUIRE(result.error().code == ClientErrorCode::Closed);
    REQUIRE(notified.has_value() == false);
    REQUIRE(notified.error().code == ClientErrorCode::Closed);
}

TEST_CASE("close resolves calls that are still waiting", "[connection][close]") {
    ConnectionFixture fx;

    auto pending = std::async(std::launch::async, [&] {
        return fx.connection->call(Context::background(), "slow");
    });
    (void)fx.peer->next_frame();

    REQUIRE(fx.connection->close().has_value());

    REQUIRE(pending.wait_for(2s) == std::future_status::ready);
    auto result = pending.get();
    REQUIRE(result.has_value() == false);
    REQUIRE(result.error().code == ClientErrorCode::Closed);
}

TEST_CASE("Concurrent close calls all return", "[connection][close]") {
    ConnectionFixture fx;

    std::vector<std::thread> closers;
    std::atomic<int> ok{0};
    for (int i = 0; i < 4; ++i) {
        closers.emplace_back([&] {
            if (fx.connection->close().has_value()) {
                ++ok;
            }
        });
    }
    for (auto& t : closers) {
        t.join();
    }

    REQUIRE(ok.load() == 4);
    REQUIRE(fx.client_end->close_count() == 1);
}

TEST_CASE("End of stream resolves every pending call", "[connection][close]") {
    ConnectionFixture fx;

    auto first = std::async(std::launch::async, [&] {
        return fx.connection->call(Context::background(), "a");
    });
    auto second = std::async(std::launch::async, [&] {
        return fx.connection->call(Context::background(), "b");
    });
    (void)fx.peer->next_frame();
    (void)fx.peer->next_frame();

    fx.peer->hang_up();

    for (auto* future : {&first, &second}) {
        REQUIRE(future->wait_for(2s) == std::future_status::ready);
        auto result = future->get();
        REQUIRE(result.has_value() == false);
        REQUIRE(result.error().code == ClientErrorCode::Closed);
    }

    REQUIRE(fx.connection->wait_closed(Context::with_timeout(2s)));
    REQUIRE(fx.connection->error().has_value());
    REQUIRE(fx.connection->error()->code == ClientErrorCode::TransportError);

    auto later = fx.connection->call(Context::background(), "c");
    REQUIRE(later.has_value() == false);
    REQUIRE(later.error().code == ClientErrorCode::Closed);
    REQUIRE(later.error().message.find("transport closed") != std::string::npos);
}

TEST_CASE("Malformed frame is fatal", "[connection][protocol]") {
    ConnectionFixture fx;

    auto pending = std::async(std::launch::async, [&] {
        return fx.connection->call(Context::background(), "a");
    });
    (void)fx.peer->next_frame();

    fx.peer->send_raw("this is not json");

    REQUIRE(pending.wait_for(2s) == std::future_status::ready);
    auto result = pending.get();
    REQUIRE(result.has_value() == false);
    REQUIRE(result.error().code == ClientErrorCode::Closed);

    REQUIRE(fx.connection->wait_closed(Context::with_timeout(2s)));
    REQUIRE(fx.connection->error()->code == ClientErrorCode::ProtocolError);
}

TEST_CASE("Requests from the peer are a protocol violation", "[connection][protocol]") {
    ConnectionFixture fx;

    fx.peer->send(Json{{"jsonrpc", "2.0"}, {"id", 1}, {"method", "sampling/createMessage"}});

    REQUIRE(fx.connection->wait_closed(Context::with_timeout(2s)));
    REQUIRE(fx.connection->state() == ConnectionState::Closed);
    REQUIRE(fx.connection->error()->code == ClientErrorCode::ProtocolError);
}

TEST_CASE("Reply for an unknown id is ignored", "[connection][protocol]") {
    ConnectionFixture fx;

    fx.peer->respond(9999, "nobody asked");

    auto pending = std::async(std::launch::async, [&] {
        return fx.connection->call(Context::with_timeout(2s), "ping");
    });
    auto request = fx.peer->next_frame();
    fx.peer->respond(request["id"], "pong");

    REQUIRE(pending.get().has_value());
    REQUIRE(fx.connection->state() == ConnectionState::Open);
}

TEST_CASE("Null error member in a reply keeps the connection open", "[connection][protocol]") {
    ConnectionFixture fx;

    auto first = std::async(std::launch::async, [&] {
        return fx.connection->call(Context::with_timeout(2s), "a");
    });
    auto request = fx.peer->next_frame();
    fx.peer->send(Json{{"jsonrpc", "2.0"}, {"id", request["id"]}, {"result", {{"ok", true}}}, {"error", nullptr}});

    auto result = first.get();
    REQUIRE(result.has_value());
    REQUIRE((*result)["ok"] == true);

    auto second = std::async(std::launch::async, [&] {
        return fx.connection->call(Context::with_timeout(2s), "b");
    });
    request = fx.peer->next_frame();
    fx.peer->send(Json{{"jsonrpc", "2.0"}, {"id", request["id"]}, {"error", nullptr}});

    result = second.get();
    REQUIRE(result.has_value());
    REQUIRE(result->is_null());
    REQUIRE(fx.connection->state() == ConnectionState::Open);
}

TEST_CASE("Destroying an open connection does not hang", "[connection][close]") {
    auto fx = std::make_unique<ConnectionFixture>();
    fx->connection->on_any_notification([](const Notification&) {});

    const auto started = std::chrono::steady_clock::now();
    fx->connection.reset();
    REQUIRE(std::chrono::steady_clock::now() - started < 2s);
}

TEST_CASE("A notification handler may destroy its connection", "[connection][close]") {
    auto fx = std::make_unique<ConnectionFixture>();
    Latch destroyed;
    fx->connection->on_notification("bye", [&](const Notification&) {
        fx->connection.reset();
        destroyed.arrive();
    });

    fx->peer->notify("bye");

    REQUIRE(destroyed.wait_for(1));
    REQUIRE(fx->connection == nullptr);
}
