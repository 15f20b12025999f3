#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// McpServer
// ═══════════════════════════════════════════════════════════════════════════
// One MCP tool-provider process: spawn, handshake, tools/list, tools/call,
// shutdown. Everything goes through a Connection over the child's stdio.
//
//   McpServer server("fs", "mcp-fs --root /tmp");
//   auto init = server.start(Context::with_timeout(std::chrono::seconds(10)));
//   auto tools = server.list_tools(Context::background());
//   auto out = server.call_tool(ctx, "read_file", {{"path", "/tmp/a"}});
//   (void)server.close();
//
// States: NotStarted -> Running -> Closed. A failed start() leaves the
// server NotStarted with no process, thread or descriptor behind.

#include "mcplink/client/client_error.hpp"
#include "mcplink/config/server_config.hpp"
#include "mcplink/context.hpp"
#include "mcplink/process/child_process.hpp"
#include "mcplink/protocol/mcp_types.hpp"
#include "mcplink/rpc/connection.hpp"
#include "mcplink/transport/pipe_transport.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcplink {

struct McpServerOptions {
    std::chrono::milliseconds startup_timeout{30000};
    std::chrono::milliseconds shutdown_grace{DEFAULT_SHUTDOWN_GRACE};
    StderrMode stderr_mode{StderrMode::Inherit};
    Implementation client_info = default_client_info();
    PipeTransportConfig transport{};
    bool trace_frames{false};

    [[nodiscard]] static McpServerOptions from_config(const ServerConfig& config);
};

enum class ServerState {
    NotStarted,
    Running,
    Closed
};

[[nodiscard]] constexpr std::string_view to_string(ServerState state) noexcept {
    switch (state) {
        case ServerState::NotStarted: return "NotStarted";
        case ServerState::Running:    return "Running";
        case ServerState::Closed:     return "Closed";
    }
    return "Unknown";
}

class McpServer {
public:
    McpServer(std::string id, std::string command, McpServerOptions options = {});
    explicit McpServer(const ServerConfig& config);

    /// close()
    ~McpServer();

    McpServer(const McpServer&) = delete;
    McpServer& operator=(const McpServer&) = delete;
    McpServer(McpServer&&) = delete;
    McpServer& operator=(McpServer&&) = delete;

    /// Spawn and run the initialize handshake (bounded by the startup
    /// timeout on top of ctx). Fails with InvalidArgument if already started.
    [[nodiscard]] ClientResult<InitializeResult> start(const Context& ctx);

    /// Fetch every page of tools/list and store the result as the snapshot
    [[nodiscard]] ClientResult<std::vector<Tool>> list_tools(const Context& ctx);

    [[nodiscard]] ClientResult<CallToolResult> call_tool(
        const Context& ctx,
        std::string_view name,
        Json arguments = Json::object()
    );

    /// Invoked on notifications/tools/list_changed. Registration survives
    /// start(); the catalogue is never refreshed automatically.
    void on_tool_list_changed(std::function<void()> callback);

    /// Close the connection, then SIGINT / grace / SIGKILL the process.
    /// Returns the first error. Idempotent.
    [[nodiscard]] ClientResult<void> close();

    // ─────────────────────────────────────────────────────────────────────────
    // Observers
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] const std::string& id() const noexcept { return id_; }
    [[nodiscard]] const std::string& command() const noexcept { return command_; }
    [[nodiscard]] ServerState state() const;
    [[nodiscard]] std::optional<Implementation> server_info() const;
    [[nodiscard]] std::vector<Tool> tools() const;

    /// Running and the connection is still open
    [[nodiscard]] bool is_alive() const;

    /// Child pid while running
    [[nodiscard]] std::optional<pid_t> pid() const;

    /// Fatal cause if the connection died while running
    [[nodiscard]] std::optional<ClientError> connection_error() const;

private:
    /// Running connection, or the error a call should return instead
    [[nodiscard]] ClientResult<std::shared_ptr<Connection>> running_connection() const;

    void subscribe_list_changed(Connection& connection, std::function<void()> callback);
    void release_starting_connection();

    [[nodiscard]] ClientResult<void> teardown(
        std::shared_ptr<Connection> connection,
        std::unique_ptr<ChildProcess> process
    );

    std::string id_;
    std::string command_;
    McpServerOptions options_;

    // Serializes start() and close()
    std::mutex lifecycle_mutex_;

    mutable std::mutex state_mutex_;
    ServerState state_{ServerState::NotStarted};
    std::shared_ptr<Connection> connection_;
    std::shared_ptr<Connection> starting_connection_;  ///< set during the handshake only
    std::unique_ptr<ChildProcess> process_;
    std::optional<Implementation> server_info_;
    std::vector<Tool> tools_;
    std::vector<std::function<void()>> list_changed_callbacks_;
};

}  // namespace mcplink
