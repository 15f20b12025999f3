#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// ToolRegistry
// ═══════════════════════════════════════════════════════════════════════════
// The agent-facing view over several MCP servers. Every remote tool is
// exposed under a flattened name "<serverID>_<remoteName>" and calls are
// routed back to the owning server. A server whose connection has died is
// dropped together with its tools the next time one of them is called.

#include "mcplink/client/client_error.hpp"
#include "mcplink/client/mcp_server.hpp"
#include "mcplink/config/server_config.hpp"
#include "mcplink/context.hpp"
#include "mcplink/protocol/mcp_types.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace mcplink {

struct FlattenedTool {
    std::string tool_name;    ///< "<serverID>_<remoteName>"
    std::string description;
    Json input_schema = Json::object();
};

struct ToolRoute {
    std::string server_id;
    std::string remote_name;
};

class ToolRegistry {
public:
    ToolRegistry() = default;

    /// shutdown()
    ~ToolRegistry();

    ToolRegistry(const ToolRegistry&) = delete;
    ToolRegistry& operator=(const ToolRegistry&) = delete;

    [[nodiscard]] static std::string flatten(std::string_view server_id, std::string_view remote_name);

    /// Start every configured server and register its tools. Servers that
    /// fail to start or list are logged, closed and skipped; their ids are
    /// returned.
    std::vector<std::string> start_all(const Context& ctx, const std::vector<ServerConfig>& configs);

    /// Register an already running server and fetch its catalogue
    [[nodiscard]] ClientResult<void> add_server(const Context& ctx, std::shared_ptr<McpServer> server);

    [[nodiscard]] std::vector<FlattenedTool> tools() const;

    [[nodiscard]] std::optional<ToolRoute> lookup(std::string_view flattened) const;

    [[nodiscard]] ClientResult<CallToolResult> call(
        const Context& ctx,
        std::string_view flattened,
        Json arguments = Json::object()
    );

    /// Re-fetch one server's catalogue and replace its registered tools
    [[nodiscard]] ClientResult<std::vector<Tool>> refresh(const Context& ctx, std::string_view server_id);

    [[nodiscard]] std::vector<std::string> server_ids() const;

    /// Close every server. Idempotent.
    void shutdown();

private:
    struct Entry {
        std::string server_id;
        std::shared_ptr<McpServer> server;
    };

    /// Called with mutex_ held
    void register_tools(const std::string& server_id, const std::vector<Tool>& tools);
    void unregister_tools(const std::string& server_id);

    [[nodiscard]] std::shared_ptr<McpServer> find_server(std::string_view server_id) const;

    void drop_server(const std::string& server_id);

    static void close_logged(McpServer& server);

    mutable std::mutex mutex_;
    std::vector<Entry> servers_;
    std::vector<FlattenedTool> catalogue_;
    std::unordered_map<std::string, ToolRoute> routes_;
};

}  // namespace mcplink
