#include "mcplink/client/tool_registry.hpp"
#include "mcplink/log/logger.hpp"

#include <algorithm>
#include <format>

namespace mcplink {

namespace {
constexpr std::string_view kComponent = "registry";
}  // namespace

ToolRegistry::~ToolRegistry() {
    shutdown();
}

std::string ToolRegistry::flatten(std::string_view server_id, std::string_view remote_name) {
    std::string name;
    name.reserve(server_id.size() + remote_name.size() + 1);
    name.append(server_id);
    name.push_back('_');
    name.append(remote_name);
    return name;
}

// ─────────────────────────────────────────────────────────────────────────────
// Registration
// ─────────────────────────────────────────────────────────────────────────────

std::vector<std::string> ToolRegistry::start_all(const Context& ctx, const std::vector<ServerConfig>& configs) {
    std::vector<std::string> failed;

    for (const auto& config : configs) {
        if (find_server(config.id) != nullptr) {
            MCPLINK_LOG_WARN(kComponent, std::format("server '{}' is already registered", config.id));
            failed.push_back(config.id);
            continue;
        }

        auto server = std::make_shared<McpServer>(config);
        if (auto started = server->start(ctx); started.has_value() == false) {
            MCPLINK_LOG_ERROR(kComponent, std::format(
                "server '{}' failed to start: {}", config.id, started.error().describe()));
            close_logged(*server);
            failed.push_back(config.id);
            continue;
        }

        if (auto added = add_server(ctx, server); added.has_value() == false) {
            MCPLINK_LOG_ERROR(kComponent, std::format(
                "server '{}' failed to list tools: {}", config.id, added.error().describe()));
            close_logged(*server);
            failed.push_back(config.id);
        }
    }

    return failed;
}

ClientResult<void> ToolRegistry::add_server(const Context& ctx, std::shared_ptr<McpServer> server) {
    if (server == nullptr) {
        return tl::unexpected(ClientError::invalid_argument("null server"));
    }
    if (find_server(server->id()) != nullptr) {
        return tl::unexpected(ClientError::invalid_argument(
            std::format("server '{}' is already registered", server->id())));
    }

    auto tools = server->list_tools(ctx);
    if (tools.has_value() == false) {
        return tl::unexpected(tools.error());
    }

    std::lock_guard lock(mutex_);
    const bool taken = std::any_of(servers_.begin(), servers_.end(),
        [&](const Entry& entry) { return entry.server_id == server->id(); });
    if (taken) {
        return tl::unexpected(ClientError::invalid_argument(
            std::format("server '{}' is already registered", server->id())));
    }
    servers_.push_back(Entry{server->id(), server});
    register_tools(server->id(), *tools);
    MCPLINK_LOG_INFO(kComponent, std::format("registered {} tool(s) from '{}'", tools->size(), server->id()));
    return {};
}

void ToolRegistry::register_tools(const std::string& server_id, const std::vector<Tool>& tools) {
    for (const auto& tool : tools) {
        auto name = flatten(server_id, tool.name);
        if (routes_.contains(name)) {
            MCPLINK_LOG_WARN(kComponent, std::format(
                "tool name '{}' from '{}' collides with an existing tool; skipped", name, server_id));
            continue;
        }
        routes_.emplace(name, ToolRoute{server_id, tool.name});
        catalogue_.push_back(FlattenedTool{
            std::move(name),
            tool.description.value_or(""),
            tool.input_schema
        });
    }
}

void ToolRegistry::unregister_tools(const std::string& server_id) {
    std::erase_if(catalogue_, [&](const FlattenedTool& tool) {
        const auto it = routes_.find(tool.tool_name);
        return it != routes_.end() && it->second.server_id == server_id;
    });
    std::erase_if(routes_, [&](const auto& entry) {
        return entry.second.server_id == server_id;
    });
}

// ─────────────────────────────────────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────────────────────────────────────

std::vector<FlattenedTool> ToolRegistry::tools() const {
    std::lock_guard lock(mutex_);
    return catalogue_;
}

std::optional<ToolRoute> ToolRegistry::lookup(std::string_view flattened) const {
    std::lock_guard lock(mutex_);
    const auto it = routes_.find(std::string(flattened));
    if (it == routes_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> ToolRegistry::server_ids() const {
    std::lock_guard lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(servers_.size());
    for (const auto& entry : servers_) {
        ids.push_back(entry.server_id);
    }
    return ids;
}

std::shared_ptr<McpServer> ToolRegistry::find_server(std::string_view server_id) const {
    std::lock_guard lock(mutex_);
    const auto it = std::find_if(servers_.begin(), servers_.end(),
        [&](const Entry& entry) { return entry.server_id == server_id; });
    return it == servers_.end() ? nullptr : it->server;
}

// ─────────────────────────────────────────────────────────────────────────────
// Dispatch
// ─────────────────────────────────────────────────────────────────────────────

ClientResult<CallToolResult> ToolRegistry::call(const Context& ctx, std::string_view flattened, Json arguments) {
    const auto route = lookup(flattened);
    if (route.has_value() == false) {
        return tl::unexpected(ClientError::invalid_argument("unknown tool '" + std::string(flattened) + "'"));
    }

    auto server = find_server(route->server_id);
    if (server == nullptr) {
        return tl::unexpected(ClientError::invalid_argument("unknown tool '" + std::string(flattened) + "'"));
    }

    if (server->is_alive() == false) {
        const auto cause = server->connection_error();
        drop_server(route->server_id);
        return tl::unexpected(cause.has_value() ? ClientError::closed(cause->message) : ClientError::closed());
    }

    auto result = server->call_tool(ctx, route->remote_name, std::move(arguments));
    if (result.has_value() == false && server->is_alive() == false) {
        drop_server(route->server_id);
    }
    return result;
}

ClientResult<std::vector<Tool>> ToolRegistry::refresh(const Context& ctx, std::string_view server_id) {
    auto server = find_server(server_id);
    if (server == nullptr) {
        return tl::unexpected(ClientError::invalid_argument("unknown server '" + std::string(server_id) + "'"));
    }

    auto tools = server->list_tools(ctx);
    if (tools.has_value() == false) {
        if (server->is_alive() == false) {
            drop_server(std::string(server_id));
        }
        return tl::unexpected(tools.error());
    }

    std::lock_guard lock(mutex_);
    const bool still_registered = std::any_of(servers_.begin(), servers_.end(),
        [&](const Entry& entry) { return entry.server_id == server_id; });
    if (still_registered == false) {
        return tl::unexpected(ClientError::closed("server was removed during refresh"));
    }
    unregister_tools(std::string(server_id));
    register_tools(std::string(server_id), *tools);
    return tools;
}

// ─────────────────────────────────────────────────────────────────────────────
// Shutdown
// ─────────────────────────────────────────────────────────────────────────────

void ToolRegistry::close_logged(McpServer& server) {
    if (auto closed = server.close(); closed.has_value() == false) {
        MCPLINK_LOG_WARN(kComponent, std::format(
            "closing server '{}' failed: {}", server.id(), closed.error().describe()));
    }
}

void ToolRegistry::drop_server(const std::string& server_id) {
    std::shared_ptr<McpServer> dropped;
    {
        std::lock_guard lock(mutex_);
        const auto it = std::find_if(servers_.begin(), servers_.end(),
            [&](const Entry& entry) { return entry.server_id == server_id; });
        if (it == servers_.end()) {
            return;
        }
        dropped = std::move(it->server);
        servers_.erase(it);
        unregister_tools(server_id);
    }

    MCPLINK_LOG_WARN(kComponent, std::format("server '{}' is gone; its tools were removed", server_id));
    close_logged(*dropped);
}

void ToolRegistry::shutdown() {
    std::vector<Entry> servers;
    {
        std::lock_guard lock(mutex_);
        servers.swap(servers_);
        catalogue_.clear();
        routes_.clear();
    }

    for (auto& entry : servers) {
        close_logged(*entry.server);
    }
}

}  // namespace mcplink
