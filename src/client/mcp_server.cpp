#include "mcplink/client/mcp_server.hpp"
#include "mcplink/log/logger.hpp"

#include <format>
#include <unordered_set>

namespace mcplink {

McpServerOptions McpServerOptions::from_config(const ServerConfig& config) {
    McpServerOptions options;
    options.startup_timeout = config.startup_timeout;
    options.shutdown_grace = config.shutdown_grace;
    options.stderr_mode = config.stderr_mode;
    return options;
}

McpServer::McpServer(std::string id, std::string command, McpServerOptions options)
    : id_(std::move(id))
    , command_(std::move(command))
    , options_(std::move(options))
{}

McpServer::McpServer(const ServerConfig& config)
    : McpServer(config.id, config.command, McpServerOptions::from_config(config))
{}

McpServer::~McpServer() {
    if (auto result = close(); result.has_value() == false) {
        MCPLINK_LOG_WARN("server:" + id_, "close in destructor: " + result.error().message);
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Start
// ─────────────────────────────────────────────────────────────────────────────

ClientResult<InitializeResult> McpServer::start(const Context& ctx) {
    // Released after the lifecycle lock, since its handlers may be waiting on it
    std::shared_ptr<Connection> retired;
    std::lock_guard lifecycle(lifecycle_mutex_);
    const std::string component = "server:" + id_;

    {
        std::lock_guard lock(state_mutex_);
        if (state_ != ServerState::NotStarted) {
            return tl::unexpected(ClientError::invalid_argument(
                std::format("server '{}' is {}", id_, to_string(state_))));
        }
    }

    auto argv = split_command(command_);
    if (argv.empty()) {
        return tl::unexpected(ClientError::invalid_argument(std::format("server '{}' has an empty command", id_)));
    }

    ProcessSpec spec;
    spec.program = argv.front();
    spec.args.assign(argv.begin() + 1, argv.end());
    spec.stderr_mode = options_.stderr_mode;

    auto process = ChildProcess::spawn(spec);
    if (process.has_value() == false) {
        MCPLINK_LOG_ERROR(component, "spawn failed: " + process.error().message);
        return tl::unexpected(ClientError::spawn_failed(process.error().message));
    }
    std::unique_ptr<ChildProcess> child = std::move(*process);

    auto transport = PipeTransport::create(child->release_stdout_fd(), child->release_stdin_fd(), options_.transport);
    if (transport.has_value() == false) {
        auto error = ClientError::transport_error(transport.error().message);
        if (auto down = teardown(nullptr, std::move(child)); down.has_value() == false) {
            MCPLINK_LOG_WARN(component, "teardown after transport failure: " + down.error().message);
        }
        return tl::unexpected(std::move(error));
    }

    ConnectionConfig connection_config;
    connection_config.name = component;
    connection_config.trace_frames = options_.trace_frames;
    auto connection = std::make_shared<Connection>(std::move(*transport), std::move(connection_config));

    // Callbacks registered from here on subscribe through starting_connection_
    {
        std::lock_guard lock(state_mutex_);
        starting_connection_ = connection;
        for (const auto& callback : list_changed_callbacks_) {
            subscribe_list_changed(*connection, callback);
        }
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Handshake
    // ─────────────────────────────────────────────────────────────────────────
    const auto handshake_ctx = ctx.with_timeout_from_now(options_.startup_timeout);

    InitializeParams params;
    params.client_info = options_.client_info;

    auto init = connection->call<InitializeResult>(handshake_ctx, methods::INITIALIZE, params.to_json());
    if (init.has_value() == false) {
        ClientError error = init.error();
        error.message = "initialize failed: " + error.message;
        MCPLINK_LOG_ERROR(component, error.describe());
        release_starting_connection();
        if (auto down = teardown(connection, std::move(child)); down.has_value() == false) {
            MCPLINK_LOG_WARN(component, "teardown after failed handshake: " + down.error().message);
        }
        retired = std::move(connection);
        return tl::unexpected(std::move(error));
    }

    if (auto notified = connection->notify(handshake_ctx, methods::INITIALIZED); notified.has_value() == false) {
        ClientError error = notified.error();
        error.message = "initialized notification failed: " + error.message;
        MCPLINK_LOG_ERROR(component, error.describe());
        release_starting_connection();
        if (auto down = teardown(connection, std::move(child)); down.has_value() == false) {
            MCPLINK_LOG_WARN(component, "teardown after failed handshake: " + down.error().message);
        }
        retired = std::move(connection);
        return tl::unexpected(std::move(error));
    }

    MCPLINK_LOG_INFO(component, std::format(
        "connected to {} {} (protocol {})",
        init->server_info.name, init->server_info.version, init->protocol_version));

    {
        std::lock_guard lock(state_mutex_);
        starting_connection_.reset();
        connection_ = std::move(connection);
        process_ = std::move(child);
        server_info_ = init->server_info;
        state_ = ServerState::Running;
    }
    return init;
}

// ─────────────────────────────────────────────────────────────────────────────
// Tools
// ─────────────────────────────────────────────────────────────────────────────

ClientResult<std::vector<Tool>> McpServer::list_tools(const Context& ctx) {
    auto connection = running_connection();
    if (connection.has_value() == false) {
        return tl::unexpected(connection.error());
    }

    std::vector<Tool> tools;
    std::optional<std::string> cursor;
    std::unordered_set<std::string> seen_cursors;

    while (true) {
        ListToolsParams params{cursor};
        auto page = (*connection)->call<ListToolsResult>(ctx, methods::TOOLS_LIST, params.to_json());
        if (page.has_value() == false) {
            return tl::unexpected(page.error());
        }

        for (auto& tool : page->tools) {
            tools.push_back(std::move(tool));
        }

        if (page->next_cursor.has_value() == false || page->next_cursor->empty()) {
            break;
        }
        if (seen_cursors.insert(*page->next_cursor).second == false) {
            return tl::unexpected(ClientError::protocol_error(
                "tools/list returned cursor \"" + *page->next_cursor + "\" twice"));
        }
        cursor = std::move(page->next_cursor);
    }

    {
        std::lock_guard lock(state_mutex_);
        tools_ = tools;
    }
    return tools;
}

ClientResult<CallToolResult> McpServer::call_tool(const Context& ctx, std::string_view name, Json arguments) {
    auto connection = running_connection();
    if (connection.has_value() == false) {
        return tl::unexpected(connection.error());
    }

    CallToolParams params{std::string(name), std::move(arguments)};
    return (*connection)->call<CallToolResult>(ctx, methods::TOOLS_CALL, params.to_json());
}

void McpServer::on_tool_list_changed(std::function<void()> callback) {
    std::lock_guard lock(state_mutex_);
    list_changed_callbacks_.push_back(callback);
    if (connection_ != nullptr) {
        subscribe_list_changed(*connection_, std::move(callback));
    } else if (starting_connection_ != nullptr) {
        subscribe_list_changed(*starting_connection_, std::move(callback));
    }
}

void McpServer::release_starting_connection() {
    std::lock_guard lock(state_mutex_);
    starting_connection_.reset();
}

void McpServer::subscribe_list_changed(Connection& connection, std::function<void()> callback) {
    connection.on_notification(
        methods::TOOLS_LIST_CHANGED,
        [callback = std::move(callback)](const Notification&) { callback(); }
    );
}

// ─────────────────────────────────────────────────────────────────────────────
// Shutdown
// ─────────────────────────────────────────────────────────────────────────────

ClientResult<void> McpServer::teardown(
    std::shared_ptr<Connection> connection,
    std::unique_ptr<ChildProcess> process
) {
    std::optional<ClientError> first_error;

    if (connection != nullptr) {
        if (auto closed = connection->close(); closed.has_value() == false) {
            first_error = closed.error();
        }
    }

    if (process != nullptr) {
        auto exited = process->terminate(options_.shutdown_grace);
        if (exited.has_value() == false) {
            if (first_error.has_value() == false) {
                first_error = ClientError::transport_error("terminate failed: " + exited.error().message);
            }
        } else {
            MCPLINK_LOG_DEBUG("server:" + id_, std::format("process exited with {}", *exited));
        }
    }

    if (first_error.has_value()) {
        return tl::unexpected(std::move(*first_error));
    }
    return {};
}

ClientResult<void> McpServer::close() {
    std::lock_guard lifecycle(lifecycle_mutex_);

    std::shared_ptr<Connection> connection;
    std::unique_ptr<ChildProcess> process;
    {
        std::lock_guard lock(state_mutex_);
        if (state_ != ServerState::Running) {
            if (state_ == ServerState::NotStarted) {
                state_ = ServerState::Closed;
            }
            return {};
        }
        state_ = ServerState::Closed;
        connection = std::move(connection_);
        process = std::move(process_);
    }

    MCPLINK_LOG_INFO("server:" + id_, "shutting down");
    return teardown(std::move(connection), std::move(process));
}

// ─────────────────────────────────────────────────────────────────────────────
// Observers
// ─────────────────────────────────────────────────────────────────────────────

ClientResult<std::shared_ptr<Connection>> McpServer::running_connection() const {
    std::lock_guard lock(state_mutex_);
    switch (state_) {
        case ServerState::NotStarted:
            return tl::unexpected(ClientError::not_started());
        case ServerState::Closed:
            return tl::unexpected(ClientError::closed());
        case ServerState::Running:
            break;
    }
    return connection_;
}

ServerState McpServer::state() const {
    std::lock_guard lock(state_mutex_);
    return state_;
}

std::optional<Implementation> McpServer::server_info() const {
    std::lock_guard lock(state_mutex_);
    return server_info_;
}

std::vector<Tool> McpServer::tools() const {
    std::lock_guard lock(state_mutex_);
    return tools_;
}

bool McpServer::is_alive() const {
    std::lock_guard lock(state_mutex_);
    return state_ == ServerState::Running
        && connection_ != nullptr
        && connection_->state() == ConnectionState::Open;
}

std::optional<pid_t> McpServer::pid() const {
    std::lock_guard lock(state_mutex_);
    if (process_ == nullptr) {
        return std::nullopt;
    }
    return process_->pid();
}

std::optional<ClientError> McpServer::connection_error() const {
    std::lock_guard lock(state_mutex_);
    if (connection_ == nullptr) {
        return std::nullopt;
    }
    return connection_->error();
}

}  // namespace mcplink
