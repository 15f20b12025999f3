// ─────────────────────────────────────────────────────────────────────────────
// mcplink-cli - MCP server probe
// ─────────────────────────────────────────────────────────────────────────────
// Spawns one or more stdio MCP servers, runs the handshake and lists or calls
// their tools.
//
// Usage:
//   # One server given on the command line
//   mcplink-cli --command "npx -y @modelcontextprotocol/server-filesystem /tmp"
//   mcplink-cli --command "python mcp_server.py" --list-tools
//   mcplink-cli --command "python mcp_server.py" --call read_file --args '{"path":"/tmp/a"}'
//
//   # Servers from a configuration file
//   mcplink-cli --config servers.json --server fs --list-tools
//   mcplink-cli --config servers.json --list-tools           # every server, flattened names
//   mcplink-cli --config servers.json --call fs_read_file --args '{"path":"/tmp/a"}'

#include <cxxopts.hpp>
#include <nlohmann/json.hpp>

#include "mcplink/client/mcp_server.hpp"
#include "mcplink/client/tool_registry.hpp"
#include "mcplink/config/server_config.hpp"
#include "mcplink/log/logger.hpp"
#include "mcplink/log/spdlog_logger.hpp"

#include <unistd.h>

#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace mcplink;

// ═══════════════════════════════════════════════════════════════════════════
// ANSI Color Codes
// ═══════════════════════════════════════════════════════════════════════════

namespace color {
    const char* reset   = "\033[0m";
    const char* bold    = "\033[1m";
    const char* dim     = "\033[2m";
    const char* red     = "\033[31m";
    const char* green   = "\033[32m";
    const char* yellow  = "\033[33m";
    const char* cyan    = "\033[36m";

    bool enabled = true;

    std::string c(const char* code) {
        return enabled ? code : "";
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Output Helpers
// ═══════════════════════════════════════════════════════════════════════════

void print_error(const std::string& msg) {
    std::cerr << color::c(color::red) << "Error: " << color::c(color::reset) << msg << "\n";
}

void print_success(const std::string& msg) {
    std::cout << color::c(color::green) << "✓ " << color::c(color::reset) << msg << "\n";
}

void print_header(const std::string& title) {
    std::cout << "\n" << color::c(color::bold) << color::c(color::cyan)
              << "═══ " << title << " ═══" << color::c(color::reset) << "\n\n";
}

void print_json(const Json& j) {
    std::cout << j.dump(2) << "\n";
}

void print_tool(const std::string& name, const std::optional<std::string>& description) {
    std::cout << color::c(color::bold) << color::c(color::yellow)
              << "• " << name << color::c(color::reset);
    if (description && description->empty() == false) {
        std::cout << "\n  " << color::c(color::dim) << *description << color::c(color::reset);
    }
    std::cout << "\n\n";
}

std::optional<Json> parse_arguments(const std::string& text) {
    try {
        auto args = Json::parse(text);
        if (args.is_object() == false) {
            print_error("--args must be a JSON object");
            return std::nullopt;
        }
        return args;
    } catch (const Json::parse_error& e) {
        print_error("Invalid JSON arguments: " + std::string(e.what()));
        return std::nullopt;
    }
}

int print_call_result(const CallToolResult& result, bool json_output) {
    if (json_output) {
        print_json(result.to_json());
    } else {
        if (result.is_error) {
            print_error("Tool returned error");
        }
        for (const auto& block : result.content) {
            if (block.text.has_value()) {
                std::cout << *block.text << "\n";
            } else {
                std::cout << color::c(color::dim) << "[" << block.type;
                if (block.mime_type) {
                    std::cout << ": " << *block.mime_type;
                }
                std::cout << "]" << color::c(color::reset) << "\n";
            }
        }
    }
    return result.is_error ? 1 : 0;
}

// ═══════════════════════════════════════════════════════════════════════════
// Single server
// ═══════════════════════════════════════════════════════════════════════════

int cmd_info(const InitializeResult& init, bool json_output) {
    if (json_output) {
        print_json(init.to_json());
        return 0;
    }
    print_header("Server");
    std::cout << "  Name:     " << init.server_info.name << "\n"
              << "  Version:  " << init.server_info.version << "\n"
              << "  Protocol: " << init.protocol_version << "\n"
              << "  Tools:    " << (init.supports_tools() ? "yes" : "no") << "\n";
    return 0;
}

int cmd_list_tools(McpServer& server, const Context& ctx, bool json_output) {
    auto tools = server.list_tools(ctx);
    if (tools.has_value() == false) {
        print_error(tools.error().describe());
        return 1;
    }

    if (json_output) {
        Json output = Json::array();
        for (const auto& tool : *tools) {
            output.push_back(tool.to_json());
        }
        print_json(output);
        return 0;
    }

    print_header("Tools");
    if (tools->empty()) {
        std::cout << color::c(color::dim) << "(no tools available)" << color::c(color::reset) << "\n";
    }
    for (const auto& tool : *tools) {
        print_tool(tool.name, tool.description);
    }
    return 0;
}

int cmd_call_tool(McpServer& server, const Context& ctx, const std::string& tool_name,
                  const std::string& args_json, bool json_output) {
    auto args = parse_arguments(args_json);
    if (args.has_value() == false) {
        return 1;
    }

    auto result = server.call_tool(ctx, tool_name, std::move(*args));
    if (result.has_value() == false) {
        print_error(result.error().describe());
        return 1;
    }
    return print_call_result(*result, json_output);
}

int run_single(McpServer& server, const cxxopts::ParseResult& result, const Context& ctx, bool json_output) {
    auto init = server.start(ctx);
    if (init.has_value() == false) {
        print_error("Failed to start '" + server.id() + "': " + init.error().describe());
        return 1;
    }
    if (json_output == false) {
        print_success("Connected to " + init->server_info.name + " " + init->server_info.version);
    }

    int exit_code = 0;
    if (result.count("list-tools")) {
        exit_code = cmd_list_tools(server, ctx, json_output);
    } else if (result.count("call")) {
        exit_code = cmd_call_tool(server, ctx, result["call"].as<std::string>(),
                                  result["args"].as<std::string>(), json_output);
    } else {
        exit_code = cmd_info(*init, json_output);
    }

    if (auto closed = server.close(); closed.has_value() == false) {
        print_error("Shutdown: " + closed.error().describe());
        return exit_code == 0 ? 1 : exit_code;
    }
    return exit_code;
}

// ═══════════════════════════════════════════════════════════════════════════
// Every configured server
// ═══════════════════════════════════════════════════════════════════════════

int run_registry(const std::vector<ServerConfig>& configs, const cxxopts::ParseResult& result,
                 const Context& ctx, bool json_output) {
    ToolRegistry registry;
    const auto failed = registry.start_all(ctx, configs);
    for (const auto& id : failed) {
        print_error("server '" + id + "' is unavailable");
    }

    int exit_code = failed.empty() ? 0 : 1;

    if (result.count("call")) {
        auto args = parse_arguments(result["args"].as<std::string>());
        if (args.has_value() == false) {
            registry.shutdown();
            return 1;
        }
        auto called = registry.call(ctx, result["call"].as<std::string>(), std::move(*args));
        if (called.has_value() == false) {
            print_error(called.error().describe());
            exit_code = 1;
        } else {
            exit_code = print_call_result(*called, json_output);
        }
    } else {
        const auto tools = registry.tools();
        if (json_output) {
            Json output = Json::array();
            for (const auto& tool : tools) {
                output.push_back({
                    {"name", tool.tool_name},
                    {"description", tool.description},
                    {"inputSchema", tool.input_schema}
                });
            }
            print_json(output);
        } else {
            print_header("Tools");
            if (tools.empty()) {
                std::cout << color::c(color::dim) << "(no tools available)" << color::c(color::reset) << "\n";
            }
            for (const auto& tool : tools) {
                print_tool(tool.tool_name, tool.description);
            }
        }
    }

    registry.shutdown();
    return exit_code;
}

// ═══════════════════════════════════════════════════════════════════════════
// Main
// ═══════════════════════════════════════════════════════════════════════════

int main(int argc, char* argv[]) {
    cxxopts::Options options("mcplink-cli", "Probe stdio MCP servers");

    options.add_options()
        ("c,command", "Server command line (program and arguments)", cxxopts::value<std::string>())
        ("config", "Server configuration file", cxxopts::value<std::string>())
        ("server", "Server id from --config", cxxopts::value<std::string>())
        ("list-tools", "List available tools")
        ("call", "Call a tool by name", cxxopts::value<std::string>())
        ("args", "Tool arguments as a JSON object", cxxopts::value<std::string>()->default_value("{}"))
        ("timeout", "Timeout in milliseconds for each operation", cxxopts::value<int>()->default_value("30000"))
        ("log-level", "trace, debug, info, warn, error or off", cxxopts::value<std::string>()->default_value("warn"))
        ("log-file", "Also write logs to this file", cxxopts::value<std::string>())
        ("j,json", "Output raw JSON")
        ("no-color", "Disable colored output")
        ("h,help", "Print usage");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << "\n";
            return 0;
        }

        if (result.count("no-color") || isatty(STDOUT_FILENO) == 0) {
            color::enabled = false;
        }

        const bool json_output = result.count("json") > 0;
        const auto level = log_level_from_string(result["log-level"].as<std::string>());
        if (result.count("log-file")) {
            set_logger(make_spdlog_console_file_logger(result["log-file"].as<std::string>(), level));
        } else {
            set_logger(make_spdlog_console_logger(level));
        }

        const int timeout_ms = result["timeout"].as<int>();
        if (timeout_ms <= 0) {
            print_error("--timeout must be positive");
            return 1;
        }
        const auto ctx = Context::with_timeout(std::chrono::milliseconds(timeout_ms));

        if (result.count("list-tools") && result.count("call")) {
            print_error("--list-tools and --call are mutually exclusive");
            return 1;
        }

        int exit_code = 0;

        if (result.count("command")) {
            McpServerOptions server_options;
            server_options.startup_timeout = std::chrono::milliseconds(timeout_ms);
            McpServer server("cli", result["command"].as<std::string>(), server_options);
            exit_code = run_single(server, result, ctx, json_output);

        } else if (result.count("config")) {
            auto configs = load_server_configs(result["config"].as<std::string>());
            if (configs.has_value() == false) {
                print_error(configs.error().message);
                return 1;
            }

            if (result.count("server")) {
                const auto id = result["server"].as<std::string>();
                const ServerConfig* found = nullptr;
                for (const auto& config : *configs) {
                    if (config.id == id) {
                        found = &config;
                    }
                }
                if (found == nullptr) {
                    print_error("no server '" + id + "' in " + result["config"].as<std::string>());
                    return 1;
                }
                McpServer server(*found);
                exit_code = run_single(server, result, ctx, json_output);
            } else {
                if (configs->empty()) {
                    print_error("no servers configured");
                    return 1;
                }
                exit_code = run_registry(*configs, result, ctx, json_output);
            }

        } else {
            print_error("Either --command or --config is required");
            std::cout << options.help() << "\n";
            return 1;
        }

        set_logger(nullptr);
        return exit_code;

    } catch (const cxxopts::exceptions::exception& e) {
        print_error(e.what());
        return 1;
    }
}
