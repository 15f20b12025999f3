#ifndef MCPLINK_CONFIG_SERVER_CONFIG_HPP
#define MCPLINK_CONFIG_SERVER_CONFIG_HPP

#include "mcplink/process/child_process.hpp"

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace mcplink {

using Json = nlohmann::json;

// ─────────────────────────────────────────────────────────────────────────────
// Server Configuration
// ─────────────────────────────────────────────────────────────────────────────
// One entry per tool-provider process. Persisted as
//
//   {"servers": [{"id": "fs", "command": "mcp-fs --root /tmp"}, ...]}
//
// Optional per-entry keys: "startup_timeout_ms", "shutdown_grace_ms" and
// "stderr" ("inherit" or "discard").

struct ServerConfig {
    // Unique among the configured servers; prefixes every flattened tool name
    std::string id;

    // Program and arguments separated by whitespace. No shell quoting.
    std::string command;

    // Bound on the initialize handshake
    std::chrono::milliseconds startup_timeout{30000};

    // SIGINT to SIGKILL escalation delay on close
    std::chrono::milliseconds shutdown_grace{2000};

    StderrMode stderr_mode{StderrMode::Inherit};

    [[nodiscard]] Json to_json() const;
};

struct ConfigError {
    enum class Code {
        Io,       ///< file could not be read or written
        Parse,    ///< not valid JSON
        Invalid   ///< valid JSON with a missing/duplicate/mistyped field
    };

    Code code{Code::Invalid};
    std::string message;
};

template <typename T>
using ConfigResult = tl::expected<T, ConfigError>;

/// Validate and decode a {"servers": [...]} document
[[nodiscard]] ConfigResult<std::vector<ServerConfig>> parse_server_configs(const Json& document);

/// A missing file is an empty list
[[nodiscard]] ConfigResult<std::vector<ServerConfig>> load_server_configs(const std::filesystem::path& path);

/// Written via a temporary file and rename, so a crash never leaves half a file
[[nodiscard]] ConfigResult<void> save_server_configs(
    const std::filesystem::path& path,
    const std::vector<ServerConfig>& configs
);

/// Split on runs of whitespace; empty input yields an empty vector
[[nodiscard]] std::vector<std::string> split_command(std::string_view command);

}  // namespace mcplink

#endif  // MCPLINK_CONFIG_SERVER_CONFIG_HPP
