#include "mcplink/config/server_config.hpp"
#include "mcplink/log/logger.hpp"

#include <fstream>
#include <sstream>
#include <system_error>
#include <unordered_set>

namespace mcplink {

namespace {

ConfigError invalid(std::string message) {
    return ConfigError{ConfigError::Code::Invalid, std::move(message)};
}

std::string_view stderr_mode_name(StderrMode mode) noexcept {
    return mode == StderrMode::Discard ? "discard" : "inherit";
}

ConfigResult<std::chrono::milliseconds> read_duration(const Json& entry, const char* key, std::chrono::milliseconds fallback) {
    const auto it = entry.find(key);
    if (it == entry.end()) {
        return fallback;
    }
    if (it->is_number_integer() == false || it->get<std::int64_t>() < 0) {
        return tl::unexpected(invalid(std::string(key) + " must be a non-negative integer"));
    }
    return std::chrono::milliseconds(it->get<std::int64_t>());
}

ConfigResult<ServerConfig> parse_entry(const Json& entry, std::size_t index) {
    const std::string where = "servers[" + std::to_string(index) + "]";
    if (entry.is_object() == false) {
        return tl::unexpected(invalid(where + " must be an object"));
    }

    ServerConfig config;

    const auto id_it = entry.find("id");
    if (id_it == entry.end() || id_it->is_string() == false || id_it->get<std::string>().empty()) {
        return tl::unexpected(invalid(where + ".id must be a non-empty string"));
    }
    config.id = id_it->get<std::string>();

    const auto command_it = entry.find("command");
    if (command_it == entry.end() || command_it->is_string() == false
        || split_command(command_it->get<std::string>()).empty()) {
        return tl::unexpected(invalid(where + ".command must be a non-empty string"));
    }
    config.command = command_it->get<std::string>();

    auto startup = read_duration(entry, "startup_timeout_ms", config.startup_timeout);
    if (startup.has_value() == false) {
        return tl::unexpected(invalid(where + "." + startup.error().message));
    }
    config.startup_timeout = *startup;

    auto grace = read_duration(entry, "shutdown_grace_ms", config.shutdown_grace);
    if (grace.has_value() == false) {
        return tl::unexpected(invalid(where + "." + grace.error().message));
    }
    config.shutdown_grace = *grace;

    if (const auto it = entry.find("stderr"); it != entry.end()) {
        if (*it == "inherit") {
            config.stderr_mode = StderrMode::Inherit;
        } else if (*it == "discard") {
            config.stderr_mode = StderrMode::Discard;
        } else {
            return tl::unexpected(invalid(where + ".stderr must be \"inherit\" or \"discard\""));
        }
    }

    return config;
}

}  // namespace

Json ServerConfig::to_json() const {
    return {
        {"id", id},
        {"command", command},
        {"startup_timeout_ms", startup_timeout.count()},
        {"shutdown_grace_ms", shutdown_grace.count()},
        {"stderr", stderr_mode_name(stderr_mode)}
    };
}

std::vector<std::string> split_command(std::string_view command) {
    std::vector<std::string> parts;
    std::istringstream stream{std::string(command)};
    std::string part;
    while (stream >> part) {
        parts.push_back(std::move(part));
    }
    return parts;
}

ConfigResult<std::vector<ServerConfig>> parse_server_configs(const Json& document) {
    if (document.is_object() == false) {
        return tl::unexpected(invalid("configuration must be a JSON object"));
    }

    const auto servers_it = document.find("servers");
    if (servers_it == document.end() || servers_it->is_null()) {
        return std::vector<ServerConfig>{};
    }
    if (servers_it->is_array() == false) {
        return tl::unexpected(invalid("\"servers\" must be an array"));
    }

    std::vector<ServerConfig> configs;
    std::unordered_set<std::string> seen;
    std::size_t index = 0;
    for (const auto& entry : *servers_it) {
        auto config = parse_entry(entry, index++);
        if (config.has_value() == false) {
            return tl::unexpected(config.error());
        }
        if (seen.insert(config->id).second == false) {
            return tl::unexpected(invalid("duplicate server id \"" + config->id + "\""));
        }
        configs.push_back(std::move(*config));
    }
    return configs;
}

ConfigResult<std::vector<ServerConfig>> load_server_configs(const std::filesystem::path& path) {
    std::error_code ec;
    if (std::filesystem::exists(path, ec) == false) {
        if (ec) {
            return tl::unexpected(ConfigError{ConfigError::Code::Io, path.string() + ": " + ec.message()});
        }
        MCPLINK_LOG_DEBUG("config", path.string() + " does not exist, no servers configured");
        return std::vector<ServerConfig>{};
    }

    std::ifstream in(path);
    if (in.is_open() == false) {
        return tl::unexpected(ConfigError{ConfigError::Code::Io, "cannot open " + path.string()});
    }

    Json document;
    try {
        document = Json::parse(in);
    } catch (const Json::parse_error& e) {
        return tl::unexpected(ConfigError{ConfigError::Code::Parse, path.string() + ": " + e.what()});
    }

    return parse_server_configs(document);
}

ConfigResult<void> save_server_configs(
    const std::filesystem::path& path,
    const std::vector<ServerConfig>& configs
) {
    std::unordered_set<std::string> seen;
    Json servers = Json::array();
    for (const auto& config : configs) {
        if (config.id.empty() || split_command(config.command).empty()) {
            return tl::unexpected(invalid("server entries need an id and a command"));
        }
        if (seen.insert(config.id).second == false) {
            return tl::unexpected(invalid("duplicate server id \"" + config.id + "\""));
        }
        servers.push_back(config.to_json());
    }
    const Json document = {{"servers", std::move(servers)}};

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return tl::unexpected(ConfigError{ConfigError::Code::Io, path.parent_path().string() + ": " + ec.message()});
        }
    }

    auto temp = path;
    temp += ".tmp";
    {
        std::ofstream out(temp, std::ios::trunc);
        if (out.is_open() == false) {
            return tl::unexpected(ConfigError{ConfigError::Code::Io, "cannot write " + temp.string()});
        }
        out << document.dump(2) << '\n';
        if (out.good() == false) {
            return tl::unexpected(ConfigError{ConfigError::Code::Io, "write failed for " + temp.string()});
        }
    }

    std::filesystem::rename(temp, path, ec);
    if (ec) {
        return tl::unexpected(ConfigError{ConfigError::Code::Io, "cannot replace " + path.string() + ": " + ec.message()});
    }
    return {};
}

}  // namespace mcplink
