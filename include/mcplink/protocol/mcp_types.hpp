#ifndef MCPLINK_PROTOCOL_MCP_TYPES_HPP
#define MCPLINK_PROTOCOL_MCP_TYPES_HPP

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace mcplink {

using Json = nlohmann::json;

// ═══════════════════════════════════════════════════════════════════════════
// MCP Protocol Constants
// ═══════════════════════════════════════════════════════════════════════════

inline constexpr const char* MCP_PROTOCOL_VERSION = "2024-11-05";

namespace methods {
inline constexpr const char* INITIALIZE = "initialize";
inline constexpr const char* INITIALIZED = "notifications/initialized";
inline constexpr const char* TOOLS_LIST = "tools/list";
inline constexpr const char* TOOLS_CALL = "tools/call";
inline constexpr const char* TOOLS_LIST_CHANGED = "notifications/tools/list_changed";
}  // namespace methods

// from_json() helpers below throw nlohmann::json::exception on type
// mismatches; callers convert that into a ProtocolError.

// ═══════════════════════════════════════════════════════════════════════════
// Client/Server Info
// ═══════════════════════════════════════════════════════════════════════════

struct Implementation {
    std::string name;
    std::string version;

    [[nodiscard]] Json to_json() const {
        return {{"name", name}, {"version", version}};
    }

    static Implementation from_json(const Json& j) {
        return {
            j.value("name", ""),
            j.value("version", "")
        };
    }
};

inline Implementation default_client_info() {
    return {"mcplink", "0.1.0"};
}

// ═══════════════════════════════════════════════════════════════════════════
// Initialize
// ═══════════════════════════════════════════════════════════════════════════

struct InitializeParams {
    std::string protocol_version = MCP_PROTOCOL_VERSION;
    Json capabilities = Json::object();
    Implementation client_info = default_client_info();

    [[nodiscard]] Json to_json() const {
        return {
            {"protocolVersion", protocol_version},
            {"capabilities", capabilities},
            {"clientInfo", client_info.to_json()}
        };
    }
};

struct InitializeResult {
    std::string protocol_version;
    Json capabilities = Json::object();
    Implementation server_info;
    std::optional<std::string> instructions;

    [[nodiscard]] bool supports_tools() const {
        return capabilities.is_object() && capabilities.contains("tools");
    }

    [[nodiscard]] Json to_json() const {
        Json j = {
            {"protocolVersion", protocol_version},
            {"capabilities", capabilities},
            {"serverInfo", server_info.to_json()}
        };
        if (instructions) {
            j["instructions"] = *instructions;
        }
        return j;
    }

    static InitializeResult from_json(const Json& j) {
        InitializeResult result;
        result.protocol_version = j.value("protocolVersion", "");
        if (j.contains("capabilities") && j["capabilities"].is_object()) {
            result.capabilities = j["capabilities"];
        }
        if (j.contains("serverInfo")) {
            result.server_info = Implementation::from_json(j["serverInfo"]);
        }
        if (j.contains("instructions")) {
            result.instructions = j["instructions"].get<std::string>();
        }
        return result;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Tools
// ═══════════════════════════════════════════════════════════════════════════

struct Tool {
    std::string name;
    std::optional<std::string> description;
    Json input_schema = Json::object();

    static Tool from_json(const Json& j) {
        Tool tool;
        tool.name = j.at("name").get<std::string>();
        if (j.contains("description") && j["description"].is_null() == false) {
            tool.description = j["description"].get<std::string>();
        }
        if (j.contains("inputSchema") && j["inputSchema"].is_null() == false) {
            tool.input_schema = j["inputSchema"];
        }
        return tool;
    }

    [[nodiscard]] Json to_json() const {
        Json j = {{"name", name}, {"inputSchema", input_schema}};
        if (description) {
            j["description"] = *description;
        }
        return j;
    }
};

struct ListToolsParams {
    std::optional<std::string> cursor;

    [[nodiscard]] Json to_json() const {
        Json j = Json::object();
        if (cursor) {
            j["cursor"] = *cursor;
        }
        return j;
    }
};

struct ListToolsResult {
    std::vector<Tool> tools;
    std::optional<std::string> next_cursor;

    static ListToolsResult from_json(const Json& j) {
        ListToolsResult result;
        if (j.contains("tools") && j["tools"].is_array()) {
            for (const auto& t : j["tools"]) {
                result.tools.push_back(Tool::from_json(t));
            }
        }
        if (j.contains("nextCursor") && j["nextCursor"].is_null() == false) {
            result.next_cursor = j["nextCursor"].get<std::string>();
        }
        return result;
    }
};

struct CallToolParams {
    std::string name;
    Json arguments = Json::object();

    [[nodiscard]] Json to_json() const {
        return {{"name", name}, {"arguments", arguments.is_null() ? Json::object() : arguments}};
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// Content blocks
// ─────────────────────────────────────────────────────────────────────────────
// Only the common fields are lifted out; `raw` keeps the whole block so
// image/audio/resource payloads and future block types are not lost.

struct ContentBlock {
    std::string type;
    std::optional<std::string> text;
    std::optional<std::string> data;
    std::optional<std::string> mime_type;
    Json raw = Json::object();

    [[nodiscard]] bool is_text() const noexcept { return type == "text"; }

    static ContentBlock from_json(const Json& j) {
        ContentBlock block;
        block.type = j.at("type").get<std::string>();
        if (j.contains("text")) {
            block.text = j["text"].get<std::string>();
        }
        if (j.contains("data")) {
            block.data = j["data"].get<std::string>();
        }
        if (j.contains("mimeType")) {
            block.mime_type = j["mimeType"].get<std::string>();
        }
        block.raw = j;
        return block;
    }

    [[nodiscard]] Json to_json() const {
        return raw;
    }

    static ContentBlock make_text(std::string value) {
        ContentBlock block;
        block.type = "text";
        block.raw = {{"type", "text"}, {"text", value}};
        block.text = std::move(value);
        return block;
    }
};

struct CallToolResult {
    std::vector<ContentBlock> content;
    bool is_error = false;

    /// Concatenation of every text block, newline separated
    [[nodiscard]] std::string text() const {
        std::string out;
        for (const auto& block : content) {
            if (block.text.has_value()) {
                if (out.empty() == false) {
                    out += '\n';
                }
                out += *block.text;
            }
        }
        return out;
    }

    static CallToolResult from_json(const Json& j) {
        CallToolResult result;
        if (j.contains("isError") && j["isError"].is_null() == false) {
            result.is_error = j["isError"].get<bool>();
        }
        if (j.contains("content") && j["content"].is_array()) {
            for (const auto& c : j["content"]) {
                result.content.push_back(ContentBlock::from_json(c));
            }
        }
        return result;
    }

    [[nodiscard]] Json to_json() const {
        Json blocks = Json::array();
        for (const auto& block : content) {
            blocks.push_back(block.to_json());
        }
        return {{"content", std::move(blocks)}, {"isError", is_error}};
    }
};

}  // namespace mcplink

#endif  // MCPLINK_PROTOCOL_MCP_TYPES_HPP
