#pragma once

// ─────────────────────────────────────────────────────────────────────────────
// Fast inbound JSON parsing
// ─────────────────────────────────────────────────────────────────────────────
//
// Every frame read off a transport goes through simdjson's DOM parser, which
// validates the whole document (trailing bytes included) before we convert it
// into an nlohmann::json value. Outbound messages are built and dumped with
// nlohmann directly.
//
//   auto doc = mcplink::fast_parse(line);
//   if (doc.has_value() == false) { ... doc.error().message ... }
//
// ─────────────────────────────────────────────────────────────────────────────

#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <tl/expected.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace mcplink {

struct JsonParseError {
    std::string message;

    JsonParseError() = default;
    explicit JsonParseError(std::string msg) : message(std::move(msg)) {}
};

using JsonResult = tl::expected<nlohmann::json, JsonParseError>;

struct FastJsonConfig {
    /// Nesting beyond this is rejected instead of recursed into
    std::size_t max_depth{64};
};

// ─────────────────────────────────────────────────────────────────────────────
// FastJsonParser
// ─────────────────────────────────────────────────────────────────────────────
// Not thread-safe; one instance per thread (fast_parse keeps a thread_local).

class FastJsonParser {
public:
    FastJsonParser() = default;
    explicit FastJsonParser(FastJsonConfig config) : config_(config) {}

    [[nodiscard]] JsonResult parse(std::string_view text);

    [[nodiscard]] const FastJsonConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] JsonResult convert(simdjson::dom::element element, std::size_t depth) const;

    simdjson::dom::parser parser_;
    FastJsonConfig config_;
};

[[nodiscard]] JsonResult fast_parse(std::string_view text);

/// Name of the active simdjson kernel ("haswell", "arm64", "fallback", ...)
[[nodiscard]] std::string fast_json_implementation();

}  // namespace mcplink
