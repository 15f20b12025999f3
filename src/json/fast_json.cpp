#include "mcplink/json/fast_json.hpp"

namespace mcplink {

namespace {

JsonParseError from_simdjson(simdjson::error_code code) {
    return JsonParseError(std::string(simdjson::error_message(code)));
}

}  // namespace

JsonResult FastJsonParser::parse(std::string_view text) {
    const simdjson::padded_string padded(text);

    simdjson::dom::element root;
    const auto code = parser_.parse(padded).get(root);
    if (code != simdjson::SUCCESS) {
        return tl::unexpected(from_simdjson(code));
    }
    return convert(root, 0);
}

JsonResult FastJsonParser::convert(simdjson::dom::element element, std::size_t depth) const {
    if (depth > config_.max_depth) {
        return tl::unexpected(JsonParseError(
            "maximum nesting depth exceeded (" + std::to_string(config_.max_depth) + ")"
        ));
    }

    switch (element.type()) {
        case simdjson::dom::element_type::OBJECT: {
            simdjson::dom::object obj;
            if (const auto code = element.get_object().get(obj); code != simdjson::SUCCESS) {
                return tl::unexpected(from_simdjson(code));
            }
            nlohmann::json out = nlohmann::json::object();
            for (const auto field : obj) {
                auto value = convert(field.value, depth + 1);
                if (value.has_value() == false) {
                    return value;
                }
                out[std::string(field.key)] = std::move(*value);
            }
            return out;
        }

        case simdjson::dom::element_type::ARRAY: {
            simdjson::dom::array arr;
            if (const auto code = element.get_array().get(arr); code != simdjson::SUCCESS) {
                return tl::unexpected(from_simdjson(code));
            }
            nlohmann::json out = nlohmann::json::array();
            for (const auto item : arr) {
                auto value = convert(item, depth + 1);
                if (value.has_value() == false) {
                    return value;
                }
                out.push_back(std::move(*value));
            }
            return out;
        }

        case simdjson::dom::element_type::STRING: {
            std::string_view sv;
            if (const auto code = element.get_string().get(sv); code != simdjson::SUCCESS) {
                return tl::unexpected(from_simdjson(code));
            }
            return nlohmann::json(std::string(sv));
        }

        case simdjson::dom::element_type::INT64: {
            std::int64_t v = 0;
            if (const auto code = element.get_int64().get(v); code != simdjson::SUCCESS) {
                return tl::unexpected(from_simdjson(code));
            }
            return nlohmann::json(v);
        }

        case simdjson::dom::element_type::UINT64: {
            std::uint64_t v = 0;
            if (const auto code = element.get_uint64().get(v); code != simdjson::SUCCESS) {
                return tl::unexpected(from_simdjson(code));
            }
            return nlohmann::json(v);
        }

        case simdjson::dom::element_type::DOUBLE: {
            double v = 0.0;
            if (const auto code = element.get_double().get(v); code != simdjson::SUCCESS) {
                return tl::unexpected(from_simdjson(code));
            }
            return nlohmann::json(v);
        }

        case simdjson::dom::element_type::BOOL: {
            bool v = false;
            if (const auto code = element.get_bool().get(v); code != simdjson::SUCCESS) {
                return tl::unexpected(from_simdjson(code));
            }
            return nlohmann::json(v);
        }

        case simdjson::dom::element_type::NULL_VALUE:
            return nlohmann::json(nullptr);

        default:
            break;
    }

    return tl::unexpected(JsonParseError("unsupported JSON value type"));
}

// ─────────────────────────────────────────────────────────────────────────────
// Convenience Functions
// ─────────────────────────────────────────────────────────────────────────────

JsonResult fast_parse(std::string_view text) {
    thread_local FastJsonParser parser;
    return parser.parse(text);
}

std::string fast_json_implementation() {
    return std::string(simdjson::get_active_implementation()->name());
}

}  // namespace mcplink
