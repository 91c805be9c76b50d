#include "toolmux/json/fast_json.hpp"

namespace toolmux {

namespace {

[[nodiscard]] JsonParseError simdjson_failure(simdjson::error_code code) {
    return JsonParseError(std::string(simdjson::error_message(code)));
}

}  // namespace

JsonResult FastJsonParser::parse(std::string_view text) {
    if (text.size() > config_.max_document_size) {
        return tl::unexpected(JsonParseError(
            "Document of " + std::to_string(text.size()) + " bytes exceeds limit of "
            + std::to_string(config_.max_document_size)
        ));
    }

    simdjson::padded_string padded(text);
    simdjson::dom::element root;
    const auto code = parser_.parse(padded).get(root);
    if (code != simdjson::SUCCESS) {
        return tl::unexpected(simdjson_failure(code));
    }
    return materialize(root, 0);
}

JsonResult FastJsonParser::materialize(simdjson::dom::element element, std::size_t depth) const {
    if (depth > config_.max_depth) {
        return tl::unexpected(JsonParseError(
            "Maximum nesting depth exceeded (" + std::to_string(config_.max_depth) + ")"
        ));
    }

    using simdjson::dom::element_type;

    switch (element.type()) {
        case element_type::OBJECT: {
            nlohmann::json out = nlohmann::json::object();
            for (const auto field : simdjson::dom::object(element)) {
                auto value = materialize(field.value, depth + 1);
                if (!value.has_value()) {
                    return value;
                }
                out[std::string(field.key)] = std::move(*value);
            }
            return out;
        }

        case element_type::ARRAY: {
            nlohmann::json out = nlohmann::json::array();
            for (const auto item : simdjson::dom::array(element)) {
                auto value = materialize(item, depth + 1);
                if (!value.has_value()) {
                    return value;
                }
                out.push_back(std::move(*value));
            }
            return out;
        }

        case element_type::STRING:
            return nlohmann::json(std::string(std::string_view(element)));

        case element_type::INT64:
            return nlohmann::json(std::int64_t(element));

        case element_type::UINT64:
            return nlohmann::json(std::uint64_t(element));

        case element_type::DOUBLE:
            return nlohmann::json(double(element));

        case element_type::BOOL:
            return nlohmann::json(bool(element));

        case element_type::NULL_VALUE:
            return nlohmann::json(nullptr);
    }

    return tl::unexpected(JsonParseError("Unknown JSON element type"));
}

JsonResult fast_parse(std::string_view text) {
    thread_local FastJsonParser parser;
    return parser.parse(text);
}

std::string fast_json_implementation() {
    return std::string(simdjson::get_active_implementation()->name());
}

}  // namespace toolmux
