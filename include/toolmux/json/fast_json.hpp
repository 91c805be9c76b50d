#pragma once

// ─────────────────────────────────────────────────────────────────────────────
// Inbound JSON decoding
// ─────────────────────────────────────────────────────────────────────────────
// Frames arriving from a server are validated and parsed with simdjson's DOM
// parser, then materialized as nlohmann::json, which the rest of toolmux uses
// for building and inspecting messages. Outbound messages are dumped with
// nlohmann directly.
//
//   auto frame = toolmux::fast_parse(line);
//   if (!frame.has_value()) {
//       // frame.error().message describes the problem
//   }

#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <tl/expected.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace toolmux {

struct JsonParseError {
    std::string message;

    JsonParseError() = default;
    explicit JsonParseError(std::string msg) : message(std::move(msg)) {}
};

using JsonResult = tl::expected<nlohmann::json, JsonParseError>;

struct FastJsonConfig {
    std::size_t max_depth{64};
    std::size_t max_document_size{16 * 1024 * 1024};
};

class FastJsonParser {
public:
    FastJsonParser() = default;
    explicit FastJsonParser(FastJsonConfig config) : config_(config) {}

    // Not thread-safe; one parser per thread.
    [[nodiscard]] JsonResult parse(std::string_view text);

    [[nodiscard]] const FastJsonConfig& config() const noexcept { return config_; }
    void set_config(FastJsonConfig config) noexcept { config_ = config; }

private:
    simdjson::dom::parser parser_;
    FastJsonConfig config_;

    [[nodiscard]] JsonResult materialize(simdjson::dom::element element, std::size_t depth) const;
};

/// Parses with a thread-local FastJsonParser.
[[nodiscard]] JsonResult fast_parse(std::string_view text);

/// Name of the active simdjson kernel ("haswell", "arm64", "fallback", ...)
[[nodiscard]] std::string fast_json_implementation();

}  // namespace toolmux
