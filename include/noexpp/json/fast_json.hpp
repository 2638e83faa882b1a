#pragma once

// ─────────────────────────────────────────────────────────────────────────────
// Fast JSON Parser
// ─────────────────────────────────────────────────────────────────────────────
// Inbound frames are parsed with simdjson (on-demand API) and materialized as
// nlohmann::json so the rest of the client works with one JSON type.
// Outbound frames are built and dumped with nlohmann directly.
//
//   auto doc = noexpp::fast_parse(R"({"type":"ping","timestamp":1})");
//   if (doc) { ... (*doc)["type"] ... }
// ─────────────────────────────────────────────────────────────────────────────

#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <tl/expected.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace noexpp {

struct JsonParseError {
    std::string message;

    JsonParseError() = default;
    explicit JsonParseError(std::string msg)
        : message(std::move(msg))
    {}
};

using JsonResult = tl::expected<nlohmann::json, JsonParseError>;

struct FastJsonConfig {
    /// Maximum nesting depth accepted before the document is rejected
    std::size_t max_depth{64};

    /// Documents larger than this are rejected without parsing (0 = unlimited)
    std::size_t max_document_size{16 * 1024 * 1024};
};

class FastJsonParser {
public:
    FastJsonParser() = default;
    explicit FastJsonParser(FastJsonConfig config) : config_(config) {}

    /// Parse one complete JSON document. Trailing content is an error.
    [[nodiscard]] JsonResult parse(std::string_view text);

    [[nodiscard]] const FastJsonConfig& config() const noexcept { return config_; }
    void set_config(FastJsonConfig config) noexcept { config_ = config; }

private:
    [[nodiscard]] JsonResult convert(simdjson::ondemand::value value, std::size_t depth);
    [[nodiscard]] JsonResult convert_object(simdjson::ondemand::object obj, std::size_t depth);
    [[nodiscard]] JsonResult convert_array(simdjson::ondemand::array arr, std::size_t depth);

    simdjson::ondemand::parser parser_;
    FastJsonConfig config_;
};

/// Thread-local parser with the default configuration.
[[nodiscard]] JsonResult fast_parse(std::string_view text);

/// Name of the active simdjson kernel ("haswell", "arm64", "fallback", ...)
[[nodiscard]] std::string fast_json_implementation();

}  // namespace noexpp
