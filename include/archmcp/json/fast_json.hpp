#pragma once

// ─────────────────────────────────────────────────────────────────────────────
// Line Decoder using simdjson
// ─────────────────────────────────────────────────────────────────────────────
//
// Incoming request lines and compositor "j/" replies are decoded with simdjson
// (on-demand API) and converted into Json documents, so the rest of the server
// only ever sees nlohmann::json. Outgoing documents are built and dumped with
// nlohmann directly.
//
//   auto doc = archmcp::fast_parse(line);
//   if (!doc) { /* doc.error().code == ErrorCode::Protocol */ }
//
// ─────────────────────────────────────────────────────────────────────────────

#include "archmcp/error.hpp"
#include "archmcp/json/json.hpp"

#include <simdjson.h>

#include <cstddef>
#include <string>
#include <string_view>

namespace archmcp {

struct JsonDecoderConfig {
    /// Maximum nesting depth accepted before the document is rejected
    std::size_t max_depth{64};
};

class JsonDecoder {
public:
    JsonDecoder() = default;
    explicit JsonDecoder(JsonDecoderConfig config) : config_(config) {}

    /// Decode one complete JSON document. A trailing "\r" (CRLF framing) is
    /// ignored; any other trailing content is a Protocol error.
    [[nodiscard]] Result<Json> decode(std::string_view text);

    [[nodiscard]] const JsonDecoderConfig& config() const noexcept { return config_; }

private:
    simdjson::ondemand::parser parser_;
    JsonDecoderConfig config_;

    [[nodiscard]] Result<Json> convert(simdjson::ondemand::value value, std::size_t depth);
    [[nodiscard]] Result<Json> convert_object(simdjson::ondemand::object obj, std::size_t depth);
    [[nodiscard]] Result<Json> convert_array(simdjson::ondemand::array arr, std::size_t depth);
};

/// Decode with a thread-local JsonDecoder
[[nodiscard]] Result<Json> fast_parse(std::string_view text);

/// Name of the active simdjson kernel ("haswell", "arm64", "fallback", ...)
[[nodiscard]] std::string fast_json_implementation();

}  // namespace archmcp
