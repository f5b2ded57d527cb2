#include "archmcp/json/fast_json.hpp"

namespace archmcp {

namespace {

Error decode_error(simdjson::error_code code) {
    return Error::protocol(std::string("parse error: ") + simdjson::error_message(code));
}

Result<Json> convert_number(simdjson::ondemand::number number) {
    switch (number.get_number_type()) {
        case simdjson::ondemand::number_type::signed_integer:
            return Json(number.get_int64());
        case simdjson::ondemand::number_type::unsigned_integer:
            return Json(number.get_uint64());
        case simdjson::ondemand::number_type::floating_point_number:
            return Json(number.get_double());
        default:
            break;
    }
    return tl::unexpected(Error::protocol("parse error: number out of range"));
}

// Scalars read through either a document (top level) or a nested value.
template <typename Source>
Result<Json> convert_scalar(Source& source, simdjson::ondemand::json_type type) {
    switch (type) {
        case simdjson::ondemand::json_type::string: {
            auto str = source.get_string();
            if (str.error() != simdjson::SUCCESS) {
                return tl::unexpected(decode_error(str.error()));
            }
            return Json(std::string(str.value()));
        }

        case simdjson::ondemand::json_type::number: {
            auto number = source.get_number();
            if (number.error() != simdjson::SUCCESS) {
                return tl::unexpected(decode_error(number.error()));
            }
            return convert_number(number.value());
        }

        case simdjson::ondemand::json_type::boolean: {
            auto flag = source.get_bool();
            if (flag.error() != simdjson::SUCCESS) {
                return tl::unexpected(decode_error(flag.error()));
            }
            return Json(flag.value());
        }

        case simdjson::ondemand::json_type::null: {
            // The type is guessed from the first byte; "nope" also lands here.
            auto is_null = source.is_null();
            if ((is_null.error() != simdjson::SUCCESS) || (is_null.value() == false)) {
                return tl::unexpected(decode_error(simdjson::N_ATOM_ERROR));
            }
            return Json(nullptr);
        }

        default:
            break;
    }
    return tl::unexpected(Error::protocol("parse error: unexpected JSON type"));
}

std::string_view strip_line_ending(std::string_view text) {
    while ((text.empty() == false) && ((text.back() == '\r') || (text.back() == '\n'))) {
        text.remove_suffix(1);
    }
    return text;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// JsonDecoder
// ─────────────────────────────────────────────────────────────────────────────

Result<Json> JsonDecoder::decode(std::string_view text) {
    text = strip_line_ending(text);
    if (text.empty()) {
        return tl::unexpected(Error::protocol("parse error: empty document"));
    }

    simdjson::padded_string padded(text);

    try {
        auto doc_result = parser_.iterate(padded);
        if (doc_result.error() != simdjson::SUCCESS) {
            return tl::unexpected(decode_error(doc_result.error()));
        }
        simdjson::ondemand::document doc = std::move(doc_result).value();

        auto type = doc.type();
        if (type.error() != simdjson::SUCCESS) {
            return tl::unexpected(decode_error(type.error()));
        }

        Result<Json> converted;
        switch (type.value()) {
            case simdjson::ondemand::json_type::object: {
                auto obj = doc.get_object();
                if (obj.error() != simdjson::SUCCESS) {
                    return tl::unexpected(decode_error(obj.error()));
                }
                converted = convert_object(obj.value(), 1);
                break;
            }
            case simdjson::ondemand::json_type::array: {
                auto arr = doc.get_array();
                if (arr.error() != simdjson::SUCCESS) {
                    return tl::unexpected(decode_error(arr.error()));
                }
                converted = convert_array(arr.value(), 1);
                break;
            }
            default:
                converted = convert_scalar(doc, type.value());
                break;
        }

        if (!converted) {
            return converted;
        }
        if (doc.at_end() == false) {
            return tl::unexpected(decode_error(simdjson::TRAILING_CONTENT));
        }
        return converted;
    } catch (const simdjson::simdjson_error& e) {
        return tl::unexpected(Error::protocol(std::string("parse error: ") + e.what()));
    }
}

Result<Json> JsonDecoder::convert(simdjson::ondemand::value value, std::size_t depth) {
    if (depth > config_.max_depth) {
        return tl::unexpected(Error::protocol(
            "parse error: maximum nesting depth exceeded (" + std::to_string(config_.max_depth) + ")"));
    }

    auto type = value.type();
    if (type.error() != simdjson::SUCCESS) {
        return tl::unexpected(decode_error(type.error()));
    }

    switch (type.value()) {
        case simdjson::ondemand::json_type::object: {
            auto obj = value.get_object();
            if (obj.error() != simdjson::SUCCESS) {
                return tl::unexpected(decode_error(obj.error()));
            }
            return convert_object(obj.value(), depth + 1);
        }
        case simdjson::ondemand::json_type::array: {
            auto arr = value.get_array();
            if (arr.error() != simdjson::SUCCESS) {
                return tl::unexpected(decode_error(arr.error()));
            }
            return convert_array(arr.value(), depth + 1);
        }
        default:
            return convert_scalar(value, type.value());
    }
}

Result<Json> JsonDecoder::convert_object(simdjson::ondemand::object obj, std::size_t depth) {
    if (depth > config_.max_depth) {
        return tl::unexpected(Error::protocol(
            "parse error: maximum nesting depth exceeded (" + std::to_string(config_.max_depth) + ")"));
    }

    Json result = Json::object();
    for (auto field : obj) {
        if (field.error() != simdjson::SUCCESS) {
            return tl::unexpected(decode_error(field.error()));
        }

        auto key = field.unescaped_key();
        if (key.error() != simdjson::SUCCESS) {
            return tl::unexpected(decode_error(key.error()));
        }
        // The key view is invalidated by the next parser step
        std::string key_text(key.value());

        auto value = field.value();
        if (value.error() != simdjson::SUCCESS) {
            return tl::unexpected(decode_error(value.error()));
        }

        auto converted = convert(value.value(), depth);
        if (!converted) {
            return converted;
        }
        result[std::move(key_text)] = std::move(*converted);
    }
    return result;
}

Result<Json> JsonDecoder::convert_array(simdjson::ondemand::array arr, std::size_t depth) {
    if (depth > config_.max_depth) {
        return tl::unexpected(Error::protocol(
            "parse error: maximum nesting depth exceeded (" + std::to_string(config_.max_depth) + ")"));
    }

    Json result = Json::array();
    for (auto element : arr) {
        if (element.error() != simdjson::SUCCESS) {
            return tl::unexpected(decode_error(element.error()));
        }

        auto converted = convert(element.value(), depth);
        if (!converted) {
            return converted;
        }
        result.push_back(std::move(*converted));
    }
    return result;
}

// ─────────────────────────────────────────────────────────────────────────────
// Convenience Functions
// ─────────────────────────────────────────────────────────────────────────────

Result<Json> fast_parse(std::string_view text) {
    thread_local JsonDecoder decoder;
    return decoder.decode(text);
}

std::string fast_json_implementation() {
    return std::string(simdjson::get_active_implementation()->name());
}

}  // namespace archmcp
