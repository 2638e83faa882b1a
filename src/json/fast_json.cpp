#include "noexpp/json/fast_json.hpp"

namespace noexpp {

namespace {

tl::unexpected<JsonParseError> simd_failure(simdjson::error_code code) {
    return tl::unexpected(JsonParseError(std::string(simdjson::error_message(code))));
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// FastJsonParser
// ─────────────────────────────────────────────────────────────────────────────

JsonResult FastJsonParser::parse(std::string_view text) {
    if (config_.max_document_size > 0 && text.size() > config_.max_document_size) {
        return tl::unexpected(JsonParseError(
            "Document of " + std::to_string(text.size()) + " bytes exceeds limit of " +
            std::to_string(config_.max_document_size)
        ));
    }

    simdjson::padded_string padded(text);
    auto doc_result = parser_.iterate(padded);
    if (doc_result.error() != simdjson::SUCCESS) {
        return simd_failure(doc_result.error());
    }

    try {
        auto doc = std::move(doc_result).value();
        auto root = doc.get_value();
        if (root.error() != simdjson::SUCCESS) {
            return simd_failure(root.error());
        }

        auto converted = convert(root.value(), 0);
        if (!converted) {
            return converted;
        }
        if (!doc.at_end()) {
            return tl::unexpected(JsonParseError("Trailing content after JSON document"));
        }
        return converted;
    } catch (const simdjson::simdjson_error& e) {
        return tl::unexpected(JsonParseError(e.what()));
    }
}

JsonResult FastJsonParser::convert(simdjson::ondemand::value value, std::size_t depth) {
    if (depth > config_.max_depth) {
        return tl::unexpected(JsonParseError(
            "Maximum nesting depth exceeded (" + std::to_string(config_.max_depth) + ")"
        ));
    }

    auto type = value.type();
    if (type.error() != simdjson::SUCCESS) {
        return simd_failure(type.error());
    }

    switch (type.value()) {
        case simdjson::ondemand::json_type::object: {
            auto obj = value.get_object();
            if (obj.error() != simdjson::SUCCESS) {
                return simd_failure(obj.error());
            }
            return convert_object(obj.value(), depth + 1);
        }

        case simdjson::ondemand::json_type::array: {
            auto arr = value.get_array();
            if (arr.error() != simdjson::SUCCESS) {
                return simd_failure(arr.error());
            }
            return convert_array(arr.value(), depth + 1);
        }

        case simdjson::ondemand::json_type::string: {
            auto str = value.get_string();
            if (str.error() != simdjson::SUCCESS) {
                return simd_failure(str.error());
            }
            return nlohmann::json(std::string(str.value()));
        }

        case simdjson::ondemand::json_type::number: {
            // Correlation ids and timestamps must stay integral, so try
            // the integer representations before falling back to double.
            auto as_int = value.get_int64();
            if (as_int.error() == simdjson::SUCCESS) {
                return nlohmann::json(as_int.value());
            }
            auto as_uint = value.get_uint64();
            if (as_uint.error() == simdjson::SUCCESS) {
                return nlohmann::json(as_uint.value());
            }
            auto as_double = value.get_double();
            if (as_double.error() == simdjson::SUCCESS) {
                return nlohmann::json(as_double.value());
            }
            return simd_failure(as_double.error());
        }

        case simdjson::ondemand::json_type::boolean: {
            auto flag = value.get_bool();
            if (flag.error() != simdjson::SUCCESS) {
                return simd_failure(flag.error());
            }
            return nlohmann::json(flag.value());
        }

        case simdjson::ondemand::json_type::null:
            return nlohmann::json(nullptr);
    }

    return tl::unexpected(JsonParseError("Unknown JSON type"));
}

JsonResult FastJsonParser::convert_object(simdjson::ondemand::object obj, std::size_t depth) {
    nlohmann::json result = nlohmann::json::object();

    for (auto field : obj) {
        auto key = field.unescaped_key();
        if (key.error() != simdjson::SUCCESS) {
            return simd_failure(key.error());
        }
        // Copy the key before touching the value; the view is invalidated by iteration.
        std::string name(key.value());

        auto val = field.value();
        if (val.error() != simdjson::SUCCESS) {
            return simd_failure(val.error());
        }

        auto converted = convert(val.value(), depth);
        if (!converted) {
            return converted;
        }
        result[std::move(name)] = std::move(*converted);
    }

    return result;
}

JsonResult FastJsonParser::convert_array(simdjson::ondemand::array arr, std::size_t depth) {
    nlohmann::json result = nlohmann::json::array();

    for (auto element : arr) {
        if (element.error() != simdjson::SUCCESS) {
            return simd_failure(element.error());
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

JsonResult fast_parse(std::string_view text) {
    thread_local FastJsonParser parser;
    return parser.parse(text);
}

std::string fast_json_implementation() {
    return std::string(simdjson::get_active_implementation()->name());
}

}  // namespace noexpp
