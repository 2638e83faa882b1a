#include "noexpp/protocol/frame.hpp"

namespace noexpp::protocol {

namespace {

std::optional<std::string> string_member(const Json& message, const char* key) {
    auto it = message.find(key);
    if (it == message.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

InboundFrame classify_response(const Json& message, CorrelationId id) {
    const std::string type = string_member(message, "type").value_or("");

    if (type == "result") {
        return ResponseFrame{id, message.value("data", Json())};
    }

    ServerError error;
    if (type == "error") {
        error.code = string_member(message, "code").value_or("UNKNOWN");
        error.message = string_member(message, "message").value_or("Unknown server error");
        if (auto it = message.find("details"); it != message.end() && !it->is_null()) {
            error.details = *it;
        }
    } else {
        error.code = "UNKNOWN";
        error.message = "Unexpected response type: " + type;
    }
    return ResponseFrame{id, tl::unexpected(std::move(error))};
}

}  // namespace

std::string_view frame_kind(const InboundFrame& frame) noexcept {
    switch (frame.index()) {
        case 0: return "response";
        case 1: return "push";
        case 2: return "welcome";
        case 3: return "ping";
        case 4: return "session_revoked";
        case 5: return "malformed";
    }
    return "unknown";
}

// ─────────────────────────────────────────────────────────────────────────────
// Encoding
// ─────────────────────────────────────────────────────────────────────────────

tl::expected<std::string, std::string> FrameCodec::encode_request(
    CorrelationId id,
    std::string_view operation,
    const Json& payload
) {
    Json frame = Json::object();
    if (payload.is_object()) {
        frame = payload;
    }
    frame["id"] = id;
    frame["type"] = std::string(operation);

    try {
        return frame.dump();
    } catch (const Json::type_error& e) {
        return tl::unexpected(std::string("Cannot encode request: ") + e.what());
    }
}

std::string FrameCodec::encode_pong(const Json& timestamp) {
    return Json{{"type", "pong"}, {"timestamp", timestamp}}.dump();
}

// ─────────────────────────────────────────────────────────────────────────────
// Decoding
// ─────────────────────────────────────────────────────────────────────────────

InboundFrame FrameCodec::decode(std::string_view text) {
    auto parsed = parser_.parse(text);
    if (!parsed) {
        return MalformedFrame{"Invalid JSON: " + parsed.error().message};
    }
    return classify(*parsed);
}

InboundFrame FrameCodec::classify(const Json& message) {
    if (!message.is_object()) {
        return MalformedFrame{"Frame is not a JSON object"};
    }

    const auto type = string_member(message, "type");

    if (type == "welcome") {
        WelcomeInfo welcome;
        welcome.version = string_member(message, "version").value_or("");
        if (auto it = message.find("serverTime"); it != message.end() && it->is_number()) {
            welcome.server_time = it->get<std::int64_t>();
        }
        if (auto it = message.find("requiresAuth"); it != message.end() && it->is_boolean()) {
            welcome.requires_auth = it->get<bool>();
        }
        return welcome;
    }

    if (type == "ping") {
        auto it = message.find("timestamp");
        if (it == message.end() || !it->is_number()) {
            return MalformedFrame{"Ping without numeric timestamp"};
        }
        return PingFrame{*it};
    }

    if (type == "push") {
        auto subscription_id = string_member(message, "subscriptionId");
        auto channel = string_member(message, "channel");
        if (!subscription_id || !channel) {
            return MalformedFrame{"Push frame missing subscriptionId or channel"};
        }
        return PushFrame{std::move(*subscription_id), std::move(*channel), message.value("data", Json())};
    }

    if (type == "system") {
        if (string_member(message, "event") == "session_revoked") {
            return SessionRevokedFrame{
                string_member(message, "reason").value_or(std::string(kDefaultRevokedReason))
            };
        }
        return MalformedFrame{"Unknown system event"};
    }

    if (auto it = message.find("id"); it != message.end()) {
        if (it->is_number_unsigned()) {
            return classify_response(message, it->get<CorrelationId>());
        }
        if (it->is_number_integer() && it->get<std::int64_t>() >= 0) {
            return classify_response(message, static_cast<CorrelationId>(it->get<std::int64_t>()));
        }
        return MalformedFrame{"Response id is not a non-negative integer"};
    }

    return MalformedFrame{"Unrecognized frame type '" + type.value_or("") + "'"};
}

}  // namespace noexpp::protocol
