#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Frame Codec
// ═══════════════════════════════════════════════════════════════════════════
// Every WebSocket text message is one JSON object.
//
// Client → server:
//   request   {"id": 7, "type": "store.insert", ...payload members}
//   pong      {"type": "pong", "timestamp": <echoed>}
//
// Server → client (classified in this order):
//   welcome          {"type": "welcome", "version", "serverTime", "requiresAuth"}
//   ping             {"type": "ping", "timestamp": <number>}
//   push             {"type": "push", "subscriptionId", "channel", "data"}
//   session revoked  {"type": "system", "event": "session_revoked", "reason"}
//   response         {"id": 7, "type": "result", "data"}
//                    {"id": 7, "type": "error", "code", "message", "details"}
//   anything else    malformed

#include "noexpp/json/fast_json.hpp"
#include "noexpp/transport.hpp"

#include <tl/expected.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace noexpp::protocol {

using CorrelationId = std::uint64_t;

/// Failure reported by the server in an error response, passed through verbatim.
struct ServerError {
    std::string code;
    std::string message;
    std::optional<Json> details;
};

struct WelcomeInfo {
    std::string version;
    std::int64_t server_time{0};
    bool requires_auth{false};
};

struct ResponseFrame {
    CorrelationId id{0};
    tl::expected<Json, ServerError> outcome;
};

struct PushFrame {
    std::string subscription_id;
    std::string channel;
    Json data;
};

struct PingFrame {
    Json timestamp;  ///< Echoed back unchanged in the pong
};

struct SessionRevokedFrame {
    std::string reason;
};

struct MalformedFrame {
    std::string reason;
};

using InboundFrame = std::variant<
    ResponseFrame,
    PushFrame,
    WelcomeInfo,
    PingFrame,
    SessionRevokedFrame,
    MalformedFrame
>;

[[nodiscard]] std::string_view frame_kind(const InboundFrame& frame) noexcept;

inline constexpr std::string_view kDefaultRevokedReason = "Session revoked by administrator";

// ═══════════════════════════════════════════════════════════════════════════
// FrameCodec
// ═══════════════════════════════════════════════════════════════════════════

class FrameCodec {
public:
    FrameCodec() = default;
    explicit FrameCodec(FastJsonConfig parser_config) : parser_(parser_config) {}

    /// Payload must be an object or null; its members are merged into the frame.
    /// Fails when a string in the operation or payload is not valid UTF-8.
    [[nodiscard]] static tl::expected<std::string, std::string> encode_request(
        CorrelationId id,
        std::string_view operation,
        const Json& payload
    );

    [[nodiscard]] static std::string encode_pong(const Json& timestamp);

    /// Parse and classify one inbound text message. Never throws.
    [[nodiscard]] InboundFrame decode(std::string_view text);

    /// Classify an already-parsed message.
    [[nodiscard]] static InboundFrame classify(const Json& message);

private:
    FastJsonParser parser_;
};

}  // namespace noexpp::protocol
