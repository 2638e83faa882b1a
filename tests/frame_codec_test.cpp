// ─────────────────────────────────────────────────────────────────────────────
// Frame Codec Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "noexpp/protocol/frame.hpp"

using namespace noexpp;
using namespace noexpp::protocol;

// ═══════════════════════════════════════════════════════════════════════════
// Encoding
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("encode_request merges payload members with id and type", "[protocol][codec]") {
    auto text = FrameCodec::encode_request(7, "store.insert", Json{{"bucket", "users"}, {"data", {{"name", "Ann"}}}});
    REQUIRE(text.has_value());
    auto frame = Json::parse(*text);

    CHECK(frame["id"] == 7);
    CHECK(frame["type"] == "store.insert");
    CHECK(frame["bucket"] == "users");
    CHECK(frame["data"]["name"] == "Ann");
    CHECK(frame.size() == 4);
}

TEST_CASE("encode_request never lets the payload override id or type", "[protocol][codec]") {
    auto frame = Json::parse(FrameCodec::encode_request(3, "auth.login", Json{{"id", 99}, {"type", "x"}, {"token", "t"}}).value());

    CHECK(frame["id"] == 3);
    CHECK(frame["type"] == "auth.login");
    CHECK(frame["token"] == "t");
}

TEST_CASE("encode_request with a null payload carries only id and type", "[protocol][codec]") {
    auto frame = Json::parse(FrameCodec::encode_request(1, "auth.logout", nullptr).value());
    CHECK(frame == Json{{"id", 1}, {"type", "auth.logout"}});
}

TEST_CASE("encode_request reports invalid UTF-8 instead of throwing", "[protocol][codec]") {
    auto in_payload = FrameCodec::encode_request(4, "store.insert", Json{{"bucket", std::string("\xFF")}});
    REQUIRE_FALSE(in_payload.has_value());
    CHECK(in_payload.error().find("Cannot encode request") == 0);

    auto in_operation = FrameCodec::encode_request(5, std::string("store.\xC3"), Json::object());
    CHECK_FALSE(in_operation.has_value());
}

TEST_CASE("encode_pong echoes the timestamp", "[protocol][codec]") {
    auto frame = Json::parse(FrameCodec::encode_pong(Json(1700000000123)));
    CHECK(frame == Json{{"type", "pong"}, {"timestamp", 1700000000123}});
}

// ═══════════════════════════════════════════════════════════════════════════
// Decoding
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("decode classifies a welcome", "[protocol][codec]") {
    FrameCodec codec;
    auto frame = codec.decode(R"({"type":"welcome","version":"1.2.0","serverTime":1700000000000,"requiresAuth":true})");

    REQUIRE(std::holds_alternative<WelcomeInfo>(frame));
    const auto& welcome = std::get<WelcomeInfo>(frame);
    CHECK(welcome.version == "1.2.0");
    CHECK(welcome.server_time == 1700000000000);
    CHECK(welcome.requires_auth);
    CHECK(frame_kind(frame) == "welcome");
}

TEST_CASE("decode classifies result and error responses", "[protocol][codec]") {
    FrameCodec codec;

    auto result = codec.decode(R"({"id":12,"type":"result","data":{"count":3}})");
    REQUIRE(std::holds_alternative<ResponseFrame>(result));
    const auto& ok = std::get<ResponseFrame>(result);
    CHECK(ok.id == 12);
    REQUIRE(ok.outcome.has_value());
    CHECK((*ok.outcome)["count"] == 3);

    auto error = codec.decode(R"({"id":13,"type":"error","code":"NOT_FOUND","message":"No such bucket","details":{"bucket":"x"}})");
    REQUIRE(std::holds_alternative<ResponseFrame>(error));
    const auto& failed = std::get<ResponseFrame>(error);
    CHECK(failed.id == 13);
    REQUIRE_FALSE(failed.outcome.has_value());
    CHECK(failed.outcome.error().code == "NOT_FOUND");
    CHECK(failed.outcome.error().message == "No such bucket");
    CHECK(failed.outcome.error().details == Json{{"bucket", "x"}});
}

TEST_CASE("decode treats a result without data as null", "[protocol][codec]") {
    FrameCodec codec;
    auto frame = codec.decode(R"({"id":1,"type":"result"})");

    REQUIRE(std::holds_alternative<ResponseFrame>(frame));
    CHECK(std::get<ResponseFrame>(frame).outcome->is_null());
}

TEST_CASE("decode maps an unexpected response type to a server error", "[protocol][codec]") {
    FrameCodec codec;
    auto frame = codec.decode(R"({"id":5,"type":"weird"})");

    REQUIRE(std::holds_alternative<ResponseFrame>(frame));
    const auto& response = std::get<ResponseFrame>(frame);
    REQUIRE_FALSE(response.outcome.has_value());
    CHECK(response.outcome.error().code == "UNKNOWN");
}

TEST_CASE("decode classifies push, ping and session revocation", "[protocol][codec]") {
    FrameCodec codec;

    auto push = codec.decode(R"({"type":"push","subscriptionId":"sub-1","channel":"users","data":[1,2]})");
    REQUIRE(std::holds_alternative<PushFrame>(push));
    CHECK(std::get<PushFrame>(push).subscription_id == "sub-1");
    CHECK(std::get<PushFrame>(push).channel == "users");
    CHECK(std::get<PushFrame>(push).data == Json::array({1, 2}));

    auto ping = codec.decode(R"({"type":"ping","timestamp":42})");
    REQUIRE(std::holds_alternative<PingFrame>(ping));
    CHECK(std::get<PingFrame>(ping).timestamp == 42);

    auto revoked = codec.decode(R"({"type":"system","event":"session_revoked","reason":"Token expired"})");
    REQUIRE(std::holds_alternative<SessionRevokedFrame>(revoked));
    CHECK(std::get<SessionRevokedFrame>(revoked).reason == "Token expired");

    auto default_reason = codec.decode(R"({"type":"system","event":"session_revoked"})");
    REQUIRE(std::holds_alternative<SessionRevokedFrame>(default_reason));
    CHECK(std::get<SessionRevokedFrame>(default_reason).reason == kDefaultRevokedReason);
}

TEST_CASE("decode reports malformed frames instead of throwing", "[protocol][codec]") {
    FrameCodec codec;

    CHECK(std::holds_alternative<MalformedFrame>(codec.decode("not json")));
    CHECK(std::holds_alternative<MalformedFrame>(codec.decode("[1,2,3]")));
    CHECK(std::holds_alternative<MalformedFrame>(codec.decode(R"({"type":"push","channel":"users"})")));
    CHECK(std::holds_alternative<MalformedFrame>(codec.decode(R"({"type":"ping"})")));
    CHECK(std::holds_alternative<MalformedFrame>(codec.decode(R"({"type":"system","event":"reboot"})")));
    CHECK(std::holds_alternative<MalformedFrame>(codec.decode(R"({"type":"mystery"})")));
    CHECK(std::holds_alternative<MalformedFrame>(codec.decode(R"({"id":-1,"type":"result"})")));
    CHECK(std::holds_alternative<MalformedFrame>(codec.decode(R"({"id":"7","type":"result"})")));

    auto malformed = codec.decode(R"({"type":"mystery"})");
    CHECK(frame_kind(malformed) == "malformed");
    CHECK(std::get<MalformedFrame>(malformed).reason.find("mystery") != std::string::npos);
}

TEST_CASE("classify works on parsed documents", "[protocol][codec]") {
    auto frame = FrameCodec::classify(Json{{"type", "welcome"}, {"version", "1.0.0"}});

    REQUIRE(std::holds_alternative<WelcomeInfo>(frame));
    CHECK_FALSE(std::get<WelcomeInfo>(frame).requires_auth);
    CHECK(std::get<WelcomeInfo>(frame).server_time == 0);
}
