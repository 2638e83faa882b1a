// ─────────────────────────────────────────────────────────────────────────────
// Session Coordinator Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "noexpp/client/session_coordinator.hpp"
#include "mocks/fake_request_sender.hpp"
#include "test_helpers.hpp"

#include <asio/io_context.hpp>

using namespace noexpp;
using namespace noexpp::testing;

namespace {

Json auth_login_result(const std::string& user_id) {
    return Json{{"userId", user_id}, {"roles", {"admin", "writer"}}, {"expiresAt", 1700003600000}};
}

Json identity_login_result(const std::string& token) {
    return Json{
        {"token", token},
        {"expiresAt", 1700003600000},
        {"user", {{"id", "u-7"}, {"username", "alice"}, {"roles", {"reader"}}}}
    };
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// SessionInfo parsing
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("SessionInfo parses an auth.login result", "[session]") {
    auto info = SessionInfo::from_auth_login(auth_login_result("u-1"));

    REQUIRE(info.has_value());
    CHECK(info->user_id == "u-1");
    CHECK(info->roles == std::vector<std::string>{"admin", "writer"});
    CHECK(info->expires_at == 1700003600000);
    CHECK_FALSE(info->username.has_value());

    CHECK_FALSE(SessionInfo::from_auth_login(Json::array()).has_value());
}

TEST_CASE("SessionInfo parses an identity.login result", "[session]") {
    auto info = SessionInfo::from_identity_login(identity_login_result("tok"));

    REQUIRE(info.has_value());
    CHECK(info->user_id == "u-7");
    CHECK(info->username == "alice");
    CHECK(info->roles == std::vector<std::string>{"reader"});

    CHECK_FALSE(SessionInfo::from_identity_login(Json{{"token", "t"}}).has_value());
}

// ═══════════════════════════════════════════════════════════════════════════
// Explicit login / logout
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Token login establishes a session", "[session]") {
    asio::io_context io;
    FakeRequestSender sender;
    sender.reply("auth.login", auth_login_result("u-1"));
    SessionCoordinator session(sender, std::nullopt);

    CHECK_FALSE(session.has_auth());

    auto result = run_sync(io, session.login_with_token("secret"));
    REQUIRE(result.has_value());
    CHECK(result->user_id == "u-1");
    CHECK(session.authenticated());
    CHECK(session.has_auth());
    CHECK(session.cached_token() == "secret");
    CHECK(sender.calls().back().payload == Json{{"token", "secret"}});
}

TEST_CASE("Credential login caches the issued token", "[session]") {
    asio::io_context io;
    FakeRequestSender sender;
    sender.reply("identity.login", identity_login_result("issued-token"));
    SessionCoordinator session(sender, std::nullopt);

    auto result = run_sync(io, session.login_with_credentials("alice", "pw"));
    REQUIRE(result.has_value());
    CHECK(result->username == "alice");
    CHECK(session.cached_token() == "issued-token");
    CHECK(sender.calls().back().payload == Json{{"username", "alice"}, {"password", "pw"}});
}

TEST_CASE("Rejected login maps to AuthError and keeps the server error", "[session]") {
    asio::io_context io;
    FakeRequestSender sender;
    sender.fail("auth.login", ClientError::from_server({"INVALID_TOKEN", "Token is not valid", std::nullopt}));
    SessionCoordinator session(sender, std::nullopt);

    auto result = run_sync(io, session.login_with_token("bad"));
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == ClientErrorCode::AuthError);
    REQUIRE(result.error().server_error.has_value());
    CHECK(result.error().server_error->code == "INVALID_TOKEN");
    CHECK_FALSE(session.authenticated());
    CHECK_FALSE(session.has_auth());
}

TEST_CASE("Login over a dead connection keeps the transport error", "[session]") {
    asio::io_context io;
    FakeRequestSender sender;
    sender.fail("auth.login", ClientError::disconnected("Not connected"));
    SessionCoordinator session(sender, std::nullopt);

    auto result = run_sync(io, session.login_with_token("t"));
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == ClientErrorCode::Disconnected);
}

TEST_CASE("Logout clears session, cached token and auth", "[session]") {
    asio::io_context io;
    FakeRequestSender sender;
    sender.reply("auth.login", auth_login_result("u-1"));
    sender.reply("auth.logout", Json{{"loggedOut", true}});
    SessionCoordinator session(sender, AuthConfig::with_token("configured"));

    REQUIRE(run_sync(io, session.auto_login()).has_value());
    auto result = run_sync(io, session.logout());

    CHECK(result.has_value());
    CHECK_FALSE(session.authenticated());
    CHECK_FALSE(session.cached_token().has_value());
    CHECK_FALSE(session.has_auth());
}

// ═══════════════════════════════════════════════════════════════════════════
// Replay after welcome
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("auto_login uses the configured token", "[session][replay]") {
    asio::io_context io;
    FakeRequestSender sender;
    sender.reply("auth.login", auth_login_result("u-1"));
    SessionCoordinator session(sender, AuthConfig::with_token("configured"));

    auto result = run_sync(io, session.auto_login());
    REQUIRE(result.has_value());
    CHECK(sender.calls().size() == 1);
    CHECK(sender.calls()[0].payload["token"] == "configured");
}

TEST_CASE("auto_login prefers the cached token over credentials", "[session][replay]") {
    asio::io_context io;
    FakeRequestSender sender;
    sender.reply("identity.login", identity_login_result("issued"));
    sender.reply("auth.login", auth_login_result("u-7"));
    SessionCoordinator session(sender, AuthConfig::with_credentials("alice", "pw"));

    REQUIRE(run_sync(io, session.auto_login()).has_value());
    CHECK(sender.count("identity.login") == 1);

    session.invalidate();
    CHECK_FALSE(session.authenticated());

    REQUIRE(run_sync(io, session.auto_login()).has_value());
    CHECK(sender.count("identity.login") == 1);
    REQUIRE(sender.count("auth.login") == 1);
    CHECK(sender.calls().back().payload == Json{{"token", "issued"}});
}

TEST_CASE("auto_login falls back when the cached token is rejected", "[session][replay]") {
    asio::io_context io;
    FakeRequestSender sender;
    sender.reply("identity.login", identity_login_result("stale"));
    sender.fail("auth.login", ClientError::from_server({"TOKEN_EXPIRED", "expired", std::nullopt}));
    SessionCoordinator session(sender, AuthConfig::with_credentials("alice", "pw"));

    REQUIRE(run_sync(io, session.auto_login()).has_value());
    session.invalidate();

    sender.reply("identity.login", identity_login_result("fresh"));
    auto result = run_sync(io, session.auto_login());

    REQUIRE(result.has_value());
    CHECK(sender.count("auth.login") == 1);
    CHECK(sender.count("identity.login") == 2);
    CHECK(session.cached_token() == "fresh");
}

TEST_CASE("auto_login without auth fails with AuthError", "[session][replay]") {
    asio::io_context io;
    FakeRequestSender sender;
    SessionCoordinator session(sender, AuthConfig{});

    CHECK_FALSE(session.has_auth());
    auto result = run_sync(io, session.auto_login());
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == ClientErrorCode::AuthError);
    CHECK(sender.calls().empty());
}

TEST_CASE("Revocation drops session and cached token until the next login", "[session]") {
    asio::io_context io;
    FakeRequestSender sender;
    sender.reply("auth.login", auth_login_result("u-1"));
    SessionCoordinator session(sender, AuthConfig::with_token("configured"));

    REQUIRE(run_sync(io, session.login_with_token("explicit")).has_value());

    session.mark_revoked("Token expired");
    CHECK(session.revoked());
    CHECK_FALSE(session.authenticated());
    CHECK_FALSE(session.cached_token().has_value());
    CHECK(session.has_auth());

    REQUIRE(run_sync(io, session.auto_login()).has_value());
    CHECK_FALSE(session.revoked());
    CHECK(sender.calls().back().payload["token"] == "explicit");
}

TEST_CASE("Revocation survives invalidate and is cleared explicitly", "[session]") {
    FakeRequestSender sender;
    SessionCoordinator session(sender, std::nullopt);

    session.mark_revoked("Token expired");
    session.invalidate();
    CHECK(session.revoked());

    session.clear_revocation();
    CHECK_FALSE(session.revoked());
    CHECK_FALSE(session.authenticated());
    CHECK(sender.calls().empty());
}
