#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Session / Auth Coordinator
// ═══════════════════════════════════════════════════════════════════════════
// Replays login after every welcome that requires auth, in this order:
//
//   1. the session token cached from the last successful login
//      (auth.login {token}; dropped if rejected)
//   2. the configured token                      (auth.login {token})
//   3. the configured credentials                (identity.login {username, password})
//
// An explicit login() replaces what is replayed. A session-revoked notice
// invalidates the session and the cached token until the next login.

#include "noexpp/client/client_config.hpp"
#include "noexpp/client/client_error.hpp"
#include "noexpp/client/request_sender.hpp"

#include <asio/awaitable.hpp>

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace noexpp {

struct SessionInfo {
    std::string user_id;
    std::optional<std::string> username;
    std::vector<std::string> roles;
    std::optional<std::int64_t> expires_at;

    /// auth.login result: {userId, roles, expiresAt?}
    [[nodiscard]] static std::optional<SessionInfo> from_auth_login(const Json& result);

    /// identity.login result: {token, expiresAt, user: {id, username, roles}}
    [[nodiscard]] static std::optional<SessionInfo> from_identity_login(const Json& result);
};

class SessionCoordinator {
public:
    SessionCoordinator(IRequestSender& sender, std::optional<AuthConfig> auth);

    SessionCoordinator(const SessionCoordinator&) = delete;
    SessionCoordinator& operator=(const SessionCoordinator&) = delete;

    /// True if there is anything to replay
    [[nodiscard]] bool has_auth() const;

    /// Log in with whatever is available, in replay order
    [[nodiscard]] asio::awaitable<ClientResult<SessionInfo>> auto_login();

    [[nodiscard]] asio::awaitable<ClientResult<SessionInfo>> login_with_token(std::string token);
    [[nodiscard]] asio::awaitable<ClientResult<SessionInfo>> login_with_credentials(
        std::string username,
        std::string password
    );

    /// auth.logout; the local session is cleared even if the call fails
    [[nodiscard]] asio::awaitable<ClientResult<void>> logout();

    void mark_revoked(const std::string& reason);

    /// Forget the session but keep what to replay (connection went away)
    void invalidate();

    /// Called on an explicit connect; a revocation only vetoes automatic reconnects
    void clear_revocation();

    [[nodiscard]] bool authenticated() const;
    [[nodiscard]] bool revoked() const;
    [[nodiscard]] std::optional<SessionInfo> session() const;
    [[nodiscard]] std::optional<std::string> cached_token() const;

private:
    asio::awaitable<ClientResult<SessionInfo>> send_token_login(const std::string& token);
    asio::awaitable<ClientResult<SessionInfo>> send_credentials_login(const Credentials& credentials);
    void accept(const SessionInfo& info);

    IRequestSender& sender_;

    mutable std::mutex mutex_;
    std::optional<AuthConfig> auth_;
    std::optional<std::string> cached_token_;
    std::optional<SessionInfo> session_;
    bool revoked_{false};
};

}  // namespace noexpp
