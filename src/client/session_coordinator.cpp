#include "noexpp/client/session_coordinator.hpp"
#include "noexpp/log/logger.hpp"

namespace noexpp {

namespace {

std::vector<std::string> parse_roles(const Json& value) {
    std::vector<std::string> roles;
    if (!value.is_array()) {
        return roles;
    }
    for (const auto& role : value) {
        if (role.is_string()) {
            roles.push_back(role.get<std::string>());
        }
    }
    return roles;
}

std::optional<std::int64_t> parse_expiry(const Json& object) {
    auto it = object.find("expiresAt");
    if (it == object.end() || !it->is_number()) {
        return std::nullopt;
    }
    return it->get<std::int64_t>();
}

ClientError as_auth_error(const ClientError& error) {
    // Transport-level failures keep their own code
    if (error.code == ClientErrorCode::ServerError && error.server_error) {
        return ClientError::auth_error(*error.server_error);
    }
    return error;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// SessionInfo
// ─────────────────────────────────────────────────────────────────────────────

std::optional<SessionInfo> SessionInfo::from_auth_login(const Json& result) {
    if (!result.is_object()) {
        return std::nullopt;
    }
    SessionInfo info;
    if (auto user_id = result.find("userId"); user_id != result.end() && user_id->is_string()) {
        info.user_id = user_id->get<std::string>();
    }
    info.roles = parse_roles(result.value("roles", Json::array()));
    info.expires_at = parse_expiry(result);
    return info;
}

std::optional<SessionInfo> SessionInfo::from_identity_login(const Json& result) {
    if (!result.is_object()) {
        return std::nullopt;
    }
    auto user = result.find("user");
    if (user == result.end() || !user->is_object()) {
        return std::nullopt;
    }

    SessionInfo info;
    if (auto id = user->find("id"); id != user->end() && id->is_string()) {
        info.user_id = id->get<std::string>();
    }
    if (auto name = user->find("username"); name != user->end() && name->is_string()) {
        info.username = name->get<std::string>();
    }
    info.roles = parse_roles(user->value("roles", Json::array()));
    info.expires_at = parse_expiry(result);
    return info;
}

// ─────────────────────────────────────────────────────────────────────────────
// SessionCoordinator
// ─────────────────────────────────────────────────────────────────────────────

SessionCoordinator::SessionCoordinator(IRequestSender& sender, std::optional<AuthConfig> auth)
    : sender_(sender)
    , auth_(std::move(auth))
{
    if (auth_ && auth_->empty()) {
        auth_.reset();
    }
}

bool SessionCoordinator::has_auth() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cached_token_.has_value() || auth_.has_value();
}

asio::awaitable<ClientResult<SessionInfo>> SessionCoordinator::auto_login() {
    std::optional<std::string> cached;
    std::optional<AuthConfig> auth;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cached = cached_token_;
        auth = auth_;
    }

    if (cached) {
        auto result = co_await send_token_login(*cached);
        if (result) {
            co_return result;
        }
        NOEXPP_LOG_INFO("Cached session token rejected, falling back to configured auth: " + result.error().message);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (cached_token_ == cached) {
                cached_token_.reset();
            }
        }
        if (!auth) {
            co_return tl::unexpected(as_auth_error(result.error()));
        }
    }

    if (!auth) {
        co_return tl::unexpected(ClientError::auth_error("No authentication configured"));
    }

    if (auth->token) {
        co_return co_await send_token_login(*auth->token);
    }
    co_return co_await send_credentials_login(*auth->credentials);
}

asio::awaitable<ClientResult<SessionInfo>> SessionCoordinator::login_with_token(std::string token) {
    auto result = co_await send_token_login(token);
    if (result) {
        std::lock_guard<std::mutex> lock(mutex_);
        auth_ = AuthConfig::with_token(std::move(token));
    }
    co_return result;
}

asio::awaitable<ClientResult<SessionInfo>> SessionCoordinator::login_with_credentials(
    std::string username,
    std::string password
) {
    Credentials credentials{std::move(username), std::move(password)};
    auto result = co_await send_credentials_login(credentials);
    if (result) {
        std::lock_guard<std::mutex> lock(mutex_);
        auth_ = AuthConfig{std::nullopt, std::move(credentials)};
    }
    co_return result;
}

asio::awaitable<ClientResult<void>> SessionCoordinator::logout() {
    auto result = co_await sender_.request("auth.logout", Json::object());
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session_.reset();
        cached_token_.reset();
        auth_.reset();
    }
    if (!result) {
        co_return tl::unexpected(result.error());
    }
    co_return ClientResult<void>{};
}

asio::awaitable<ClientResult<SessionInfo>> SessionCoordinator::send_token_login(const std::string& token) {
    auto result = co_await sender_.request("auth.login", Json{{"token", token}});
    if (!result) {
        co_return tl::unexpected(as_auth_error(result.error()));
    }

    auto info = SessionInfo::from_auth_login(*result);
    if (!info) {
        co_return tl::unexpected(ClientError::protocol_error("Malformed auth.login result"));
    }

    accept(*info);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cached_token_ = token;
    }
    co_return *info;
}

asio::awaitable<ClientResult<SessionInfo>> SessionCoordinator::send_credentials_login(const Credentials& credentials) {
    auto result = co_await sender_.request(
        "identity.login",
        Json{{"username", credentials.username}, {"password", credentials.password}}
    );
    if (!result) {
        co_return tl::unexpected(as_auth_error(result.error()));
    }

    auto info = SessionInfo::from_identity_login(*result);
    if (!info) {
        co_return tl::unexpected(ClientError::protocol_error("Malformed identity.login result"));
    }

    accept(*info);
    if (auto token = result->find("token"); token != result->end() && token->is_string()) {
        std::lock_guard<std::mutex> lock(mutex_);
        cached_token_ = token->get<std::string>();
    }
    co_return *info;
}

void SessionCoordinator::accept(const SessionInfo& info) {
    std::lock_guard<std::mutex> lock(mutex_);
    session_ = info;
    revoked_ = false;
    NOEXPP_LOG_INFO("Logged in as " + info.user_id);
}

void SessionCoordinator::mark_revoked(const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    session_.reset();
    cached_token_.reset();
    revoked_ = true;
    NOEXPP_LOG_WARN("Session invalidated: " + reason);
}

void SessionCoordinator::invalidate() {
    std::lock_guard<std::mutex> lock(mutex_);
    session_.reset();
}

void SessionCoordinator::clear_revocation() {
    std::lock_guard<std::mutex> lock(mutex_);
    revoked_ = false;
}

bool SessionCoordinator::authenticated() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_.has_value();
}

bool SessionCoordinator::revoked() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return revoked_;
}

std::optional<SessionInfo> SessionCoordinator::session() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_;
}

std::optional<std::string> SessionCoordinator::cached_token() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cached_token_;
}

}  // namespace noexpp
