#pragma once

#include "noexpp/client/client_error.hpp"

#include <asio/awaitable.hpp>

#include <string>

namespace noexpp {

/// Sends one request on the current connection. Implemented by the client for
/// the subscription registry and the session coordinator, which must keep
/// working while application calls are still held back (login, resubscribe).
class IRequestSender {
public:
    virtual ~IRequestSender() = default;

    [[nodiscard]] virtual asio::awaitable<ClientResult<Json>> request(std::string operation, Json payload) = 0;
};

}  // namespace noexpp
