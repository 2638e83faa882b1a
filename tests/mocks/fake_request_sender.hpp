#ifndef NOEXPP_TESTS_FAKE_REQUEST_SENDER_HPP
#define NOEXPP_TESTS_FAKE_REQUEST_SENDER_HPP

#include "noexpp/client/request_sender.hpp"

#include <functional>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace noexpp::testing {

// ─────────────────────────────────────────────────────────────────────────────
// FakeRequestSender
// ─────────────────────────────────────────────────────────────────────────────
// Answers requests immediately from per-operation scripts and records every
// call. Unscripted operations fail with Disconnected.

class FakeRequestSender : public IRequestSender {
public:
    using Script = std::function<ClientResult<Json>(const Json& payload)>;

    struct Call {
        std::string operation;
        Json payload;
    };

    void on(const std::string& operation, Script script) {
        scripts_[operation] = std::move(script);
    }

    void reply(const std::string& operation, Json data) {
        on(operation, [data](const Json&) -> ClientResult<Json> { return data; });
    }

    void fail(const std::string& operation, ClientError error) {
        on(operation, [error](const Json&) -> ClientResult<Json> { return tl::unexpected(error); });
    }

    asio::awaitable<ClientResult<Json>> request(std::string operation, Json payload) override {
        calls_.push_back(Call{operation, payload});
        auto it = scripts_.find(operation);
        if (it == scripts_.end()) {
            co_return tl::unexpected(ClientError::disconnected("No script for " + operation));
        }
        co_return it->second(payload);
    }

    [[nodiscard]] const std::vector<Call>& calls() const { return calls_; }

    [[nodiscard]] std::size_t count(const std::string& operation) const {
        std::size_t n = 0;
        for (const auto& call : calls_) {
            if (call.operation == operation) {
                ++n;
            }
        }
        return n;
    }

private:
    std::map<std::string, Script> scripts_;
    std::vector<Call> calls_;
};

}  // namespace noexpp::testing

#endif  // NOEXPP_TESTS_FAKE_REQUEST_SENDER_HPP
