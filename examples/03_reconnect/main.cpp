// Example 03: Reconnection
//
// Keeps a session open with bounded reconnection and prints every lifecycle
// event. Restart the server while this runs to watch the client recover; a
// request is issued every few seconds and waits out short outages.
//
//   ./example_reconnect ws://localhost:8080 [token]

#include <noexpp/client/noex_client.hpp>
#include <noexpp/log/spdlog_logger.hpp>
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/steady_timer.hpp>
#include <asio/use_awaitable.hpp>
#include <nlohmann/json.hpp>

#include <chrono>
#include <iostream>
#include <string>

using namespace noexpp;
using namespace std::chrono_literals;
using Json = nlohmann::json;

asio::awaitable<int> run_client(asio::io_context& io, std::string url, std::string token) {
    std::cout << "=== Reconnection Example ===\n\n";

    ClientConfig config;
    config.with_url(std::move(url))
          .with_request_timeout(15s)
          .with_reconnect(ReconnectConfig{}
              .with_max_retries(10)
              .with_initial_delay(500ms)
              .with_max_delay(8s)
              .with_jitter(250ms));
    if (!token.empty()) {
        config.with_auth(AuthConfig::with_token(std::move(token)));
    }

    NoexClient client(io.get_executor(), config);

    // Lifecycle events
    client.on_connected([] { std::cout << "[connected]\n"; });
    client.on_disconnected([](const std::string& reason) { std::cout << "[disconnected] " << reason << "\n"; });
    client.on_reconnecting([](std::size_t attempt) { std::cout << "[reconnecting] attempt " << attempt << "\n"; });
    client.on_reconnected([] { std::cout << "[reconnected]\n"; });
    client.on_session_revoked([](const std::string& reason) { std::cout << "[session revoked] " << reason << "\n"; });
    client.on_error([](const ClientError& error) {
        std::cout << "[error] " << error.code_name() << ": " << error.message << "\n";
    });

    auto welcome = co_await client.connect();
    if (!welcome) {
        std::cerr << "ERROR: Failed to connect: " << welcome.error().message << "\n";
        co_return 1;
    }

    asio::steady_timer timer(io);
    for (int i = 0; i < 20; ++i) {
        auto result = co_await client.invoke("store.count", {{"bucket", "users"}});
        if (result) {
            std::cout << "users: " << result->dump() << "\n";
        } else {
            std::cout << "request failed: " << result.error().code_name() << "\n";
            if (client.state() == ConnectionState::Disconnected) {
                break;
            }
        }

        timer.expires_after(3s);
        co_await timer.async_wait(asio::use_awaitable);
    }

    co_await client.disconnect();
    std::cout << "Done!\n";
    co_return 0;
}

int main(int argc, char* argv[]) {
    try {
        set_logger(make_spdlog_console_logger(LogLevel::Debug));

        std::string url = argc > 1 ? argv[1] : "ws://localhost:8080";
        std::string token = argc > 2 ? argv[2] : "";

        asio::io_context io;
        int exit_code = 0;

        asio::co_spawn(io,
            [&]() -> asio::awaitable<void> {
                exit_code = co_await run_client(io, url, token);
            },
            asio::detached
        );

        io.run();
        return exit_code;

    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << "\n";
        return 1;
    }
}
