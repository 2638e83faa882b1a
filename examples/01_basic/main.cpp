// Example 01: Basic Client
//
// Connects to a noex server, logs in with a token when one is given and
// invokes a couple of store operations.
//
//   ./example_basic ws://localhost:8080 [token]

#include <noexpp/client/noex_client.hpp>
#include <noexpp/log/spdlog_logger.hpp>
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <nlohmann/json.hpp>

#include <iostream>
#include <string>

using namespace noexpp;
using Json = nlohmann::json;

asio::awaitable<int> run_client(asio::io_context& io, std::string url, std::string token) {
    std::cout << "=== Basic noex Client Example ===\n\n";

    // 1. Configure the client
    ClientConfig config;
    config.with_url(std::move(url))
          .with_request_timeout(std::chrono::seconds(5));
    if (!token.empty()) {
        config.with_auth(AuthConfig::with_token(std::move(token)));
    }

    NoexClient client(io.get_executor(), config);

    // 2. Connect and wait for the welcome
    std::cout << "Connecting to " << client.url() << "...\n";
    auto welcome = co_await client.connect();
    if (!welcome) {
        std::cerr << "ERROR: Failed to connect: " << welcome.error().message << "\n";
        co_return 1;
    }
    std::cout << "  Server version: " << welcome->version << "\n";
    std::cout << "  Requires auth:  " << (welcome->requires_auth ? "yes" : "no") << "\n";
    if (auto session = client.session()) {
        std::cout << "  Logged in as:   " << session->user_id << "\n";
    }
    std::cout << "\n";

    // 3. Insert a record
    std::cout << "Inserting a user...\n";
    auto inserted = co_await client.invoke("store.insert", {
        {"bucket", "users"},
        {"data", {{"name", "Alice"}, {"age", 30}}}
    });
    if (inserted) {
        std::cout << "  " << inserted->dump() << "\n";
    } else {
        std::cerr << "  Failed: " << inserted.error().code_name() << ": " << inserted.error().message << "\n";
    }

    // 4. Read everything back
    std::cout << "Listing users...\n";
    auto users = co_await client.invoke("store.all", {{"bucket", "users"}});
    if (users) {
        std::cout << users->dump(2) << "\n";
    } else {
        std::cerr << "  Failed: " << users.error().message << "\n";
    }

    // 5. Disconnect
    std::cout << "\nDisconnecting...\n";
    co_await client.disconnect();
    std::cout << "Done!\n";

    co_return 0;
}

int main(int argc, char* argv[]) {
    try {
        set_logger(make_spdlog_console_logger(LogLevel::Info));

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
