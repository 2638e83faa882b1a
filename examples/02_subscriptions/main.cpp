// Example 02: Reactive Subscriptions
//
// Subscribes to a named query and to a rules pattern, prints every push for a
// while, then unsubscribes.
//
//   ./example_subscriptions ws://localhost:8080 [seconds]

#include <noexpp/client/noex_client.hpp>
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/steady_timer.hpp>
#include <asio/use_awaitable.hpp>
#include <nlohmann/json.hpp>

#include <chrono>
#include <iostream>
#include <string>

using namespace noexpp;
using Json = nlohmann::json;

asio::awaitable<int> run_client(asio::io_context& io, std::string url, int seconds) {
    std::cout << "=== Subscriptions Example ===\n\n";

    NoexClient client(io.get_executor(), ClientConfig{}.with_url(std::move(url)));

    client.on_reconnected([] {
        std::cout << "[Reconnected] subscriptions were resynchronized\n";
    });

    auto welcome = co_await client.connect();
    if (!welcome) {
        std::cerr << "ERROR: Failed to connect: " << welcome.error().message << "\n";
        co_return 1;
    }

    // 1. Query subscription: the callback first receives the initial result set
    auto users = co_await client.subscribe("all-users", nullptr, [](const Json& rows) {
        std::cout << "[all-users] " << rows.size() << " row(s): " << rows.dump() << "\n";
    });
    if (!users) {
        std::cerr << "ERROR: subscribe failed: " << users.error().message << "\n";
        co_await client.disconnect();
        co_return 1;
    }
    std::cout << "Subscribed to all-users as handle " << users->handle << "\n";

    // 2. Rules subscription
    auto orders = co_await client.subscribe(SubscriptionRequest::rules("order.*"), [](const Json& event) {
        std::cout << "[order.*] " << event.dump() << "\n";
    });
    if (!orders) {
        std::cerr << "rules.subscribe unavailable: " << orders.error().message << "\n";
    }

    // 3. Trigger a change so the query subscription pushes
    co_await client.invoke("store.insert", {{"bucket", "users"}, {"data", {{"name", "Bob"}}}});

    // 4. Watch
    std::cout << "\nWatching for " << seconds << "s...\n";
    asio::steady_timer timer(io, std::chrono::seconds(seconds));
    co_await timer.async_wait(asio::use_awaitable);

    // 5. Clean up
    client.unsubscribe(users->handle);
    if (orders) {
        client.unsubscribe(orders->handle);
    }
    co_await client.disconnect();
    std::cout << "Done!\n";

    co_return 0;
}

int main(int argc, char* argv[]) {
    try {
        std::string url = argc > 1 ? argv[1] : "ws://localhost:8080";
        int seconds = argc > 2 ? std::stoi(argv[2]) : 10;

        asio::io_context io;
        int exit_code = 0;

        asio::co_spawn(io,
            [&]() -> asio::awaitable<void> {
                exit_code = co_await run_client(io, url, seconds);
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
