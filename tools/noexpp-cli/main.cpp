// ─────────────────────────────────────────────────────────────────────────────
// noexpp-cli - noex Server Testing Tool
// ─────────────────────────────────────────────────────────────────────────────
// A command-line interface for poking at a noex server over WebSocket.
//
// Usage:
//   noexpp-cli --url ws://localhost:8080 --call store.all --payload '{"bucket":"users"}'
//   noexpp-cli --url wss://api.example.com --token secret --subscribe all-users --watch 30
//   noexpp-cli --url ws://localhost:8080 --user alice --password pw --interactive
//
// Features:
//   - Token or username/password login
//   - Invoke any operation with a JSON payload
//   - Subscribe to a query or a rules pattern and print push updates
//   - Print lifecycle events (reconnects, revocations, errors)
//   - Interactive REPL mode
//   - JSON output for scripting

#include <cxxopts.hpp>
#include <nlohmann/json.hpp>

#include "noexpp/client/noex_client.hpp"
#include "noexpp/log/logger.hpp"
#include "noexpp/log/spdlog_logger.hpp"
#include "noexpp/transport/beast_websocket_transport.hpp"

#include <asio/bind_executor.hpp>
#include <asio/co_spawn.hpp>
#include <asio/dispatch.hpp>
#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>
#include <asio/use_awaitable.hpp>
#include <asio/use_future.hpp>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace noexpp;
using Json = nlohmann::json;

// ═══════════════════════════════════════════════════════════════════════════
// ANSI Color Codes
// ═══════════════════════════════════════════════════════════════════════════

namespace color {
    const char* reset   = "\033[0m";
    const char* bold    = "\033[1m";
    const char* dim     = "\033[2m";
    const char* red     = "\033[31m";
    const char* green   = "\033[32m";
    const char* yellow  = "\033[33m";
    const char* cyan    = "\033[36m";

    bool enabled = true;

    std::string c(const char* code) {
        return enabled ? code : "";
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Output Helpers
// ═══════════════════════════════════════════════════════════════════════════

void print_error(const std::string& message) {
    std::cerr << color::c(color::red) << "Error: " << color::c(color::reset) << message << "\n";
}

void print_client_error(const ClientError& error, bool json_output) {
    if (json_output) {
        Json out{{"error", {{"code", error.code_name()}, {"message", error.message}}}};
        if (error.server_error && error.server_error->details) {
            out["error"]["details"] = *error.server_error->details;
        }
        std::cout << out.dump(2) << "\n";
        return;
    }
    print_error(error.code_name() + ": " + error.message);
}

void print_event(const std::string& text) {
    std::cout << color::c(color::dim) << "[event] " << text << color::c(color::reset) << "\n";
}

std::optional<Json> parse_payload(const std::string& text) {
    if (text.empty()) {
        return Json::object();
    }
    try {
        return Json::parse(text);
    } catch (const Json::parse_error& e) {
        print_error(std::string("Invalid JSON: ") + e.what());
        return std::nullopt;
    }
}

std::string get_env(const char* name, const std::string& fallback = "") {
    const char* value = std::getenv(name);
    return value ? value : fallback;
}

// ═══════════════════════════════════════════════════════════════════════════
// Client Runner
// ═══════════════════════════════════════════════════════════════════════════
// The client lives on a background io_context; the CLI thread blocks on
// futures so the REPL can read stdin normally.

class CliSession {
public:
    CliSession(ClientConfig config, WebSocketTransportConfig transport)
        : work_(asio::make_work_guard(io_))
        , client_(io_.get_executor(), std::move(config), make_beast_transport_factory(std::move(transport)))
        , thread_([this] { io_.run(); })
    {}

    ~CliSession() {
        shutdown();
    }

    CliSession(const CliSession&) = delete;
    CliSession& operator=(const CliSession&) = delete;

    NoexClient& client() { return client_; }

    ReconnectState reconnect_state() {
        return run([this]() -> asio::awaitable<ReconnectState> {
            co_await asio::dispatch(asio::bind_executor(client_.get_executor(), asio::use_awaitable));
            co_return client_.reconnect_state();
        }());
    }

    template <typename Awaitable>
    auto run(Awaitable awaitable) {
        return asio::co_spawn(io_, std::move(awaitable), asio::use_future).get();
    }

    void shutdown() {
        if (!thread_.joinable()) {
            return;
        }
        run(client_.disconnect());
        work_.reset();
        thread_.join();
    }

private:
    asio::io_context io_;
    asio::executor_work_guard<asio::io_context::executor_type> work_;
    NoexClient client_;
    std::thread thread_;
};

void attach_event_printers(NoexClient& client) {
    client.on_disconnected([](const std::string& reason) { print_event("disconnected: " + reason); });
    client.on_reconnecting([](std::size_t attempt) { print_event("reconnecting (attempt " + std::to_string(attempt) + ")"); });
    client.on_reconnected([] { print_event("reconnected"); });
    client.on_session_revoked([](const std::string& reason) { print_event("session revoked: " + reason); });
    client.on_error([](const ClientError& error) { print_event("error: " + error.code_name() + ": " + error.message); });
}

// ═══════════════════════════════════════════════════════════════════════════
// Commands
// ═══════════════════════════════════════════════════════════════════════════

int cmd_info(CliSession& session, bool json_output) {
    auto& client = session.client();
    auto welcome = client.welcome();
    auto user = client.session();

    if (json_output) {
        Json out{{"url", client.url()}, {"state", std::string(to_string(client.state()))}};
        if (welcome) {
            out["version"] = welcome->version;
            out["serverTime"] = welcome->server_time;
            out["requiresAuth"] = welcome->requires_auth;
        }
        if (user) {
            out["userId"] = user->user_id;
        }
        auto reconnect = session.reconnect_state();
        if (reconnect.running) {
            out["reconnectAttempt"] = reconnect.attempt + 1;
            out["reconnectDelayMs"] = reconnect.current_delay.count();
        }
        std::cout << out.dump(2) << "\n";
        return 0;
    }

    std::cout << color::c(color::bold) << "Server" << color::c(color::reset) << "\n";
    std::cout << "  URL:           " << client.url() << "\n";
    std::cout << "  State:         " << to_string(client.state()) << "\n";
    if (welcome) {
        std::cout << "  Version:       " << welcome->version << "\n";
        std::cout << "  Requires auth: " << (welcome->requires_auth ? "yes" : "no") << "\n";
    }
    std::cout << "  Session:       " << (user ? user->user_id : std::string("(none)")) << "\n";
    auto reconnect = session.reconnect_state();
    if (reconnect.running) {
        std::cout << "  Reconnecting:  attempt " << reconnect.attempt + 1;
        if (reconnect.max_retries) {
            std::cout << " of " << *reconnect.max_retries;
        }
        std::cout << ", next in " << reconnect.current_delay.count() << "ms\n";
    }
    return 0;
}

int cmd_call(CliSession& session, const std::string& operation, const std::string& payload_text, bool json_output) {
    auto payload = parse_payload(payload_text);
    if (!payload) {
        return 1;
    }
    auto result = session.run(session.client().invoke(operation, std::move(*payload)));
    if (!result) {
        print_client_error(result.error(), json_output);
        return 1;
    }
    std::cout << result->dump(json_output ? -1 : 2) << "\n";
    return 0;
}

int cmd_subscribe(CliSession& session, SubscriptionRequest request, bool json_output) {
    auto result = session.run(session.client().subscribe(std::move(request), [json_output](const Json& data) {
        if (json_output) {
            std::cout << data.dump() << "\n";
        } else {
            std::cout << color::c(color::green) << "[push] " << color::c(color::reset) << data.dump(2) << "\n";
        }
    }));
    if (!result) {
        print_client_error(result.error(), json_output);
        return 1;
    }
    if (!json_output) {
        std::cout << color::c(color::dim) << "Subscribed (handle " << result->handle
                  << ", server id " << result->server_id << ")" << color::c(color::reset) << "\n";
    }
    return 0;
}

int cmd_login(CliSession& session, const std::string& token, bool json_output) {
    auto result = session.run(session.client().login(token));
    if (!result) {
        print_client_error(result.error(), json_output);
        return 1;
    }
    std::cout << "Logged in as " << result->user_id << "\n";
    return 0;
}

// ═══════════════════════════════════════════════════════════════════════════
// Interactive REPL
// ═══════════════════════════════════════════════════════════════════════════

void print_repl_help() {
    std::cout << "\n" << color::c(color::bold) << "Available commands:" << color::c(color::reset) << "\n";
    std::cout << "  " << color::c(color::yellow) << "call <op> [json]" << color::c(color::reset) << "   - Invoke an operation\n";
    std::cout << "  " << color::c(color::yellow) << "sub <query> [json]" << color::c(color::reset) << " - Subscribe to a query\n";
    std::cout << "  " << color::c(color::yellow) << "rules <pattern>" << color::c(color::reset) << "    - Subscribe to rule events\n";
    std::cout << "  " << color::c(color::yellow) << "unsub <handle>" << color::c(color::reset) << "     - Cancel a subscription\n";
    std::cout << "  " << color::c(color::yellow) << "login <token>" << color::c(color::reset) << "      - Log in with a token\n";
    std::cout << "  " << color::c(color::yellow) << "logout" << color::c(color::reset) << "             - End the session\n";
    std::cout << "  " << color::c(color::yellow) << "info" << color::c(color::reset) << "               - Show connection info\n";
    std::cout << "  " << color::c(color::yellow) << "help" << color::c(color::reset) << "               - Show this help\n";
    std::cout << "  " << color::c(color::yellow) << "quit" << color::c(color::reset) << "               - Exit\n\n";
}

std::string rest_of(std::istringstream& iss) {
    std::string rest;
    std::getline(iss, rest);
    auto start = rest.find_first_not_of(" \t");
    return start == std::string::npos ? std::string{} : rest.substr(start);
}

int run_repl(CliSession& session) {
    std::cout << "Type 'help' for available commands, 'quit' to exit.\n";

    std::string line;
    while (true) {
        std::cout << color::c(color::cyan) << "noex> " << color::c(color::reset) << std::flush;
        if (!std::getline(std::cin, line)) {
            break;
        }

        std::istringstream iss(line);
        std::string cmd;
        iss >> cmd;
        if (cmd.empty()) continue;

        if (cmd == "quit" || cmd == "exit" || cmd == "q") {
            break;
        } else if (cmd == "help" || cmd == "?") {
            print_repl_help();
        } else if (cmd == "info") {
            cmd_info(session, false);
        } else if (cmd == "call") {
            std::string operation;
            iss >> operation;
            if (operation.empty()) {
                print_error("Usage: call <op> [json]");
                continue;
            }
            cmd_call(session, operation, rest_of(iss), false);
        } else if (cmd == "sub") {
            std::string query;
            iss >> query;
            if (query.empty()) {
                print_error("Usage: sub <query> [json]");
                continue;
            }
            auto params = parse_payload(rest_of(iss));
            if (params) {
                cmd_subscribe(session, SubscriptionRequest::query(query, params->empty() ? Json(nullptr) : *params), false);
            }
        } else if (cmd == "rules") {
            std::string pattern;
            iss >> pattern;
            if (pattern.empty()) {
                print_error("Usage: rules <pattern>");
                continue;
            }
            cmd_subscribe(session, SubscriptionRequest::rules(pattern), false);
        } else if (cmd == "unsub") {
            SubscriptionHandle handle = 0;
            if (!(iss >> handle) || !session.client().unsubscribe(handle)) {
                print_error("Unknown subscription handle");
            }
        } else if (cmd == "login") {
            std::string token;
            iss >> token;
            if (token.empty()) {
                print_error("Usage: login <token>");
                continue;
            }
            cmd_login(session, token, false);
        } else if (cmd == "logout") {
            auto result = session.run(session.client().logout());
            if (!result) {
                print_client_error(result.error(), false);
            }
        } else {
            print_error("Unknown command: " + cmd + ". Type 'help' for available commands.");
        }
    }

    std::cout << "\nGoodbye!\n";
    return 0;
}

// ═══════════════════════════════════════════════════════════════════════════
// Main
// ═══════════════════════════════════════════════════════════════════════════

int main(int argc, char* argv[]) {
    cxxopts::Options options("noexpp-cli", "noex Server Testing Tool");

    options.add_options()
        // Connection
        ("u,url", "Server URL (ws:// or wss://)", cxxopts::value<std::string>())
        ("token", "Login token (or use NOEX_TOKEN env var)", cxxopts::value<std::string>())
        ("user", "Username for credential login", cxxopts::value<std::string>())
        ("password", "Password for credential login (or use NOEX_PASSWORD env var)", cxxopts::value<std::string>())
        ("request-timeout", "Request timeout in milliseconds", cxxopts::value<int>()->default_value("10000"))
        ("connect-timeout", "Connect timeout in milliseconds", cxxopts::value<int>()->default_value("5000"))
        ("max-retries", "Reconnect attempts before giving up (default: unbounded)", cxxopts::value<std::size_t>())
        ("no-reconnect", "Disable automatic reconnection")
        ("no-heartbeat", "Do not answer server pings")
        ("insecure", "Skip TLS certificate verification")
        ("ca-cert", "CA certificate file for wss://", cxxopts::value<std::string>())

        // Commands
        ("call", "Invoke an operation", cxxopts::value<std::string>())
        ("payload", "JSON payload for --call", cxxopts::value<std::string>()->default_value("{}"))
        ("subscribe", "Subscribe to a named query", cxxopts::value<std::string>())
        ("params", "JSON parameters for --subscribe", cxxopts::value<std::string>()->default_value(""))
        ("rules", "Subscribe to rule events matching a pattern", cxxopts::value<std::string>())
        ("watch", "Seconds to keep printing push updates", cxxopts::value<int>()->default_value("0"))
        ("info", "Show server info")
        ("i,interactive", "Start interactive REPL mode")

        // Output
        ("j,json", "Output results as JSON")
        ("no-color", "Disable colored output")
        ("events", "Print lifecycle events")
        ("log-level", "trace, debug, info, warn, error, off", cxxopts::value<std::string>()->default_value("warn"))
        ("log-file", "Also write logs to this file", cxxopts::value<std::string>())
        ("h,help", "Print usage");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << "\n";
            std::cout << "Examples:\n\n";
            std::cout << "    noexpp-cli -u ws://localhost:8080 --call store.all --payload '{\"bucket\":\"users\"}'\n";
            std::cout << "    noexpp-cli -u ws://localhost:8080 --token secret --subscribe all-users --watch 60\n";
            std::cout << "    noexpp-cli -u wss://api.example.com --user alice --password pw -i\n";
            return 0;
        }

        color::enabled = !result.count("no-color");
        bool json_output = result.count("json") > 0;

        if (!result.count("url")) {
            print_error("--url is required");
            std::cout << "\n" << options.help() << "\n";
            return 1;
        }

        // Logging
        auto level = log_level_from_string(result["log-level"].as<std::string>());
        if (!level) {
            print_error("Unknown log level: " + result["log-level"].as<std::string>());
            return 1;
        }
        if (result.count("log-file")) {
            set_logger(make_spdlog_console_file_logger(result["log-file"].as<std::string>(), *level));
        } else {
            set_logger(make_spdlog_console_logger(*level));
        }

        // Client configuration
        ReconnectConfig reconnect;
        reconnect.with_enabled(!result.count("no-reconnect"));
        if (result.count("max-retries")) {
            reconnect.with_max_retries(result["max-retries"].as<std::size_t>());
        }

        ClientConfig config;
        config.with_url(result["url"].as<std::string>())
              .with_request_timeout(std::chrono::milliseconds(result["request-timeout"].as<int>()))
              .with_connect_timeout(std::chrono::milliseconds(result["connect-timeout"].as<int>()))
              .with_heartbeat(!result.count("no-heartbeat"))
              .with_reconnect(reconnect);

        std::string token = result.count("token") ? result["token"].as<std::string>() : get_env("NOEX_TOKEN");
        if (!token.empty()) {
            config.with_auth(AuthConfig::with_token(token));
        } else if (result.count("user")) {
            std::string password = result.count("password")
                ? result["password"].as<std::string>()
                : get_env("NOEX_PASSWORD");
            config.with_auth(AuthConfig::with_credentials(result["user"].as<std::string>(), password));
        }

        WebSocketTransportConfig transport;
        transport.with_verify_peer(!result.count("insecure"));
        if (result.count("ca-cert")) {
            transport.with_ca_cert_path(result["ca-cert"].as<std::string>());
        }

        CliSession session(std::move(config), std::move(transport));
        if (result.count("events") || result.count("interactive")) {
            attach_event_printers(session.client());
        }

        auto welcome = session.run(session.client().connect());
        if (!welcome) {
            print_client_error(welcome.error(), json_output);
            return 1;
        }
        if (!json_output) {
            std::cout << color::c(color::green) << "Connected to " << session.client().url()
                      << " (server " << welcome->version << ")" << color::c(color::reset) << "\n";
        }

        // Without a server-side auth requirement the auto-login is skipped
        if (!welcome->requires_auth && session.client().config().auth && !session.client().session()) {
            auto login = session.client().config().auth->token
                ? session.run(session.client().login(*session.client().config().auth->token))
                : session.run(session.client().login(session.client().config().auth->credentials->username,
                                                     session.client().config().auth->credentials->password));
            if (!login) {
                print_client_error(login.error(), json_output);
                return 1;
            }
        }

        int exit_code = 0;

        if (result.count("interactive")) {
            exit_code = run_repl(session);
        } else if (result.count("call")) {
            exit_code = cmd_call(session, result["call"].as<std::string>(), result["payload"].as<std::string>(), json_output);
        } else if (result.count("subscribe") || result.count("rules")) {
            if (result.count("subscribe")) {
                auto params = parse_payload(result["params"].as<std::string>());
                if (!params) {
                    return 1;
                }
                exit_code = cmd_subscribe(session,
                    SubscriptionRequest::query(result["subscribe"].as<std::string>(),
                                               params->empty() ? Json(nullptr) : *params),
                    json_output);
            } else {
                exit_code = cmd_subscribe(session, SubscriptionRequest::rules(result["rules"].as<std::string>()), json_output);
            }
            int watch = result["watch"].as<int>();
            if (exit_code == 0 && watch > 0) {
                std::this_thread::sleep_for(std::chrono::seconds(watch));
            }
        } else {
            exit_code = cmd_info(session, json_output);
        }

        session.shutdown();
        return exit_code;

    } catch (const cxxopts::exceptions::exception& e) {
        print_error(e.what());
        return 1;
    } catch (const std::invalid_argument& e) {
        print_error(e.what());
        return 1;
    }
}
