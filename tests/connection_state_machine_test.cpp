// ─────────────────────────────────────────────────────────────────────────────
// Connection State Machine Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "noexpp/transport/connection_state_machine.hpp"
#include "mocks/capture_logger.hpp"
#include "mocks/mock_websocket_server.hpp"
#include "test_helpers.hpp"

#include <asio/io_context.hpp>
#include <asio/strand.hpp>

#include <cstdint>
#include <vector>

using namespace noexpp;
using namespace noexpp::testing;
using namespace std::chrono_literals;

namespace {

class RecordingHandler : public IFrameHandler {
public:
    void on_response(const protocol::ResponseFrame& frame) override { responses.push_back(frame); }
    void on_push(const protocol::PushFrame& frame) override { pushes.push_back(frame); }
    void on_session_revoked(const std::string& reason) override { revocations.push_back(reason); }
    void on_protocol_error(const std::string& message) override { protocol_errors.push_back(message); }
    void on_connection_lost(const TransportError& error) override { losses.push_back(error); }

    std::vector<protocol::ResponseFrame> responses;
    std::vector<protocol::PushFrame> pushes;
    std::vector<std::string> revocations;
    std::vector<std::string> protocol_errors;
    std::vector<TransportError> losses;
};

struct MachineFixture {
    asio::io_context io;
    asio::strand<asio::any_io_executor> strand{asio::make_strand(io.get_executor())};
    std::shared_ptr<MockWebSocketServer> server = MockWebSocketServer::create();
    RecordingHandler handler;
    ConnectionStateMachine machine;

    explicit MachineFixture(ConnectionOptions options = {200ms, true})
        : machine(strand, server->factory(), *security::parse_websocket_url("ws://localhost:8080"), options, handler)
    {}
};

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Transitions
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ConnectionStateMachine legal transitions", "[connection][state]") {
    using S = ConnectionState;

    CHECK(ConnectionStateMachine::is_legal_transition(S::Disconnected, S::Connecting));
    CHECK(ConnectionStateMachine::is_legal_transition(S::Connecting, S::Connected));
    CHECK(ConnectionStateMachine::is_legal_transition(S::Connecting, S::Disconnected));
    CHECK(ConnectionStateMachine::is_legal_transition(S::Connected, S::Reconnecting));
    CHECK(ConnectionStateMachine::is_legal_transition(S::Connected, S::Disconnected));
    CHECK(ConnectionStateMachine::is_legal_transition(S::Reconnecting, S::Connected));
    CHECK(ConnectionStateMachine::is_legal_transition(S::Reconnecting, S::Disconnected));

    CHECK_FALSE(ConnectionStateMachine::is_legal_transition(S::Disconnected, S::Connected));
    CHECK_FALSE(ConnectionStateMachine::is_legal_transition(S::Disconnected, S::Reconnecting));
    CHECK_FALSE(ConnectionStateMachine::is_legal_transition(S::Connecting, S::Reconnecting));
    CHECK_FALSE(ConnectionStateMachine::is_legal_transition(S::Reconnecting, S::Connecting));
}

TEST_CASE("ConnectionState names", "[connection][state]") {
    CHECK(to_string(ConnectionState::Connecting) == "connecting");
    CHECK(to_string(ConnectionState::Connected) == "connected");
    CHECK(to_string(ConnectionState::Reconnecting) == "reconnecting");
    CHECK(to_string(ConnectionState::Disconnected) == "disconnected");
}

TEST_CASE("ConnectionStateMachine refuses illegal transitions", "[connection][state]") {
    MachineFixture f;

    CHECK_FALSE(f.machine.transition_to(ConnectionState::Connected));
    CHECK(f.machine.state() == ConnectionState::Disconnected);
    CHECK(f.machine.transition_to(ConnectionState::Disconnected));
}

// ═══════════════════════════════════════════════════════════════════════════
// Handshake
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("open waits for the welcome and becomes Connected", "[connection][handshake]") {
    MachineFixture f;
    f.server->set_requires_auth(true);

    auto welcome = run_sync(f.io, f.machine.open());

    REQUIRE(welcome.has_value());
    CHECK(welcome->version == "1.0.0");
    CHECK(welcome->requires_auth);
    CHECK(f.machine.state() == ConnectionState::Connected);
    CHECK(f.machine.generation() == 1);
    CHECK(f.machine.welcome()->server_time == 1700000000000);
    CHECK(f.machine.handle().valid());
}

TEST_CASE("open times out without a welcome", "[connection][handshake]") {
    MachineFixture f({50ms, true});
    f.server->set_auto_welcome(false);

    auto welcome = run_sync(f.io, f.machine.open());

    REQUIRE_FALSE(welcome.has_value());
    CHECK(welcome.error().code == ClientErrorCode::ConnectFailed);
    CHECK(welcome.error().message == "Timeout waiting for welcome message after 50ms");
    CHECK(f.machine.state() == ConnectionState::Disconnected);
    CHECK_FALSE(f.machine.handle().valid());
}

TEST_CASE("open reports a refused connection", "[connection][handshake]") {
    MachineFixture f;
    f.server->refuse_connections(true);

    auto welcome = run_sync(f.io, f.machine.open());

    REQUIRE_FALSE(welcome.has_value());
    CHECK(welcome.error().code == ClientErrorCode::ConnectFailed);
    CHECK(welcome.error().message.find("Connection refused") != std::string::npos);
    CHECK(f.machine.state() == ConnectionState::Disconnected);
}

TEST_CASE("Frames before the welcome are not dispatched as the handshake", "[connection][handshake]") {
    MachineFixture f;
    f.server->set_auto_welcome(false);

    auto future = start(f.io, f.machine.open());
    drain(f.io);
    f.server->ping(5);
    drain(f.io);
    CHECK(f.machine.state() == ConnectionState::Connecting);

    f.server->send_welcome();
    auto welcome = await_future(f.io, future);
    REQUIRE(welcome.has_value());
    CHECK(f.machine.state() == ConnectionState::Connected);
}

TEST_CASE("close during the handshake aborts it", "[connection][handshake]") {
    MachineFixture f({5000ms, true});
    f.server->set_auto_welcome(false);

    auto future = start(f.io, f.machine.open());
    drain(f.io);
    run_sync(f.io, f.machine.close("Client disconnect"));

    auto welcome = await_future(f.io, future);
    REQUIRE_FALSE(welcome.has_value());
    CHECK(welcome.error().code == ClientErrorCode::Disconnected);
    CHECK(f.machine.state() == ConnectionState::Disconnected);
}

// ═══════════════════════════════════════════════════════════════════════════
// Read loop
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Read loop dispatches frames by kind", "[connection][read]") {
    MachineFixture f;
    REQUIRE(run_sync(f.io, f.machine.open()).has_value());

    f.server->send(Json{{"id", 3}, {"type", "result"}, {"data", 1}});
    f.server->push("sub-1", "users", Json::array());
    f.server->revoke_session("Token expired");
    f.server->send_raw("{oops");
    f.server->send_welcome();
    drain(f.io);

    REQUIRE(f.handler.responses.size() == 1);
    CHECK(f.handler.responses[0].id == 3);
    REQUIRE(f.handler.pushes.size() == 1);
    CHECK(f.handler.pushes[0].channel == "users");
    CHECK(f.handler.revocations == std::vector<std::string>{"Token expired"});
    CHECK(f.handler.protocol_errors.size() == 1);
    CHECK(f.handler.losses.empty());
}

TEST_CASE("Read loop answers pings when heartbeat is on", "[connection][heartbeat]") {
    MachineFixture f;
    REQUIRE(run_sync(f.io, f.machine.open()).has_value());

    f.server->ping(1700000000999);
    drain(f.io);

    auto pongs = f.server->received("pong");
    REQUIRE(pongs.size() == 1);
    CHECK(pongs[0]["timestamp"] == 1700000000999);
}

TEST_CASE("Read loop ignores pings when heartbeat is off", "[connection][heartbeat]") {
    MachineFixture f({200ms, false});
    REQUIRE(run_sync(f.io, f.machine.open()).has_value());

    f.server->ping(1);
    drain(f.io);

    CHECK(f.server->received("pong").empty());
}

TEST_CASE("Peer close reports the loss with its close code", "[connection][read]") {
    MachineFixture f;
    REQUIRE(run_sync(f.io, f.machine.open()).has_value());
    auto handle = f.machine.handle();

    f.server->drop(4002, "Rate limited");
    drain(f.io);

    REQUIRE(f.handler.losses.size() == 1);
    CHECK(f.handler.losses[0].category == TransportError::Category::Closed);
    CHECK(f.handler.losses[0].close_code == 4002);
    CHECK_FALSE(handle.valid());
}

TEST_CASE("Explicit close does not report a loss", "[connection][read]") {
    MachineFixture f;
    REQUIRE(run_sync(f.io, f.machine.open()).has_value());

    run_sync(f.io, f.machine.close("Client disconnect"));
    drain(f.io);

    CHECK(f.machine.state() == ConnectionState::Disconnected);
    CHECK(f.handler.losses.empty());
    CHECK_FALSE(f.server->has_open_connection());
}

TEST_CASE("Each open creates a new generation", "[connection]") {
    MachineFixture f;

    REQUIRE(run_sync(f.io, f.machine.open()).has_value());
    auto first = f.machine.handle();
    CHECK(first.generation() == 1);
    run_sync(f.io, f.machine.close("again"));

    REQUIRE(run_sync(f.io, f.machine.open()).has_value());
    auto second = f.machine.handle();

    CHECK(second.generation() == 2);
    CHECK(first.generation() == 0);
    CHECK_FALSE(first.valid());
    CHECK(second.valid());
    CHECK(f.server->connections() == 2);
}

TEST_CASE("Connection logs carry the generation", "[connection][log]") {
    MachineFixture f;
    ScopedCaptureLogger capture(LogLevel::Info);

    REQUIRE(run_sync(f.io, f.machine.open()).has_value());
    run_sync(f.io, f.machine.close("again"));
    REQUIRE(run_sync(f.io, f.machine.open()).has_value());

    std::vector<std::uint64_t> opened;
    for (const auto& record : capture->records()) {
        if (record.message.find("Opening ws://localhost:8080") == 0) {
            opened.push_back(record.context.connection);
            CHECK(record.context.request == 0);
        }
    }
    CHECK(opened == std::vector<std::uint64_t>{1, 2});
}
