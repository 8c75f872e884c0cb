/*
 * File: tests/test_gateway_ws.cpp
 * Project: Channel Watch
 * Purpose: Beast gateway transport against a loopback websocket server
 * Last updated: 2026-10-19
 */

#include <catch2/catch_all.hpp>
#include <nlohmann/json.hpp>

#include "loopback_servers.hpp"
#include "watch_fakes.hpp"
#include "watch_gateway.hpp"
#include "watch_ws.hpp"

using namespace std::chrono_literals;
using nlohmann::json;

TEST_CASE("session over a real websocket identifies and reconciles", "[gateway][ws]")
{
    FakeGatewayServer server{{channel_update("999", "elsewhere", 1), channel_update("123", "open-now", 2)}};

    RecordingAlertBackend backend;
    AlertController alerts{backend, "boom.mp3", quick_alerts()};
    WatchState state{"123"};
    state.names.set(std::string("closed"));

    BeastGatewayConnector connector{server.url(), 2000ms};
    GatewayClient client{connector, "tok-xyz", state, alerts, GatewayTiming{5ms, 0}};

    REQUIRE(client.run_session() == SessionEnd::Closed);
    server.join();
    REQUIRE(server.error().empty());

    auto ident = json::parse(server.identify());
    REQUIRE(ident["op"] == 2);
    REQUIRE(ident["d"]["token"] == "tok-xyz");
    REQUIRE(server.user_agent() == browser_user_agent());

    REQUIRE(state.names.get() == std::optional<std::string>("open-now"));
    REQUIRE(state.stats.ws_events.load() == 1);
    REQUIRE(state.stats.ws_detections.load() == 1);
    REQUIRE(alerts.triggered() == 1);
    REQUIRE(client.heartbeat_interval() == 60000ms);
    alerts.stop();
}

TEST_CASE("unreachable gateway ends the attempt as a connect failure", "[gateway][ws]")
{
    unsigned short dead_port = 0;
    {
        boost::asio::io_context ioc;
        boost::asio::ip::tcp::acceptor reserved{ioc, {boost::asio::ip::make_address("127.0.0.1"), 0}};
        dead_port = reserved.local_endpoint().port();
    }
    RecordingAlertBackend backend;
    AlertController alerts{backend, "boom.mp3", quick_alerts()};
    WatchState state{"123"};
    BeastGatewayConnector connector{"ws://127.0.0.1:" + std::to_string(dead_port) + "/?v=9&encoding=json", 500ms};
    GatewayClient client{connector, "tok", state, alerts, GatewayTiming{5ms, 0}};

    REQUIRE(client.run_session() == SessionEnd::ConnectFailed);
    REQUIRE_FALSE(state.names.get().has_value());
}

TEST_CASE("gateway url must be a websocket url", "[gateway][ws]")
{
    REQUIRE_THROWS_AS(BeastGatewayConnector{"https://gateway.example"}, ConfigError);
    REQUIRE_THROWS_AS(BeastGatewayConnector{"nonsense"}, ConfigError);
}
