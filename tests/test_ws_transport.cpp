/*
 * File: tests/test_ws_transport.cpp
 * Project: Presence Bridge
 * Purpose: Loopback WebSocket session against a live listener
 * Last updated: 2026-10-19
 */

#include <catch2/catch.hpp>
#include <chrono>
#include <functional>
#include <thread>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include "bridge_connector.hpp"
#include "bridge_ws.hpp"

using nlohmann::json;
using boost::asio::ip::tcp;

static bool wait_until(const std::function<bool()> &done)
{
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (done())
            return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return done();
}

TEST_CASE("websocket session lifecycle")
{
    boost::asio::io_context ioc{1};
    BridgeState state;
    state.welcome = R"({"evt":"READY"})";
    BridgeChannels channels;
    WsServer server{ioc, tcp::endpoint{boost::asio::ip::make_address("127.0.0.1"), 0}, channels.transport};
    Connector connector{state, channels};
    connector.start();
    std::thread io([&]
                   { ioc.run(); });

    boost::asio::io_context cli;
    tcp::socket sock{cli};
    sock.connect(tcp::endpoint{boost::asio::ip::make_address("127.0.0.1"), server.port()});
    websocket::stream<tcp::socket> ws{std::move(sock)};
    ws.handshake("127.0.0.1", "/");

    boost::beast::flat_buffer buf;
    auto read_frame = [&]
    {
        ws.read(buf);
        auto s = boost::beast::buffers_to_string(buf.data());
        buf.consume(buf.size());
        return s;
    };

    REQUIRE(read_frame() == state.welcome);
    REQUIRE(wait_until([&]
                       { return state.clients.size() == 1; }));

    ws.text(true);
    ws.write(boost::asio::buffer(std::string("ping")));
    REQUIRE(read_frame() == "ping");

    channels.process.push(ProcessDetectedEvent{"123", "Game", std::nullopt, 42});
    REQUIRE(json::parse(read_frame()) ==
            json::parse(R"({"activity":{"application_id":"123","name":"Game","timestamps":{"start":"0"},"type":0,"metadata":{},"flags":0},"pid":42,"socketId":"123"})"));

    ws.close(websocket::close_code::normal);
    REQUIRE(wait_until([&]
                       { return state.clients.empty(); }));

    ioc.stop();
    io.join();
    channels.close_all();
    connector.join();
}

TEST_CASE("binding a taken port fails")
{
    boost::asio::io_context ioc{1};
    Channel<TransportEvent> events;
    WsServer first{ioc, tcp::endpoint{boost::asio::ip::make_address("127.0.0.1"), 0}, events};
    tcp::endpoint taken{boost::asio::ip::make_address("127.0.0.1"), first.port()};

    // SO_REUSEADDR does not allow a second bind over an active listener.
    REQUIRE_THROWS_AS((WsServer{ioc, taken, events}), std::runtime_error);
}

TEST_CASE("outbox caps queued frames")
{
    Outbox box{2};
    REQUIRE(box.push("one", false));
    REQUIRE(box.push("two", true));
    REQUIRE_FALSE(box.push("three", false));
    REQUIRE(box.size() == 2);
    REQUIRE(box.dropped() == 1);

    REQUIRE(box.front().first == "one");
    box.pop();
    REQUIRE(box.push("four", false));
    REQUIRE(box.front().first == "two");
    REQUIRE(box.front().second);
    REQUIRE(box.dropped() == 1);

    box.clear();
    REQUIRE(box.empty());
    REQUIRE(Outbox{}.push("x", false));
}
