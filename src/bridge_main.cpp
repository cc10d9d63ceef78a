/*
 * File: src/bridge_main.cpp
 * Project: Presence Bridge
 * Purpose: Main server binary: WebSocket presence broadcast, four dispatch loops
 * Notes:
 *  - See SPEC_FULL.md and DESIGN.md
 *  - Bind failure is fatal (exit 1); bad arguments exit 2
 * Last updated: 2026-10-19
 */

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <thread>
#include <boost/asio.hpp>
#include "common/log.hpp"
#include "bridge_config.hpp"
#include "bridge_connector.hpp"
#include "bridge_feed.hpp"
#include "bridge_state.hpp"
#include "bridge_ws.hpp"

int main(int argc, char **argv)
{
    BridgeConfig cfg;
    try
    {
        cfg = parse_bridge_args(argc, argv);
    }
    catch (const std::invalid_argument &e)
    {
        std::cerr << "presence_bridge: " << e.what() << "\n"
                  << bridge_usage();
        return 2;
    }
    set_log_level(cfg.log_level);

    boost::asio::io_context ioc{1};
    BridgeState state;
    state.welcome = cfg.welcome;
    state.strict = cfg.strict;
    auto channels = std::make_shared<BridgeChannels>();

    std::unique_ptr<WsServer> ws;
    try
    {
        boost::asio::ip::tcp::endpoint ep{boost::asio::ip::make_address(cfg.host), cfg.port};
        ws = std::make_unique<WsServer>(ioc, ep, channels->transport);
    }
    catch (const std::exception &e)
    {
        log_line(LogLevel::error, "bridge", std::string("failed to launch websocket server: ") + e.what());
        return 1;
    }

    Connector connector{state, *channels};
    connector.start();

    if (cfg.stdin_feed)
    {
        // Detached: std::getline cannot be interrupted. The thread shares ownership of the channels.
        std::thread([channels]
                    { BridgeFeed feed{*channels}; feed.run(std::cin); })
            .detach();
    }

    boost::asio::signal_set signals{ioc, SIGINT, SIGTERM};
    signals.async_wait([&](boost::system::error_code ec, int sig)
                       {
if (ec) return;
log_line(LogLevel::info, "bridge", "signal " + std::to_string(sig) + ", shutting down");
ws->close();
ioc.stop(); });

    std::cout << "presence_bridge listening ws=" << cfg.host << ":" << ws->port()
              << (cfg.stdin_feed ? " feed=stdin" : "") << "\n"
              << std::flush;

    ioc.run();

    channels->close_all();
    connector.join();

    if (cfg.stdin_feed)
    {
        // The feed thread may still be blocked in std::getline; skip static destructors under it.
        std::cout << std::flush;
        std::quick_exit(0);
    }
    return 0;
}
