/*
 * File: clients/presence_watch/presence_watch_main.cpp
 * Project: Presence Bridge
 * Purpose: Example WebSocket consumer: prints every presence frame it receives
 * Notes:
 *  - See SPEC_FULL.md and DESIGN.md
 *  - First frame is the bridge's welcome payload
 *  - Usage: presence_watch [--ws host:port] [--target /] [--pretty]
 * Last updated: 2026-10-19
 */

#include <iostream>
#include <stdexcept>
#include <string>
#include <tuple>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <nlohmann/json.hpp>
#include "bridge_config.hpp"

using json = nlohmann::json;
namespace websocket = boost::beast::websocket;

int main(int argc, char **argv)
{
    try
    {
        std::string host = "127.0.0.1";
        unsigned short port = 1337;
        std::string target = "/";
        bool pretty = false;
        for (int i = 1; i < argc; ++i)
        {
            std::string a = argv[i];
            if (a == "--ws" && i + 1 < argc)
                std::tie(host, port) = split_bind(argv[++i]);
            else if (a == "--target" && i + 1 < argc)
                target = argv[++i];
            else if (a == "--pretty")
                pretty = true;
            else
                throw std::invalid_argument("unknown argument: " + a);
        }

        boost::asio::io_context ioc;
        boost::asio::ip::tcp::resolver res{ioc};
        auto const results = res.resolve(host, std::to_string(port));
        boost::asio::ip::tcp::socket sock{ioc};
        boost::asio::connect(sock, results.begin(), results.end());
        websocket::stream<boost::asio::ip::tcp::socket> ws{std::move(sock)};
        ws.handshake(host, target);
        std::cerr << "presence_watch: connected to ws://" << host << ":" << port << target << "\n";

        boost::beast::flat_buffer buf;
        while (true)
        {
            ws.read(buf);
            auto s = boost::beast::buffers_to_string(buf.data());
            buf.consume(buf.size());
            auto j = json::parse(s, nullptr, false);
            if (j.is_discarded())
                std::cout << "raw: " << s << std::endl;
            else if (pretty)
                std::cout << j.dump(2) << std::endl;
            else
                std::cout << j.dump() << std::endl;
        }
    }
    catch (const boost::system::system_error &e)
    {
        if (e.code() == websocket::error::closed)
            return 0;
        std::cerr << "presence_watch error: " << e.what() << "\n";
        return 1;
    }
    catch (const std::exception &e)
    {
        std::cerr << "presence_watch error: " << e.what() << "\n";
        return 1;
    }
}
