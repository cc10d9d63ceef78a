/*
 * File: src/bridge_config.hpp
 * Project: Presence Bridge
 * Purpose: Command-line configuration
 * Notes:
 *  - See SPEC_FULL.md and DESIGN.md
 *  - Welcome payloads must be valid JSON; they are sent verbatim
 * Last updated: 2026-10-19
 */

#pragma once
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <nlohmann/json.hpp>
#include "common/log.hpp"

struct BridgeConfig
{
    std::string host = "127.0.0.1";
    unsigned short port = 1337;
    std::string welcome = R"({"cmd":"DISPATCH","data":{},"evt":"READY"})";
    bool stdin_feed = false;
    bool strict = false;
    LogLevel log_level = LogLevel::info;
};

inline const char *bridge_usage()
{
    return "usage: presence_bridge [--ws host:port] [--port N] [--welcome JSON | --welcome-file PATH]\n"
           "                       [--stdin-feed] [--strict] [--verbose | --quiet]\n";
}

inline unsigned short parse_port(const std::string &s)
{
    std::size_t used = 0;
    unsigned long v = 0;
    try
    {
        v = std::stoul(s, &used);
    }
    catch (const std::exception &)
    {
        throw std::invalid_argument("invalid port: " + s);
    }
    if (used != s.size() || v == 0 || v > 65535)
        throw std::invalid_argument("invalid port: " + s);
    return static_cast<unsigned short>(v);
}

// host:port
inline std::pair<std::string, unsigned short> split_bind(const std::string &s)
{
    auto p = s.rfind(':');
    if (p == std::string::npos || p == 0)
        throw std::invalid_argument("expected host:port, got: " + s);
    return {s.substr(0, p), parse_port(s.substr(p + 1))};
}

inline std::string checked_welcome(std::string payload)
{
    if (!nlohmann::json::accept(payload))
        throw std::invalid_argument("welcome payload is not valid JSON");
    return payload;
}

// Throws std::invalid_argument on unknown flags or bad values.
inline BridgeConfig parse_bridge_args(int argc, const char *const *argv)
{
    BridgeConfig cfg;
    auto need = [&](int &i, const std::string &flag) -> std::string
    {
        if (i + 1 >= argc)
            throw std::invalid_argument(flag + " needs a value");
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--ws")
        {
            auto [host, port] = split_bind(need(i, a));
            cfg.host = host;
            cfg.port = port;
        }
        else if (a == "--port")
            cfg.port = parse_port(need(i, a));
        else if (a == "--welcome")
            cfg.welcome = checked_welcome(need(i, a));
        else if (a == "--welcome-file")
        {
            std::string path = need(i, a);
            std::ifstream f(path);
            if (!f)
                throw std::invalid_argument("cannot open welcome file: " + path);
            std::ostringstream ss;
            ss << f.rdbuf();
            cfg.welcome = checked_welcome(ss.str());
        }
        else if (a == "--stdin-feed")
            cfg.stdin_feed = true;
        else if (a == "--strict")
            cfg.strict = true;
        else if (a == "--verbose")
            cfg.log_level = LogLevel::debug;
        else if (a == "--quiet")
            cfg.log_level = LogLevel::warn;
        else
            throw std::invalid_argument("unknown argument: " + a);
    }
    return cfg;
}
