/*
 * File: tests/test_config_feed.cpp
 * Project: Presence Bridge
 * Purpose: Command-line parsing and the stdin producer feed
 * Last updated: 2026-10-19
 */

#include <catch2/catch.hpp>
#include <sstream>
#include <string>
#include <utility>
#include "bridge_config.hpp"
#include "bridge_feed.hpp"

TEST_CASE("bridge arguments")
{
    SECTION("defaults")
    {
        const char *argv[] = {"presence_bridge"};
        auto cfg = parse_bridge_args(1, argv);
        REQUIRE(cfg.host == "127.0.0.1");
        REQUIRE(cfg.port == 1337);
        REQUIRE(nlohmann::json::accept(cfg.welcome));
        REQUIRE_FALSE(cfg.stdin_feed);
        REQUIRE_FALSE(cfg.strict);
        REQUIRE(cfg.log_level == LogLevel::info);
    }

    SECTION("all flags")
    {
        const char *argv[] = {"presence_bridge", "--ws", "0.0.0.0:7000", "--welcome", R"({"hello":1})",
                              "--stdin-feed", "--strict", "--verbose"};
        auto cfg = parse_bridge_args(8, argv);
        REQUIRE(cfg.host == "0.0.0.0");
        REQUIRE(cfg.port == 7000);
        REQUIRE(cfg.welcome == R"({"hello":1})");
        REQUIRE(cfg.stdin_feed);
        REQUIRE(cfg.strict);
        REQUIRE(cfg.log_level == LogLevel::debug);
    }

    SECTION("port override")
    {
        const char *argv[] = {"presence_bridge", "--port", "6463", "--quiet"};
        auto cfg = parse_bridge_args(4, argv);
        REQUIRE(cfg.port == 6463);
        REQUIRE(cfg.log_level == LogLevel::warn);
    }

    SECTION("rejections")
    {
        const char *bad_port[] = {"presence_bridge", "--port", "70000"};
        REQUIRE_THROWS_AS(parse_bridge_args(3, bad_port), std::invalid_argument);
        const char *not_number[] = {"presence_bridge", "--port", "12ab"};
        REQUIRE_THROWS_AS(parse_bridge_args(3, not_number), std::invalid_argument);
        const char *no_host[] = {"presence_bridge", "--ws", "7000"};
        REQUIRE_THROWS_AS(parse_bridge_args(3, no_host), std::invalid_argument);
        const char *bad_json[] = {"presence_bridge", "--welcome", "{nope"};
        REQUIRE_THROWS_AS(parse_bridge_args(3, bad_json), std::invalid_argument);
        const char *missing[] = {"presence_bridge", "--welcome"};
        REQUIRE_THROWS_AS(parse_bridge_args(2, missing), std::invalid_argument);
        const char *unknown[] = {"presence_bridge", "--http", "x"};
        REQUIRE_THROWS_AS(parse_bridge_args(3, unknown), std::invalid_argument);
        const char *no_file[] = {"presence_bridge", "--welcome-file", "/nonexistent/welcome.json"};
        REQUIRE_THROWS_AS(parse_bridge_args(3, no_file), std::invalid_argument);
    }
}

TEST_CASE("host:port splitting")
{
    REQUIRE(split_bind("127.0.0.1:1337") == std::make_pair(std::string("127.0.0.1"), static_cast<unsigned short>(1337)));
    REQUIRE(split_bind("localhost:80").first == "localhost");
    REQUIRE(split_bind("::1:6463") == std::make_pair(std::string("::1"), static_cast<unsigned short>(6463)));
    REQUIRE_THROWS_AS(split_bind(":1337"), std::invalid_argument);
    REQUIRE_THROWS_AS(split_bind("ws://127.0.0.1:1337/"), std::invalid_argument);
    REQUIRE_THROWS_AS(split_bind("127.0.0.1:"), std::invalid_argument);
}

TEST_CASE("feed routes envelopes to their channels")
{
    BridgeChannels channels;
    BridgeFeed feed{channels};

    std::istringstream in(
        R"({"source":"process","event":{"id":"123","name":"Game","pid":42}})"
        "\n"
        "\n"
        R"({"source":"ipc","event":{"cmd":"SET_ACTIVITY","application_id":"a","args":{"pid":1}}})"
        "\n"
        R"({"source":"socket","event":{"cmd":"DISPATCH"}})"
        "\n"
        "not json\n"
        R"({"source":"telepathy","event":{}})"
        "\n"
        R"({"source":"ipc"})"
        "\n"
        R"({"source":"process","event":{"id":"1","pid":"x"}})"
        "\n"
        R"({"source":"process","event":{"id":"1","pid":-1}})"
        "\n");
    feed.run(in);

    REQUIRE(feed.accepted() == 3);
    REQUIRE(feed.rejected() == 5);
    REQUIRE_FALSE(feed.stopped());
    REQUIRE(channels.process.size() == 1);
    REQUIRE(channels.ipc.size() == 1);
    REQUIRE(channels.socket_cmds.size() == 1);

    auto proc = channels.process.pop();
    REQUIRE(proc->id == "123");
    REQUIRE(proc->pid == std::optional<uint64_t>(42));

    auto ipc = channels.ipc.pop();
    REQUIRE(ipc->application_id == "a");
    REQUIRE(ipc->args->pid == std::optional<uint64_t>(1));
    REQUIRE_FALSE(ipc->args->activity);

    REQUIRE(channels.socket_cmds.pop()->cmd == "DISPATCH");
}

TEST_CASE("feed reports closed channels")
{
    BridgeChannels channels;
    channels.close_all();
    BridgeFeed feed{channels};
    REQUIRE_FALSE(feed.feed_line(R"({"source":"process","event":{"id":"null"}})"));
    REQUIRE(feed.rejected() == 1);
    REQUIRE(feed.stopped());
}

TEST_CASE("feed stops reading once the channels close")
{
    BridgeChannels channels;
    channels.close_all();
    BridgeFeed feed{channels};

    std::istringstream in(
        R"({"source":"process","event":{"id":"A"}})"
        "\n"
        R"({"source":"ipc","event":{"cmd":"SET_ACTIVITY"}})"
        "\n"
        "left for later\n");
    feed.run(in);

    REQUIRE(feed.stopped());
    REQUIRE(feed.accepted() == 0);
    REQUIRE(feed.rejected() == 1);

    std::string rest;
    std::getline(in, rest);
    REQUIRE(rest == R"({"source":"ipc","event":{"cmd":"SET_ACTIVITY"}})");
}
