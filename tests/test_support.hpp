/*
 * File: tests/test_support.hpp
 * Project: Presence Bridge
 * Purpose: Test doubles shared by the connector tests
 * Last updated: 2026-10-19
 */

#pragma once
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "bridge_state.hpp"

// Records every frame; fail=true simulates a client that went away.
struct RecordingSink : ClientSink
{
    std::mutex m;
    std::vector<std::string> frames;
    std::vector<bool> binary_flags;
    int attempts = 0;
    bool fail = false;

    bool send(const std::string &data, bool binary) override
    {
        std::scoped_lock lk(m);
        ++attempts;
        if (fail)
            return false;
        frames.push_back(data);
        binary_flags.push_back(binary);
        return true;
    }

    std::vector<nlohmann::json> json_frames()
    {
        std::scoped_lock lk(m);
        std::vector<nlohmann::json> out;
        for (const auto &f : frames)
            out.push_back(nlohmann::json::parse(f));
        return out;
    }
};

inline std::shared_ptr<RecordingSink> add_client(BridgeState &state, ClientId id)
{
    auto sink = std::make_shared<RecordingSink>();
    state.clients.insert(id, sink);
    return sink;
}
