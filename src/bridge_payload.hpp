/*
 * File: src/bridge_payload.hpp
 * Project: Presence Bridge
 * Purpose: Outbound presence payloads ({activity, pid, socketId})
 * Notes:
 *  - See SPEC_FULL.md and DESIGN.md
 *  - Every broadcast is one of these two shapes; no partial updates
 * Last updated: 2026-10-19
 */

#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "common/activity.hpp"

// "Nothing is active" for the given pid/socket.
inline std::string empty_activity_payload(uint64_t pid, const std::string &socket_id)
{
    return nlohmann::json{{"activity", nullptr}, {"pid", pid}, {"socketId", socket_id}}.dump();
}

// Command activity. pid stays null when the producer gave none; socketId falls back to "0".
// Throws nlohmann::json::exception if the activity holds invalid UTF-8.
inline std::string command_activity_payload(const Activity &activity, std::optional<uint64_t> pid)
{
    nlohmann::json j{
        {"activity", activity_to_json(activity)},
        {"pid", pid ? nlohmann::json(*pid) : nlohmann::json(nullptr)},
        {"socketId", std::to_string(pid.value_or(0))}};
    return j.dump();
}

// Activity announced for a detected process; the session id doubles as application id and socket.
inline std::string process_activity_payload(const ProcessDetectedEvent &ev)
{
    using nlohmann::json;
    json activity{
        {"application_id", ev.id},
        {"name", ev.name},
        {"timestamps", {{"start", ev.timestamp.value_or("0")}}},
        {"type", 0},
        {"metadata", json::object()},
        {"flags", 0}};
    return json{{"activity", activity}, {"pid", ev.pid.value_or(0)}, {"socketId", ev.id}}.dump();
}
