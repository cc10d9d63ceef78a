/*
 * File: include/common/activity.hpp
 * Project: Presence Bridge
 * Purpose: Producer event types, their JSON forms, and command normalization
 * Notes:
 *  - See SPEC_FULL.md and DESIGN.md
 *  - Keys are emitted through nlohmann::json objects, so dumps are key-sorted
 * Last updated: 2026-10-19
 */

#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>
#include <nlohmann/json.hpp>

inline constexpr const char *kSetActivityCmd = "SET_ACTIVITY";
inline constexpr const char *kNoProcessId = "null";

struct ActivityTimestamps
{
    std::optional<int64_t> start;
    std::optional<int64_t> end;
};

struct ActivityAssets
{
    std::optional<std::string> large_image;
    std::optional<std::string> large_text;
    std::optional<std::string> small_image;
    std::optional<std::string> small_text;
};

struct ActivityButton
{
    std::string label;
    std::string url;
};

struct Activity
{
    std::string application_id;
    std::optional<std::string> name;
    int type{0};
    std::optional<std::string> details;
    std::optional<std::string> state;
    std::optional<ActivityTimestamps> timestamps;
    std::optional<ActivityAssets> assets;
    std::vector<std::string> buttons;         // labels only, the form clients render
    std::vector<ActivityButton> raw_buttons;  // {label,url} pairs until normalized
    std::optional<bool> instance;
    std::vector<std::string> button_urls;     // emitted as metadata.button_urls
    int flags{0};
};

struct ActivityArgs
{
    std::optional<Activity> activity;
    std::optional<uint64_t> pid;
};

// Command from the IPC source or the socket control channel.
struct ActivityCmd
{
    std::string cmd;
    std::optional<ActivityArgs> args;
    std::string application_id;
    std::optional<std::string> nonce;
};

// Report from the process watcher. id == "null" means nothing is running.
struct ProcessDetectedEvent
{
    std::string id;
    std::string name;
    std::optional<std::string> timestamp;
    std::optional<uint64_t> pid;
};

// -------- json helpers --------

namespace activity_json_detail
{
    // Unsigned fields reject negative and fractional numbers instead of wrapping them.
    template <typename T>
    std::optional<T> opt(const nlohmann::json &j, const char *key)
    {
        auto it = j.find(key);
        if (it == j.end() || it->is_null())
            return std::nullopt;
        if constexpr (std::is_unsigned_v<T>)
        {
            if (it->is_number() && !it->is_number_unsigned())
                throw std::invalid_argument(std::string(key) + " must be a non-negative integer");
        }
        return it->get<T>();
    }

    template <typename T>
    void put(nlohmann::json &j, const char *key, const std::optional<T> &v)
    {
        if (v)
            j[key] = *v;
    }
}

inline nlohmann::json activity_to_json(const Activity &a)
{
    using nlohmann::json;
    using activity_json_detail::put;

    json j{{"application_id", a.application_id}, {"type", a.type}, {"flags", a.flags}};
    put(j, "name", a.name);
    put(j, "details", a.details);
    put(j, "state", a.state);
    if (a.timestamps)
    {
        json ts = json::object();
        put(ts, "start", a.timestamps->start);
        put(ts, "end", a.timestamps->end);
        j["timestamps"] = ts;
    }
    if (a.assets)
    {
        json as = json::object();
        put(as, "large_image", a.assets->large_image);
        put(as, "large_text", a.assets->large_text);
        put(as, "small_image", a.assets->small_image);
        put(as, "small_text", a.assets->small_text);
        j["assets"] = as;
    }
    if (!a.raw_buttons.empty())
    {
        json arr = json::array();
        for (const auto &b : a.raw_buttons)
            arr.push_back(json{{"label", b.label}, {"url", b.url}});
        j["buttons"] = arr;
    }
    else if (!a.buttons.empty())
    {
        j["buttons"] = a.buttons;
    }
    put(j, "instance", a.instance);
    json meta = json::object();
    if (!a.button_urls.empty())
        meta["button_urls"] = a.button_urls;
    j["metadata"] = meta;
    return j;
}

inline Activity activity_from_json(const nlohmann::json &j)
{
    using activity_json_detail::opt;

    Activity a;
    a.application_id = j.value("application_id", std::string());
    a.name = opt<std::string>(j, "name");
    a.type = j.value("type", 0);
    a.details = opt<std::string>(j, "details");
    a.state = opt<std::string>(j, "state");
    if (auto it = j.find("timestamps"); it != j.end() && it->is_object())
    {
        ActivityTimestamps ts;
        ts.start = opt<int64_t>(*it, "start");
        ts.end = opt<int64_t>(*it, "end");
        a.timestamps = ts;
    }
    if (auto it = j.find("assets"); it != j.end() && it->is_object())
    {
        ActivityAssets as;
        as.large_image = opt<std::string>(*it, "large_image");
        as.large_text = opt<std::string>(*it, "large_text");
        as.small_image = opt<std::string>(*it, "small_image");
        as.small_text = opt<std::string>(*it, "small_text");
        a.assets = as;
    }
    if (auto it = j.find("buttons"); it != j.end() && it->is_array())
    {
        for (const auto &b : *it)
        {
            if (b.is_object())
                a.raw_buttons.push_back({b.value("label", std::string()), b.value("url", std::string())});
            else
                a.buttons.push_back(b.get<std::string>());
        }
    }
    a.instance = opt<bool>(j, "instance");
    if (auto it = j.find("metadata"); it != j.end() && it->is_object())
        a.button_urls = it->value("button_urls", std::vector<std::string>{});
    a.flags = j.value("flags", 0);
    return a;
}

inline nlohmann::json activity_cmd_to_json(const ActivityCmd &c)
{
    using nlohmann::json;

    json j{{"cmd", c.cmd}, {"application_id", c.application_id}};
    if (c.args)
    {
        json args = json::object();
        args["activity"] = c.args->activity ? activity_to_json(*c.args->activity) : json(nullptr);
        activity_json_detail::put(args, "pid", c.args->pid);
        j["args"] = args;
    }
    activity_json_detail::put(j, "nonce", c.nonce);
    return j;
}

// Throws nlohmann::json::exception on type mismatches, std::invalid_argument on negative ids.
inline ActivityCmd activity_cmd_from_json(const nlohmann::json &j)
{
    using activity_json_detail::opt;

    ActivityCmd c;
    c.cmd = j.value("cmd", std::string());
    c.application_id = j.value("application_id", std::string());
    c.nonce = opt<std::string>(j, "nonce");
    if (auto it = j.find("args"); it != j.end() && it->is_object())
    {
        ActivityArgs args;
        if (auto ait = it->find("activity"); ait != it->end() && ait->is_object())
            args.activity = activity_from_json(*ait);
        args.pid = opt<uint64_t>(*it, "pid");
        c.args = args;
    }
    return c;
}

inline ProcessDetectedEvent process_event_from_json(const nlohmann::json &j)
{
    ProcessDetectedEvent e;
    e.id = j.value("id", std::string(kNoProcessId));
    e.name = j.value("name", std::string());
    if (auto it = j.find("timestamp"); it != j.end() && !it->is_null())
        e.timestamp = it->is_string() ? it->get<std::string>() : it->dump();
    e.pid = activity_json_detail::opt<uint64_t>(j, "pid");
    return e;
}

// -------- normalization --------

// Fills defaults on a command before dispatch:
//  - raw {label,url} buttons: labels -> buttons, urls -> metadata.button_urls
//  - timestamps in [0, 10^12) are seconds and become milliseconds; others are kept
//  - flags = 1 when instance is true, 0 otherwise
// Commands without an activity are left untouched.
inline void normalize_activity_cmd(ActivityCmd &cmd)
{
    if (!cmd.args || !cmd.args->activity)
        return;
    Activity &a = *cmd.args->activity;

    if (!a.raw_buttons.empty())
    {
        a.buttons.clear();
        a.button_urls.clear();
        for (auto &b : a.raw_buttons)
        {
            a.buttons.push_back(std::move(b.label));
            a.button_urls.push_back(std::move(b.url));
        }
        a.raw_buttons.clear();
    }

    if (a.timestamps)
    {
        constexpr int64_t kMillisThreshold = 1000000000000LL;
        for (auto *ts : {&a.timestamps->start, &a.timestamps->end})
        {
            if (*ts && **ts >= 0 && **ts < kMillisThreshold)
                **ts *= 1000;
        }
    }

    a.flags = a.instance.value_or(false) ? 1 : 0;
}
