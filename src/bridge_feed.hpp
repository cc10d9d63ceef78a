/*
 * File: src/bridge_feed.hpp
 * Project: Presence Bridge
 * Purpose: Line-oriented JSON producer feed for embedding processes
 * Notes:
 *  - See SPEC_FULL.md and DESIGN.md
 *  - One envelope per line: {"source":"ipc"|"process"|"socket","event":{...}}
 *  - Bad lines are logged and skipped; a closed channel ends the feed without logging
 * Last updated: 2026-10-19
 */

#pragma once
#include <istream>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>
#include "common/activity.hpp"
#include "common/log.hpp"
#include "bridge_connector.hpp"

class BridgeFeed
{
    BridgeChannels &channels_;
    std::size_t accepted_ = 0;
    std::size_t rejected_ = 0;
    bool stopped_ = false;

public:
    explicit BridgeFeed(BridgeChannels &channels) : channels_(channels) {}

    // Returns true when the line was routed to a channel.
    bool feed_line(const std::string &line)
    {
        if (line.find_first_not_of(" \t\r") == std::string::npos)
            return false;

        auto j = nlohmann::json::parse(line, nullptr, false);
        if (j.is_discarded() || !j.is_object())
            return reject("not a JSON object");

        const std::string source = j.value("source", std::string());
        auto ev = j.find("event");
        if (ev == j.end() || !ev->is_object())
            return reject("missing event object");

        bool pushed = false;
        try
        {
            if (source == "ipc")
                pushed = channels_.ipc.push(activity_cmd_from_json(*ev));
            else if (source == "process")
                pushed = channels_.process.push(process_event_from_json(*ev));
            else if (source == "socket")
                pushed = channels_.socket_cmds.push(activity_cmd_from_json(*ev));
            else
                return reject("unknown source '" + source + "'");
        }
        catch (const nlohmann::json::exception &e)
        {
            return reject(e.what());
        }
        catch (const std::invalid_argument &e)
        {
            return reject(e.what());
        }

        if (!pushed)
        {
            // Shutdown: stay silent, the process may already be tearing down.
            stopped_ = true;
            ++rejected_;
            return false;
        }
        ++accepted_;
        return true;
    }

    // Reads until end of stream, or until a channel has been closed.
    void run(std::istream &in)
    {
        std::string line;
        while (!stopped_ && std::getline(in, line))
            feed_line(line);
        if (stopped_)
            return;
        log_line(LogLevel::info, "feed", "input ended (" + std::to_string(accepted_) + " routed, " +
                                             std::to_string(rejected_) + " rejected)");
    }

    std::size_t accepted() const { return accepted_; }
    std::size_t rejected() const { return rejected_; }
    bool stopped() const { return stopped_; }

private:
    bool reject(const std::string &why)
    {
        ++rejected_;
        log_line(LogLevel::warn, "feed", "skipping line: " + why);
        return false;
    }
};
