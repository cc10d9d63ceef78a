/*
 * File: src/bridge_connector.hpp
 * Project: Presence Bridge
 * Purpose: Dispatch loops: client lifecycle plus the three producer channels, fanned out to clients
 * Notes:
 *  - See SPEC_FULL.md and DESIGN.md
 *  - One thread per channel; per-channel FIFO, no ordering across channels
 *  - Broadcast is best effort: a failed send is logged and never retried
 * Last updated: 2026-10-19
 */

#pragma once
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/activity.hpp"
#include "common/channel.hpp"
#include "common/log.hpp"
#include "bridge_payload.hpp"
#include "bridge_state.hpp"

struct BridgeChannels
{
    Channel<TransportEvent> transport;
    Channel<ActivityCmd> ipc;
    Channel<ProcessDetectedEvent> process;
    Channel<ActivityCmd> socket_cmds;

    void close_all()
    {
        transport.close();
        ipc.close();
        process.close();
        socket_cmds.close();
    }
};

class Connector
{
    BridgeState &state_;
    BridgeChannels &channels_;
    std::vector<std::thread> threads_;

public:
    Connector(BridgeState &state, BridgeChannels &channels)
        : state_(state), channels_(channels) {}

    Connector(const Connector &) = delete;
    Connector &operator=(const Connector &) = delete;

    ~Connector()
    {
        channels_.close_all();
        join();
    }

    void start()
    {
        threads_.emplace_back([this]
                              { run_loop(channels_.transport, "transport", [this](TransportEvent ev)
                                         { handle_transport(ev); }); });
        threads_.emplace_back([this]
                              { run_loop(channels_.ipc, "ipc", [this](ActivityCmd cmd)
                                         { handle_ipc(std::move(cmd)); }); });
        threads_.emplace_back([this]
                              { run_loop(channels_.process, "process", [this](ProcessDetectedEvent ev)
                                         { handle_process(ev); }); });
        threads_.emplace_back([this]
                              { run_loop(channels_.socket_cmds, "socket", [this](ActivityCmd cmd)
                                         { handle_socket_command(std::move(cmd)); }); });
    }

    // Returns once every channel has been closed and drained.
    void join()
    {
        for (auto &t : threads_)
        {
            if (t.joinable())
                t.join();
        }
        threads_.clear();
    }

    void handle_transport(const TransportEvent &ev)
    {
        switch (ev.kind)
        {
        case TransportEvent::Kind::connected:
            log_line(LogLevel::info, "connector", "client " + std::to_string(ev.id) + " connected");
            if (!ev.sink->send(state_.welcome, false))
                log_line(LogLevel::warn, "connector", "welcome to client " + std::to_string(ev.id) + " failed");
            state_.clients.insert(ev.id, ev.sink);
            break;

        case TransportEvent::Kind::disconnected:
            state_.clients.remove(ev.id);
            log_line(LogLevel::info, "connector", "client " + std::to_string(ev.id) + " disconnected");
            break;

        case TransportEvent::Kind::message:
        {
            log_line(LogLevel::debug, "connector", "message from client " + std::to_string(ev.id) + ": " + ev.data);
            auto sink = state_.clients.find(ev.id);
            if (!sink)
            {
                std::string what = "message from unregistered client " + std::to_string(ev.id);
                if (state_.strict)
                    throw InvariantViolation(what);
                log_line(LogLevel::error, "connector", what + ", dropped");
                return;
            }
            if (!sink->send(ev.data, ev.binary))
                log_line(LogLevel::warn, "connector", "echo to client " + std::to_string(ev.id) + " failed");
            break;
        }
        }
    }

    void handle_ipc(ActivityCmd cmd)
    {
        if (no_audience())
            return;
        dispatch_command(std::move(cmd), "IPC");
    }

    void handle_process(const ProcessDetectedEvent &ev)
    {
        if (no_audience())
            return;

        PresenceTransition t;
        try
        {
            t = state_.presence.advance(ev, process_activity_payload);
        }
        catch (const nlohmann::json::exception &e)
        {
            log_line(LogLevel::error, "connector", std::string("error serializing process activity: ") + e.what());
            return;
        }

        if (t.closed)
        {
            log_line(LogLevel::info, "connector", "clearing activity for session " + t.closed->session);
            broadcast(empty_activity_payload(t.closed->pid, t.closed->session));
        }
        if (!t.announce)
        {
            if (ev.id != kNoProcessId)
                log_line(LogLevel::debug, "connector", "already announced activity: " + ev.name);
            return;
        }

        log_line(LogLevel::info, "connector", "sending payload for activity: " + ev.name);
        broadcast(t.payload);
    }

    void handle_socket_command(ActivityCmd cmd)
    {
        if (no_audience())
            return;

        if (cmd.cmd != kSetActivityCmd)
        {
            std::string payload;
            try
            {
                payload = activity_cmd_to_json(cmd).dump();
            }
            catch (const nlohmann::json::exception &e)
            {
                log_line(LogLevel::error, "connector", std::string("error serializing socket command: ") + e.what());
                return;
            }
            log_line(LogLevel::debug, "connector", "forwarding socket command " + cmd.cmd);
            broadcast(payload);
            return;
        }
        dispatch_command(std::move(cmd), "socket");
    }

    // Sends the same bytes to every registered client. Returns the number of successful sends.
    std::size_t broadcast(const std::string &payload)
    {
        std::size_t delivered = 0;
        for (auto &[id, sink] : state_.clients.snapshot())
        {
            if (sink->send(payload, false))
                ++delivered;
            else
                log_line(LogLevel::warn, "connector", "send to client " + std::to_string(id) + " failed");
        }
        return delivered;
    }

private:
    bool no_audience() const
    {
        if (!state_.clients.empty())
            return false;
        log_line(LogLevel::debug, "connector", "no clients connected, skipping");
        return true;
    }

    // Shared by IPC commands and SET_ACTIVITY socket commands; no dedup state.
    void dispatch_command(ActivityCmd cmd, const char *source)
    {
        normalize_activity_cmd(cmd);

        if (!cmd.args)
        {
            log_line(LogLevel::warn, "connector", std::string("invalid ") + source + " activity command, skipping");
            return;
        }
        ActivityArgs &args = *cmd.args;

        if (!args.activity)
        {
            const uint64_t pid = args.pid.value_or(0);
            log_line(LogLevel::info, "connector", std::string("sending empty payload for ") + source + " pid " + std::to_string(pid));
            broadcast(empty_activity_payload(pid, std::to_string(pid)));
            return;
        }

        args.activity->application_id = cmd.application_id;
        std::string payload;
        try
        {
            payload = command_activity_payload(*args.activity, args.pid);
        }
        catch (const nlohmann::json::exception &e)
        {
            log_line(LogLevel::error, "connector", std::string("error serializing ") + source + " activity: " + e.what());
            return;
        }
        log_line(LogLevel::debug, "connector", std::string("sending payload for ") + source + " activity: " + payload);
        broadcast(payload);
    }

    template <typename T, typename Handler>
    void run_loop(Channel<T> &channel, const char *name, Handler handle)
    {
        while (auto item = channel.pop())
        {
            try
            {
                handle(std::move(*item));
            }
            catch (const InvariantViolation &)
            {
                throw; // strict mode: ends the process
            }
            catch (const std::exception &e)
            {
                log_line(LogLevel::error, "connector", std::string(name) + " event failed: " + e.what());
            }
        }
        log_line(LogLevel::debug, "connector", std::string(name) + " receiver closed");
    }
};
