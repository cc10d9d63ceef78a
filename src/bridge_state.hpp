/*
 * File: src/bridge_state.hpp
 * Project: Presence Bridge
 * Purpose: Client registry and presence state shared by the dispatch loops
 * Notes:
 *  - See SPEC_FULL.md and DESIGN.md
 *  - Registry and presence are guarded by separate mutexes
 *  - No socket I/O happens under either lock
 * Last updated: 2026-10-19
 */

#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include "common/activity.hpp"

// Outbound half of a connection. send() never throws; false means the peer is gone.
struct ClientSink
{
    virtual ~ClientSink() = default;
    virtual bool send(const std::string &data, bool binary) = 0;
};

using ClientId = uint64_t;

// What the transport listener reports to the connector.
struct TransportEvent
{
    enum class Kind
    {
        connected,
        disconnected,
        message
    };
    Kind kind;
    ClientId id;
    std::shared_ptr<ClientSink> sink; // connected only
    std::string data;                 // message only
    bool binary = false;
};

class ClientRegistry
{
    mutable std::mutex m_;
    std::map<ClientId, std::shared_ptr<ClientSink>> clients_;

public:
    void insert(ClientId id, std::shared_ptr<ClientSink> sink)
    {
        std::scoped_lock lk(m_);
        clients_[id] = std::move(sink);
    }

    bool remove(ClientId id)
    {
        std::scoped_lock lk(m_);
        return clients_.erase(id) > 0;
    }

    std::shared_ptr<ClientSink> find(ClientId id) const
    {
        std::scoped_lock lk(m_);
        auto it = clients_.find(id);
        return it == clients_.end() ? nullptr : it->second;
    }

    bool empty() const
    {
        std::scoped_lock lk(m_);
        return clients_.empty();
    }

    std::size_t size() const
    {
        std::scoped_lock lk(m_);
        return clients_.size();
    }

    std::vector<std::pair<ClientId, std::shared_ptr<ClientSink>>> snapshot() const
    {
        std::scoped_lock lk(m_);
        return {clients_.begin(), clients_.end()};
    }
};

// Outcome of feeding one process report through PresenceState.
struct PresenceTransition
{
    struct Closed
    {
        uint64_t pid;
        std::string session;
    };
    std::optional<Closed> closed; // session that must be cleared first
    bool announce{false};         // the incoming session must be broadcast
    std::string payload;          // rendered announcement when announce is set
};

// Turns level-triggered process reports into edge-triggered announcements.
// Only the session id is compared: a renamed process within one session is not re-announced.
class PresenceState
{
    mutable std::mutex m_;
    std::optional<std::string> active_session_;
    std::optional<uint64_t> last_pid_;

public:
    // render(ev) builds the announcement before any state changes; if it throws,
    // the exception propagates and the state is left as it was.
    template <typename Render>
    PresenceTransition advance(const ProcessDetectedEvent &ev, Render render)
    {
        PresenceTransition t;
        std::scoped_lock lk(m_);

        if (ev.id == kNoProcessId)
        {
            if (!active_session_)
                return t;
            t.closed = PresenceTransition::Closed{last_pid_.value_or(0), *active_session_};
            active_session_.reset();
            return t;
        }

        if (active_session_ == ev.id)
            return t;

        t.payload = render(ev);

        if (active_session_)
            t.closed = PresenceTransition::Closed{last_pid_.value_or(0), *active_session_};

        last_pid_ = ev.pid;
        active_session_ = ev.id;
        t.announce = true;
        return t;
    }

    PresenceTransition advance(const ProcessDetectedEvent &ev)
    {
        return advance(ev, [](const ProcessDetectedEvent &)
                       { return std::string(); });
    }

    std::optional<std::string> active_session() const
    {
        std::scoped_lock lk(m_);
        return active_session_;
    }

    std::optional<uint64_t> last_pid() const
    {
        std::scoped_lock lk(m_);
        return last_pid_;
    }
};

struct BridgeState
{
    ClientRegistry clients;
    PresenceState presence;
    std::string welcome;
    bool strict = false; // invariant violations throw instead of being logged
};

// Broken internal invariant; raised only in strict mode and never caught by a dispatch loop.
struct InvariantViolation : std::logic_error
{
    using std::logic_error::logic_error;
};
