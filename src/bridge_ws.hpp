/*
 * File: src/bridge_ws.hpp
 * Project: Presence Bridge
 * Purpose: WebSocket listener; reports connect/disconnect/message events to the connector
 * Notes:
 *  - See SPEC_FULL.md and DESIGN.md
 *  - All socket work runs on the io_context thread; send() only posts to it
 *  - Outbound frames are queued per session (bounded) so a slow client never blocks a broadcast
 * Last updated: 2026-10-19
 */

#pragma once
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/asio.hpp>
#include <atomic>
#include <deque>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include "common/channel.hpp"
#include "common/log.hpp"
#include "bridge_state.hpp"

namespace websocket = boost::beast::websocket;

inline constexpr std::size_t kMaxQueuedFrames = 256;

// Frames waiting for async_write on one session; the front frame is the one in flight.
// Past the limit new frames are dropped, which best-effort delivery allows.
class Outbox
{
    std::deque<std::pair<std::string, bool>> frames_;
    std::size_t limit_;
    std::size_t dropped_ = 0;

public:
    explicit Outbox(std::size_t limit = kMaxQueuedFrames) : limit_(limit) {}

    bool push(std::string data, bool binary)
    {
        if (frames_.size() >= limit_)
        {
            ++dropped_;
            return false;
        }
        frames_.emplace_back(std::move(data), binary);
        return true;
    }

    const std::pair<std::string, bool> &front() const { return frames_.front(); }
    void pop() { frames_.pop_front(); }
    void clear() { frames_.clear(); }
    bool empty() const { return frames_.empty(); }
    std::size_t size() const { return frames_.size(); }
    std::size_t dropped() const { return dropped_; }
};

class WsServer
{
    boost::asio::ip::tcp::acceptor acceptor_;
    boost::asio::ip::tcp::socket socket_;
    Channel<TransportEvent> &events_;
    ClientId next_id_{1};

public:
    // Throws std::runtime_error when the endpoint cannot be bound.
    WsServer(boost::asio::io_context &ioc, boost::asio::ip::tcp::endpoint ep, Channel<TransportEvent> &events)
        : acceptor_(ioc), socket_(ioc), events_(events)
    {
        boost::system::error_code ec;
        acceptor_.open(ep.protocol(), ec);
        if (ec)
            throw std::runtime_error("ws open failed: " + ec.message());
        acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
        acceptor_.bind(ep, ec);
        if (ec)
            throw std::runtime_error("ws bind " + endpoint_string(ep) + " failed (port may already be in use): " + ec.message());
        acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
        if (ec)
            throw std::runtime_error("ws listen failed: " + ec.message());
        do_accept();
    }

    unsigned short port() const { return acceptor_.local_endpoint().port(); }

    void close()
    {
        boost::system::error_code ignored;
        acceptor_.close(ignored);
    }

    static std::string endpoint_string(const boost::asio::ip::tcp::endpoint &ep)
    {
        std::ostringstream oss;
        oss << ep;
        return oss.str();
    }

private:
    void do_accept()
    {
        acceptor_.async_accept(socket_, [this](boost::system::error_code ec)
                               {
if (ec == boost::asio::error::operation_aborted) return;
if (!ec) std::make_shared<Session>(std::move(socket_), next_id_++, events_)->run();
else log_line(LogLevel::warn, "ws", "accept failed: " + ec.message());
do_accept(); });
    }

    struct Responder;

    struct Session : std::enable_shared_from_this<Session>
    {
        websocket::stream<boost::asio::ip::tcp::socket> ws;
        boost::beast::flat_buffer buffer;
        ClientId id;
        Channel<TransportEvent> &events;
        Outbox outbox; // io thread only
        std::atomic<bool> open{false};

        Session(boost::asio::ip::tcp::socket &&s, ClientId i, Channel<TransportEvent> &ev)
            : ws(std::move(s)), id(i), events(ev) {}

        void run()
        {
            ws.set_option(websocket::stream_base::timeout::suggested(boost::beast::role_type::server));
            auto self = shared_from_this();
            ws.async_accept([self](boost::system::error_code ec)
                            { self->on_accept(ec); });
        }

        void on_accept(boost::system::error_code ec)
        {
            if (ec)
            {
                log_line(LogLevel::warn, "ws", "handshake failed: " + ec.message());
                return;
            }
            open = true;
            events.push(TransportEvent{TransportEvent::Kind::connected, id, std::make_shared<Responder>(weak_from_this()), {}, false});
            do_read();
        }

        void do_read()
        {
            auto self = shared_from_this();
            ws.async_read(buffer, [self](boost::system::error_code ec, std::size_t)
                          {
if (ec) { self->on_closed(ec); return; }
self->on_msg();
self->do_read(); });
        }

        void on_msg()
        {
            auto data = boost::beast::buffers_to_string(buffer.data());
            buffer.consume(buffer.size());
            events.push(TransportEvent{TransportEvent::Kind::message, id, nullptr, std::move(data), !ws.got_text()});
        }

        void on_closed(boost::system::error_code ec)
        {
            if (ec != websocket::error::closed)
                log_line(LogLevel::debug, "ws", "client " + std::to_string(id) + " read ended: " + ec.message());
            if (open.exchange(false))
                events.push(TransportEvent{TransportEvent::Kind::disconnected, id, nullptr, {}, false});
        }

        // Any thread.
        void queue(std::string data, bool binary)
        {
            auto self = shared_from_this();
            boost::asio::post(ws.get_executor(), [self, data = std::move(data), binary]() mutable
                              {
if (!self->outbox.push(std::move(data), binary))
{
    if (self->outbox.dropped() == 1)
        log_line(LogLevel::warn, "ws", "client " + std::to_string(self->id) + " is not reading, dropping frames");
    return;
}
if (self->outbox.size() == 1) self->do_write(); });
        }

        void do_write()
        {
            auto self = shared_from_this();
            ws.text(!outbox.front().second);
            ws.async_write(boost::asio::buffer(outbox.front().first), [self](boost::system::error_code ec, std::size_t)
                           {
if (ec)
{
    log_line(LogLevel::debug, "ws", "write to client " + std::to_string(self->id) + " failed: " + ec.message());
    self->outbox.clear();
    return;
}
self->outbox.pop();
if (!self->outbox.empty()) self->do_write(); });
        }
    };

    // Registry handle for a session; does not keep the session alive.
    struct Responder : ClientSink
    {
        std::weak_ptr<Session> session;

        explicit Responder(std::weak_ptr<Session> s) : session(std::move(s)) {}

        bool send(const std::string &data, bool binary) override
        {
            auto s = session.lock();
            if (!s || !s->open)
                return false;
            s->queue(data, binary);
            return true;
        }
    };
};
