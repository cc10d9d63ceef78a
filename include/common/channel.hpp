/*
 * File: include/common/channel.hpp
 * Project: Presence Bridge
 * Purpose: Blocking FIFO channel between producers and a single consumer thread
 * Notes:
 *  - See SPEC_FULL.md and DESIGN.md
 *  - close() wakes the consumer; pop() drains what is left, then returns nullopt
 * Last updated: 2026-10-19
 */

#pragma once
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

template <typename T>
class Channel
{
    std::mutex m_;
    std::condition_variable cv_;
    std::deque<T> items_;
    bool closed_ = false;

public:
    Channel() = default;
    Channel(const Channel &) = delete;
    Channel &operator=(const Channel &) = delete;

    // Returns false once the channel is closed; the item is discarded.
    bool push(T item)
    {
        {
            std::scoped_lock lk(m_);
            if (closed_)
                return false;
            items_.push_back(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    std::optional<T> pop()
    {
        std::unique_lock lk(m_);
        cv_.wait(lk, [this]
                 { return closed_ || !items_.empty(); });
        if (items_.empty())
            return std::nullopt;
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    void close()
    {
        {
            std::scoped_lock lk(m_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool closed()
    {
        std::scoped_lock lk(m_);
        return closed_;
    }

    std::size_t size()
    {
        std::scoped_lock lk(m_);
        return items_.size();
    }
};
