#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace attlog::core {

/**
 * Unbounded multi-producer / multi-consumer queue used to hand one-way
 * messages from a worker thread to whoever is watching it.
 *
 * After close(), push() is ignored and pop() drains what is left, then
 * returns std::nullopt.
 */
template <typename T>
class MessageChannel {
public:
    void push(T msg)
    {
        {
            std::lock_guard<std::mutex> g(_mx);
            if (_closed) return;
            _queue.push_back(std::move(msg));
        }
        _cv.notify_one();
    }

    std::optional<T> try_pop()
    {
        std::lock_guard<std::mutex> g(_mx);
        return take_locked();
    }

    // Blocks until a message is available or the channel is closed.
    std::optional<T> pop()
    {
        std::unique_lock<std::mutex> lk(_mx);
        _cv.wait(lk, [this] { return _closed || !_queue.empty(); });
        return take_locked();
    }

    template <typename Rep, typename Period>
    std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout)
    {
        std::unique_lock<std::mutex> lk(_mx);
        _cv.wait_for(lk, timeout, [this] { return _closed || !_queue.empty(); });
        return take_locked();
    }

    void close()
    {
        {
            std::lock_guard<std::mutex> g(_mx);
            _closed = true;
        }
        _cv.notify_all();
    }

    bool closed() const
    {
        std::lock_guard<std::mutex> g(_mx);
        return _closed;
    }

    std::size_t size() const
    {
        std::lock_guard<std::mutex> g(_mx);
        return _queue.size();
    }

private:
    std::optional<T> take_locked()
    {
        if (_queue.empty()) return std::nullopt;
        T msg = std::move(_queue.front());
        _queue.pop_front();
        return msg;
    }

    mutable std::mutex _mx;
    std::condition_variable _cv;
    std::deque<T> _queue;
    bool _closed{false};
};

} // namespace attlog::core
