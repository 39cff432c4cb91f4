#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace attlog::core {

/**
 * Synchronous pub/sub stream.
 *
 * publish() copies the subscriber list under the lock and invokes callbacks
 * outside it, so a callback may subscribe or unsubscribe without deadlock.
 * Callbacks run on the publishing thread.
 */
template <typename EventT>
class EventStream {
public:
    using Callback = std::function<void(const EventT&)>;

    struct Subscription {
        std::uint32_t id{0};
    };

    Subscription subscribe(Callback cb)
    {
        std::lock_guard<std::mutex> g(_mx);
        const std::uint32_t id = ++_nextId;
        _subs.push_back({id, std::move(cb)});
        return Subscription{id};
    }

    void unsubscribe(Subscription sub)
    {
        std::lock_guard<std::mutex> g(_mx);
        for (auto it = _subs.begin(); it != _subs.end(); ++it) {
            if (it->id == sub.id) {
                _subs.erase(it);
                return;
            }
        }
    }

    void publish(const EventT& ev)
    {
        std::vector<Subscriber> snap;
        {
            std::lock_guard<std::mutex> g(_mx);
            snap = _subs;
        }
        for (auto& s : snap) {
            if (s.cb) s.cb(ev);
        }
    }

    std::size_t subscriber_count() const
    {
        std::lock_guard<std::mutex> g(_mx);
        return _subs.size();
    }

private:
    struct Subscriber {
        std::uint32_t id;
        Callback cb;
    };

    mutable std::mutex _mx;
    std::uint32_t _nextId{0};
    std::vector<Subscriber> _subs;
};

// Unsubscribes on destruction.
template <typename EventT>
class ScopedSubscription {
public:
    ScopedSubscription(EventStream<EventT>& stream, typename EventStream<EventT>::Callback cb)
        : _stream(stream)
        , _sub(stream.subscribe(std::move(cb)))
    {}

    ~ScopedSubscription() { _stream.unsubscribe(_sub); }

    ScopedSubscription(const ScopedSubscription&) = delete;
    ScopedSubscription& operator=(const ScopedSubscription&) = delete;

private:
    EventStream<EventT>& _stream;
    typename EventStream<EventT>::Subscription _sub;
};

} // namespace attlog::core
