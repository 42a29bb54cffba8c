#pragma once

#include "log_entry.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace cerberus_dash {

class EventBuffer;

// One viewer's private delivery queue. Fed by EventBuffer::push, drained
// only by its owner, so subscribers never compete for entries.
class Subscription {
public:
    explicit Subscription(size_t max_pending);

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    // Blocks up to `timeout` for the next entry. Returns nullopt on timeout
    // or once the subscription has been closed.
    std::optional<LogEntry> wait_next(std::chrono::milliseconds timeout);

    // Non-blocking variant of wait_next.
    std::optional<LogEntry> try_next();

    bool is_closed() const;
    size_t pending() const;

    // Entries discarded because this subscriber fell max_pending behind
    uint64_t dropped() const;

private:
    friend class EventBuffer;

    void deliver(const LogEntry& entry);
    void close();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<LogEntry> pending_;
    size_t max_pending_;
    uint64_t dropped_ = 0;
    bool closed_ = false;
};

using SubscriptionPtr = std::shared_ptr<Subscription>;

// Bounded drop-oldest history plus broadcast fan-out to subscribers.
class EventBuffer {
public:
    static constexpr size_t kDefaultCapacity = 1000;

    explicit EventBuffer(size_t capacity = kDefaultCapacity);

    // Non-copyable
    EventBuffer(const EventBuffer&) = delete;
    EventBuffer& operator=(const EventBuffer&) = delete;

    // Store the entry (evicting the oldest at capacity) and hand a copy to
    // every live subscription. Never blocks on a slow subscriber.
    void push(const LogEntry& entry);

    // Most recent `limit` entries, oldest first
    std::vector<LogEntry> snapshot(size_t limit) const;

    // After close_all() the returned subscription is already closed
    SubscriptionPtr subscribe();
    void unsubscribe(const SubscriptionPtr& subscription);

    // Close every subscription, waking any session blocked on one, and
    // refuse new subscribers. History and push() keep working.
    void close_all();
    bool is_closed() const;

    size_t size() const;
    size_t capacity() const { return capacity_; }
    size_t subscriber_count() const;

private:
    mutable std::mutex mutex_;
    std::deque<LogEntry> entries_;
    size_t capacity_;
    std::vector<SubscriptionPtr> subscribers_;
    bool closed_ = false;
};

} // namespace cerberus_dash
