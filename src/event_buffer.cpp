#include "event_buffer.hpp"
#include <algorithm>
#include <stdexcept>

namespace cerberus_dash {

// Subscription

Subscription::Subscription(size_t max_pending)
    : max_pending_(max_pending == 0 ? 1 : max_pending)
{
}

void Subscription::deliver(const LogEntry& entry) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return;
        pending_.push_back(entry);
        while (pending_.size() > max_pending_) {
            pending_.pop_front();
            ++dropped_;
        }
    }
    cv_.notify_one();
}

void Subscription::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        pending_.clear();
    }
    cv_.notify_all();
}

std::optional<LogEntry> Subscription::wait_next(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this]() { return closed_ || !pending_.empty(); });

    if (closed_ || pending_.empty()) {
        return std::nullopt;
    }

    LogEntry entry = std::move(pending_.front());
    pending_.pop_front();
    return entry;
}

std::optional<LogEntry> Subscription::try_next() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_ || pending_.empty()) {
        return std::nullopt;
    }
    LogEntry entry = std::move(pending_.front());
    pending_.pop_front();
    return entry;
}

bool Subscription::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t Subscription::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

uint64_t Subscription::dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

// EventBuffer

EventBuffer::EventBuffer(size_t capacity)
    : capacity_(capacity)
{
    if (capacity_ == 0) {
        throw std::invalid_argument("EventBuffer capacity must be at least 1");
    }
}

void EventBuffer::push(const LogEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (entries_.size() >= capacity_) {
        entries_.pop_front();
    }
    entries_.push_back(entry);

    // Fan out under the buffer lock so every subscriber sees the same order
    for (auto& subscriber : subscribers_) {
        subscriber->deliver(entry);
    }
}

std::vector<LogEntry> EventBuffer::snapshot(size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);

    size_t count = std::min(limit, entries_.size());
    return std::vector<LogEntry>(entries_.end() - static_cast<std::ptrdiff_t>(count), entries_.end());
}

SubscriptionPtr EventBuffer::subscribe() {
    auto subscription = std::make_shared<Subscription>(capacity_);

    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        subscription->close();
        return subscription;
    }
    subscribers_.push_back(subscription);
    return subscription;
}

void EventBuffer::unsubscribe(const SubscriptionPtr& subscription) {
    if (!subscription) return;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        subscribers_.erase(
            std::remove(subscribers_.begin(), subscribers_.end(), subscription),
            subscribers_.end()
        );
    }
    subscription->close();
}

void EventBuffer::close_all() {
    std::vector<SubscriptionPtr> closing;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        closing.swap(subscribers_);
    }
    for (auto& subscription : closing) {
        subscription->close();
    }
}

bool EventBuffer::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t EventBuffer::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

size_t EventBuffer::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.size();
}

} // namespace cerberus_dash
