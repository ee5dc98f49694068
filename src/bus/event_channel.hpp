#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "bus/events.hpp"

namespace scriptbox::bus {

class EventChannel;

// One observer attached to one run. Events are queued per subscriber so a
// slow reader never holds up the publisher; when the queue is full the oldest
// event is dropped.
class Subscription {
public:
    enum class WaitResult {
        kEvent,
        kTimeout,
        kClosed
    };

    Subscription(std::string run_id, std::size_t capacity);

    const std::string& RunId() const { return run_id_; }

    WaitResult Next(RunEvent& event, std::chrono::milliseconds timeout);
    bool TryNext(RunEvent& event);

    std::size_t Dropped() const;
    std::size_t Pending() const;
    bool IsClosed() const;

private:
    friend class EventChannel;

    void Push(const RunEvent& event);
    void Close();

    std::string run_id_;
    std::size_t capacity_;
    std::deque<RunEvent> queue_;
    std::size_t dropped_ = 0;
    bool closed_ = false;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

using SubscriptionPtr = std::shared_ptr<Subscription>;

// Per-run publish/subscribe. Delivery is at-most-once to the subscribers
// attached when an event is published; there is no replay for late joiners.
// Topics are spread over independently locked shards.
class EventChannel {
public:
    explicit EventChannel(std::size_t subscriber_capacity = 1024, std::size_t shard_count = 16);

    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    bool Open(const std::string& run_id);
    bool IsOpen(const std::string& run_id) const;

    // Returns the number of subscribers the event was queued for.
    std::size_t Publish(const std::string& run_id, const RunEvent& event);

    // Null when the run is unknown or already closed.
    SubscriptionPtr Subscribe(const std::string& run_id);
    void Unsubscribe(const SubscriptionPtr& subscription);

    // Subscribers keep their queued events and then see kClosed.
    void Close(const std::string& run_id);

    std::size_t SubscriberCount(const std::string& run_id) const;

private:
    struct Topic {
        std::mutex mutex;
        std::vector<SubscriptionPtr> subscribers;
        bool closed = false;
    };

    struct Shard {
        mutable std::mutex mutex;
        std::unordered_map<std::string, std::shared_ptr<Topic>> topics;
    };

    Shard& ShardFor(const std::string& run_id) const;
    std::shared_ptr<Topic> FindTopic(const std::string& run_id) const;

    std::size_t capacity_;
    std::vector<std::unique_ptr<Shard>> shards_;
};

}  // namespace scriptbox::bus
