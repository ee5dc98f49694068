#include "bus/event_channel.hpp"

#include <algorithm>
#include <functional>
#include <utility>

namespace scriptbox::bus {

Subscription::Subscription(std::string run_id, std::size_t capacity)
    : run_id_(std::move(run_id))
    , capacity_(capacity == 0 ? 1 : capacity) {}

Subscription::WaitResult Subscription::Next(RunEvent& event, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; })) {
        return WaitResult::kTimeout;
    }
    if (queue_.empty()) {
        return WaitResult::kClosed;
    }
    event = std::move(queue_.front());
    queue_.pop_front();
    return WaitResult::kEvent;
}

bool Subscription::TryNext(RunEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
        return false;
    }
    event = std::move(queue_.front());
    queue_.pop_front();
    return true;
}

std::size_t Subscription::Dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

std::size_t Subscription::Pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

bool Subscription::IsClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

void Subscription::Push(const RunEvent& event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        if (queue_.size() >= capacity_) {
            queue_.pop_front();
            ++dropped_;
        }
        queue_.push_back(event);
    }
    cv_.notify_one();
}

void Subscription::Close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

EventChannel::EventChannel(std::size_t subscriber_capacity, std::size_t shard_count)
    : capacity_(subscriber_capacity) {
    if (shard_count == 0) {
        shard_count = 1;
    }
    shards_.reserve(shard_count);
    for (std::size_t i = 0; i < shard_count; ++i) {
        shards_.push_back(std::make_unique<Shard>());
    }
}

EventChannel::Shard& EventChannel::ShardFor(const std::string& run_id) const {
    return *shards_[std::hash<std::string>{}(run_id) % shards_.size()];
}

std::shared_ptr<EventChannel::Topic> EventChannel::FindTopic(const std::string& run_id) const {
    auto& shard = ShardFor(run_id);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.topics.find(run_id);
    if (it == shard.topics.end()) {
        return nullptr;
    }
    return it->second;
}

bool EventChannel::Open(const std::string& run_id) {
    auto& shard = ShardFor(run_id);
    std::lock_guard<std::mutex> lock(shard.mutex);
    return shard.topics.emplace(run_id, std::make_shared<Topic>()).second;
}

bool EventChannel::IsOpen(const std::string& run_id) const {
    return FindTopic(run_id) != nullptr;
}

std::size_t EventChannel::Publish(const std::string& run_id, const RunEvent& event) {
    auto topic = FindTopic(run_id);
    if (!topic) {
        return 0;
    }
    // Holding the topic lock across the fan-out keeps every subscriber's view
    // of this run in publish order. Push never blocks.
    std::lock_guard<std::mutex> lock(topic->mutex);
    if (topic->closed) {
        return 0;
    }
    for (const auto& subscriber : topic->subscribers) {
        subscriber->Push(event);
    }
    return topic->subscribers.size();
}

SubscriptionPtr EventChannel::Subscribe(const std::string& run_id) {
    auto topic = FindTopic(run_id);
    if (!topic) {
        return nullptr;
    }
    std::lock_guard<std::mutex> lock(topic->mutex);
    if (topic->closed) {
        return nullptr;
    }
    auto subscription = std::make_shared<Subscription>(run_id, capacity_);
    topic->subscribers.push_back(subscription);
    return subscription;
}

void EventChannel::Unsubscribe(const SubscriptionPtr& subscription) {
    if (!subscription) {
        return;
    }
    auto topic = FindTopic(subscription->RunId());
    if (topic) {
        std::lock_guard<std::mutex> lock(topic->mutex);
        auto& subscribers = topic->subscribers;
        subscribers.erase(std::remove(subscribers.begin(), subscribers.end(), subscription), subscribers.end());
    }
    subscription->Close();
}

void EventChannel::Close(const std::string& run_id) {
    std::shared_ptr<Topic> topic;
    {
        auto& shard = ShardFor(run_id);
        std::lock_guard<std::mutex> lock(shard.mutex);
        auto it = shard.topics.find(run_id);
        if (it == shard.topics.end()) {
            return;
        }
        topic = std::move(it->second);
        shard.topics.erase(it);
    }
    std::lock_guard<std::mutex> lock(topic->mutex);
    topic->closed = true;
    for (const auto& subscriber : topic->subscribers) {
        subscriber->Close();
    }
    topic->subscribers.clear();
}

std::size_t EventChannel::SubscriberCount(const std::string& run_id) const {
    auto topic = FindTopic(run_id);
    if (!topic) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(topic->mutex);
    return topic->subscribers.size();
}

}  // namespace scriptbox::bus
