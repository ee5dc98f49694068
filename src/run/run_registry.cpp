#include "run/run_registry.hpp"

#include <utility>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace scriptbox::run {

std::string GenerateRunId() {
    thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

RunRegistry::RunRegistry(IdGenerator generator, std::size_t shard_count)
    : generator_(generator ? std::move(generator) : IdGenerator(GenerateRunId)) {
    if (shard_count == 0) {
        shard_count = 1;
    }
    shards_.reserve(shard_count);
    for (std::size_t i = 0; i < shard_count; ++i) {
        shards_.push_back(std::make_unique<Shard>());
    }
}

RunRegistry::Shard& RunRegistry::ShardFor(const std::string& run_id) const {
    return *shards_[std::hash<std::string>{}(run_id) % shards_.size()];
}

std::string RunRegistry::Reserve() {
    while (true) {
        auto run_id = generator_();
        if (run_id.empty()) {
            continue;
        }
        auto& shard = ShardFor(run_id);
        std::lock_guard<std::mutex> lock(shard.mutex);
        if (shard.entries.emplace(run_id, nullptr).second) {
            return run_id;
        }
    }
}

bool RunRegistry::Attach(const std::string& run_id, SupervisorPtr supervisor) {
    auto& shard = ShardFor(run_id);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.entries.find(run_id);
    if (it == shard.entries.end() || it->second) {
        return false;
    }
    it->second = std::move(supervisor);
    return true;
}

bool RunRegistry::Remove(const std::string& run_id) {
    SupervisorPtr released;
    auto& shard = ShardFor(run_id);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.entries.find(run_id);
    if (it == shard.entries.end()) {
        return false;
    }
    // Destroyed after the lock is released.
    released = std::move(it->second);
    shard.entries.erase(it);
    return true;
}

RunRegistry::SupervisorPtr RunRegistry::Find(const std::string& run_id) const {
    auto& shard = ShardFor(run_id);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.entries.find(run_id);
    if (it == shard.entries.end()) {
        return nullptr;
    }
    return it->second;
}

RunRegistry::SupervisorPtr RunRegistry::FindActive(const std::string& run_id) const {
    auto supervisor = Find(run_id);
    if (!supervisor || supervisor->IsTerminal()) {
        return nullptr;
    }
    return supervisor;
}

bool RunRegistry::Contains(const std::string& run_id) const {
    auto& shard = ShardFor(run_id);
    std::lock_guard<std::mutex> lock(shard.mutex);
    return shard.entries.count(run_id) > 0;
}

bool RunRegistry::IsActive(const std::string& run_id) const {
    return FindActive(run_id) != nullptr;
}

std::size_t RunRegistry::Size() const {
    std::size_t total = 0;
    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        total += shard->entries.size();
    }
    return total;
}

std::vector<RunRegistry::SupervisorPtr> RunRegistry::Snapshot() const {
    std::vector<SupervisorPtr> supervisors;
    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        for (const auto& [_, supervisor] : shard->entries) {
            if (supervisor) {
                supervisors.push_back(supervisor);
            }
        }
    }
    return supervisors;
}

}  // namespace scriptbox::run
