#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "sandbox/process_supervisor.hpp"

namespace scriptbox::run {

// Active runs by runId. An id is reserved before its process is launched so
// that subscribers can attach right away; the entry goes away once the run is
// terminal and cleaned up. Entries are spread over independently locked
// shards so unrelated runs never contend on one lock.
class RunRegistry {
public:
    using IdGenerator = std::function<std::string()>;
    using SupervisorPtr = std::shared_ptr<sandbox::ProcessSupervisor>;

    explicit RunRegistry(IdGenerator generator = {}, std::size_t shard_count = 16);

    RunRegistry(const RunRegistry&) = delete;
    RunRegistry& operator=(const RunRegistry&) = delete;

    // Generates ids until one is unused and inserts an empty entry for it.
    std::string Reserve();
    bool Attach(const std::string& run_id, SupervisorPtr supervisor);
    bool Remove(const std::string& run_id);

    // Null for unknown ids and for reserved ids without a supervisor yet.
    SupervisorPtr Find(const std::string& run_id) const;
    // Like Find, but also null once the run has reached a terminal state.
    SupervisorPtr FindActive(const std::string& run_id) const;
    bool Contains(const std::string& run_id) const;
    // Known and not yet terminal.
    bool IsActive(const std::string& run_id) const;

    std::size_t Size() const;
    std::vector<SupervisorPtr> Snapshot() const;

private:
    struct Shard {
        mutable std::mutex mutex;
        std::unordered_map<std::string, SupervisorPtr> entries;
    };

    Shard& ShardFor(const std::string& run_id) const;

    IdGenerator generator_;
    std::vector<std::unique_ptr<Shard>> shards_;
};

std::string GenerateRunId();

}  // namespace scriptbox::run
