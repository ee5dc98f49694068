#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>

namespace scriptbox::server {

// Admission for long-lived event streams. Each stream pins an HTTP worker
// thread for the rest of its run, so the total is kept below the pool size
// and a single run cannot take all of it.
class StreamGate {
public:
    StreamGate(std::size_t max_total, std::size_t max_per_run);

    bool TryAcquire(const std::string& run_id);
    void Release(const std::string& run_id);

    std::size_t Open() const;
    std::size_t OpenFor(const std::string& run_id) const;

private:
    const std::size_t max_total_;
    const std::size_t max_per_run_;
    mutable std::mutex mutex_;
    std::size_t total_ = 0;
    std::unordered_map<std::string, std::size_t> per_run_;
};

}  // namespace scriptbox::server
