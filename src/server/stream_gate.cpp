#include "server/stream_gate.hpp"

namespace scriptbox::server {

StreamGate::StreamGate(std::size_t max_total, std::size_t max_per_run)
    : max_total_(max_total)
    , max_per_run_(max_per_run) {}

bool StreamGate::TryAcquire(const std::string& run_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (total_ >= max_total_) {
        return false;
    }
    auto& count = per_run_[run_id];
    if (count >= max_per_run_) {
        if (count == 0) {
            per_run_.erase(run_id);
        }
        return false;
    }
    ++count;
    ++total_;
    return true;
}

void StreamGate::Release(const std::string& run_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = per_run_.find(run_id);
    if (it == per_run_.end()) {
        return;
    }
    --total_;
    if (--it->second == 0) {
        per_run_.erase(it);
    }
}

std::size_t StreamGate::Open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_;
}

std::size_t StreamGate::OpenFor(const std::string& run_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = per_run_.find(run_id);
    return it == per_run_.end() ? 0 : it->second;
}

}  // namespace scriptbox::server
