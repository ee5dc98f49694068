#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include "bus/event_channel.hpp"
#include "config/config_schema.hpp"
#include "run/run_registry.hpp"
#include "run/run_request.hpp"
#include "sandbox/process_supervisor.hpp"
#include "sandbox/sandbox_runtime.hpp"
#include "storage/blob_store.hpp"

namespace scriptbox::run {

enum class SubmitStatus {
    kAccepted,
    kInvalidFileName,
    kNotFound
};

const char* ToString(SubmitStatus status);

struct SubmitResult {
    SubmitStatus status = SubmitStatus::kAccepted;
    std::string run_id;
    std::string error;
    // Attached before the run starts when requested, so it sees every event.
    bus::SubscriptionPtr subscription;

    bool Accepted() const { return status == SubmitStatus::kAccepted; }
};

// Entry point of the execution pipeline: validates a request, resolves the
// execution policy, registers the run and hands it to a ProcessSupervisor.
// Never waits for the run itself.
class RunService {
public:
    RunService(const config::RunsConfig& config,
               storage::BlobStore& store,
               std::unique_ptr<sandbox::SandboxRuntime> runtime);
    ~RunService();

    RunService(const RunService&) = delete;
    RunService& operator=(const RunService&) = delete;

    SubmitResult Submit(const RunRequest& request, bool attach_subscriber = false);

    bus::SubscriptionPtr Subscribe(const std::string& run_id);
    void Unsubscribe(const bus::SubscriptionPtr& subscription);

    // Kills an active run through the timeout path. False for unknown or
    // already terminal runs.
    bool Cancel(const std::string& run_id);

    // Nullopt for unknown or already terminal runs.
    std::optional<sandbox::RunSession> Query(const std::string& run_id) const;
    std::size_t ActiveRuns() const { return registry_.Size(); }

    // Kills remaining runs, waits up to `grace` for them to finish, then
    // stops the workers.
    void Shutdown(std::chrono::milliseconds grace = std::chrono::milliseconds(3000));

private:
    void OnRunFinished(const sandbox::RunSession& session);

    config::RunsConfig config_;
    storage::BlobStore& store_;
    std::unique_ptr<sandbox::SandboxRuntime> runtime_;
    bus::EventChannel channel_;
    boost::asio::io_context io_;
    RunRegistry registry_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
    std::vector<std::thread> workers_;
    bool stopped_ = false;
};

}  // namespace scriptbox::run
