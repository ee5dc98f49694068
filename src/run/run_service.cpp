#include "run/run_service.hpp"

#include <utility>

#include "policy/execution_policy.hpp"
#include "utils/logging.hpp"

namespace scriptbox::run {

const char* ToString(SubmitStatus status) {
    switch (status) {
        case SubmitStatus::kAccepted: return "accepted";
        case SubmitStatus::kInvalidFileName: return "invalid filename";
        case SubmitStatus::kNotFound: return "file not found";
    }
    return "unknown";
}

RunService::RunService(const config::RunsConfig& config,
                       storage::BlobStore& store,
                       std::unique_ptr<sandbox::SandboxRuntime> runtime)
    : config_(config)
    , store_(store)
    , runtime_(std::move(runtime))
    , channel_(config.subscriber_queue)
    , work_guard_(boost::asio::make_work_guard(io_)) {
    const int workers = config_.workers < 1 ? 1 : config_.workers;
    workers_.reserve(static_cast<std::size_t>(workers));
    for (int i = 0; i < workers; ++i) {
        workers_.emplace_back([this]() { io_.run(); });
    }
}

RunService::~RunService() {
    Shutdown();
}

SubmitResult RunService::Submit(const RunRequest& request, bool attach_subscriber) {
    SubmitResult result{};
    if (!IsValidFileName(request.file_name)) {
        result.status = SubmitStatus::kInvalidFileName;
        result.error = "invalid filename";
        return result;
    }
    const auto file_path = store_.Resolve(request.file_name);
    if (!file_path) {
        result.status = SubmitStatus::kNotFound;
        result.error = "file not found";
        return result;
    }

    auto policy = policy::Resolve(request.file_name);
    const auto run_id = registry_.Reserve();
    channel_.Open(run_id);
    if (attach_subscriber) {
        result.subscription = channel_.Subscribe(run_id);
    }

    sandbox::RunSession session{};
    session.run_id = run_id;
    session.file_name = request.file_name;
    session.file_path = *file_path;
    session.timeout_seconds = ClampTimeout(request.timeout_seconds);

    sandbox::SupervisorOptions options{};
    options.drain_grace = std::chrono::milliseconds(config_.drain_grace_ms);
    options.kill_grace = std::chrono::milliseconds(config_.kill_grace_ms);

    auto supervisor = std::make_shared<sandbox::ProcessSupervisor>(
        io_,
        channel_,
        *runtime_,
        std::move(session),
        std::move(policy),
        options,
        [this](const sandbox::RunSession& finished) { OnRunFinished(finished); });
    registry_.Attach(run_id, supervisor);
    utils::LogInfo("runs", "accepted " + request.file_name + " (timeout=" +
                           std::to_string(ClampTimeout(request.timeout_seconds)) + "s)");
    supervisor->Start();

    result.status = SubmitStatus::kAccepted;
    result.run_id = run_id;
    return result;
}

bus::SubscriptionPtr RunService::Subscribe(const std::string& run_id) {
    return channel_.Subscribe(run_id);
}

void RunService::Unsubscribe(const bus::SubscriptionPtr& subscription) {
    channel_.Unsubscribe(subscription);
}

bool RunService::Cancel(const std::string& run_id) {
    auto supervisor = registry_.FindActive(run_id);
    if (!supervisor) {
        return false;
    }
    return supervisor->Cancel();
}

std::optional<sandbox::RunSession> RunService::Query(const std::string& run_id) const {
    auto supervisor = registry_.FindActive(run_id);
    if (!supervisor) {
        return std::nullopt;
    }
    return supervisor->Snapshot();
}

void RunService::OnRunFinished(const sandbox::RunSession& session) {
    channel_.Close(session.run_id);
    registry_.Remove(session.run_id);
}

void RunService::Shutdown(std::chrono::milliseconds grace) {
    if (stopped_) {
        return;
    }
    stopped_ = true;
    for (const auto& supervisor : registry_.Snapshot()) {
        supervisor->Cancel();
    }
    const auto deadline = std::chrono::steady_clock::now() + grace;
    while (registry_.Size() > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    if (registry_.Size() > 0) {
        utils::LogWarn("runs", std::to_string(registry_.Size()) + " run(s) still active at shutdown");
    }
    work_guard_.reset();
    io_.stop();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    for (const auto& supervisor : registry_.Snapshot()) {
        registry_.Remove(supervisor->RunId());
    }
}

}  // namespace scriptbox::run
