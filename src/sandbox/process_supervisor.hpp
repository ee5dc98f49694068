#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/version.hpp>
#if BOOST_VERSION >= 108600
#include <boost/process/v1.hpp>
#include <boost/process/v1/extend.hpp>
#else
#include <boost/process.hpp>
#include <boost/process/extend.hpp>
#endif

#include "bus/event_channel.hpp"
#include "policy/execution_policy.hpp"
#include "sandbox/sandbox_runtime.hpp"

namespace scriptbox::sandbox {

#if BOOST_VERSION >= 108600
namespace bp = boost::process::v1;
#else
namespace bp = boost::process;
#endif

enum class RunState {
    kPending,
    kRunning,
    kCompleted,
    kKilled,
    kErrored
};

const char* ToString(RunState state);

inline bool IsTerminalState(RunState state) {
    return state == RunState::kCompleted || state == RunState::kKilled || state == RunState::kErrored;
}

struct RunSession {
    std::string run_id;
    std::string file_name;
    std::filesystem::path file_path;
    int timeout_seconds = 30;
    RunState state = RunState::kPending;
    std::optional<std::chrono::system_clock::time_point> started_at;
    std::optional<std::chrono::system_clock::time_point> finished_at;
    std::optional<int> exit_code;
    std::optional<std::string> signal;
};

struct SupervisorOptions {
    // How long to keep reading output after the process has exited.
    std::chrono::milliseconds drain_grace{500};
    // How long to wait for the exit notification after SIGKILL.
    std::chrono::milliseconds kill_grace{2000};
};

// "SIGKILL" for 9 and so on; "SIG<n>" for signals without a known name.
std::string SignalName(int signal);

// Owns one sandboxed run from launch to its single terminal event. All
// process, pipe and timer callbacks run on a per-run strand; the terminal
// transition is additionally guarded by an atomic flag so natural exit,
// watchdog and read failures can never both finish the run.
class ProcessSupervisor : public std::enable_shared_from_this<ProcessSupervisor> {
public:
    using FinishedHandler = std::function<void(const RunSession&)>;

    ProcessSupervisor(boost::asio::io_context& io,
                      bus::EventChannel& channel,
                      const SandboxRuntime& runtime,
                      RunSession session,
                      policy::ExecutionPolicy policy,
                      SupervisorOptions options = {},
                      FinishedHandler on_finished = {});
    virtual ~ProcessSupervisor();

    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    void Start();

    // Same path as the watchdog firing early. False once the run is terminal.
    bool Cancel();

    const std::string& RunId() const { return run_id_; }
    RunState State() const;
    RunSession Snapshot() const;
    bool IsTerminal() const { return terminal_.load(); }

protected:
    // SIGKILL to the whole process group of the run, falling back to the pid.
    virtual void KillProcessGroup();
    // Completes the pending read of one output stream with ec, on the strand.
    void FailRead(bus::EventKind kind, const boost::system::error_code& ec);

private:
    using Strand = boost::asio::strand<boost::asio::io_context::executor_type>;
    using ReadBuffer = std::array<char, 4096>;

    void Launch();
    LaunchRequest MakeLaunchRequest() const;
    void ReadStream(bp::async_pipe& pipe, ReadBuffer& buffer, bus::EventKind kind);
    void OnRead(bp::async_pipe& pipe,
                ReadBuffer& buffer,
                bus::EventKind kind,
                const boost::system::error_code& ec,
                std::size_t size);
    void OnProcessExit(const std::error_code& ec);
    void ArmWatchdog();
    void Kill(bool timed_out);
    void ReclaimRuntimeState();
    void OnKillGraceExpired();
    void FinishWithExit();
    void FinishWithError(std::string message);
    bool MarkTerminal(RunState state);
    void Cleanup();
    void Publish(const bus::RunEvent& event);
    void PublishStart();

    boost::asio::io_context& io_;
    Strand strand_;
    bus::EventChannel& channel_;
    const SandboxRuntime& runtime_;
    const std::string run_id_;
    policy::ExecutionPolicy policy_;
    SupervisorOptions options_;
    FinishedHandler on_finished_;
    std::string container_name_;

    mutable std::mutex session_mutex_;
    RunSession session_;

    std::unique_ptr<bp::async_pipe> stdout_pipe_;
    std::unique_ptr<bp::async_pipe> stderr_pipe_;
    ReadBuffer stdout_buffer_{};
    ReadBuffer stderr_buffer_{};
    std::unique_ptr<bp::child> child_;
    boost::asio::steady_timer watchdog_;
    boost::asio::steady_timer drain_timer_;

    std::atomic<bool> terminal_{false};
    bool start_published_ = false;
    bool exited_ = false;
    bool kill_requested_ = false;
    bool timed_out_ = false;
    int open_streams_ = 0;
    std::optional<int> exit_code_;
    std::optional<std::string> signal_;
};

}  // namespace scriptbox::sandbox
