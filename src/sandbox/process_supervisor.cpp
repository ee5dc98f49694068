#include "sandbox/process_supervisor.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <utility>
#include <sys/wait.h>
#include <unistd.h>

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/post.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include "run/run_request.hpp"
#include "utils/logging.hpp"

namespace scriptbox::sandbox {
namespace {

std::string MakeContainerName() {
    auto id = boost::uuids::to_string(boost::uuids::random_generator()());
    id.erase(std::remove(id.begin(), id.end(), '-'), id.end());
    return "scriptbox-" + id.substr(0, 12);
}

// Empty when the program cannot be found on PATH.
std::string ResolveProgram(const std::string& program) {
    if (program.find('/') != std::string::npos) {
        return program;
    }
    return bp::search_path(program).string();
}

}  // namespace

const char* ToString(RunState state) {
    switch (state) {
        case RunState::kPending: return "pending";
        case RunState::kRunning: return "running";
        case RunState::kCompleted: return "completed";
        case RunState::kKilled: return "killed";
        case RunState::kErrored: return "errored";
    }
    return "unknown";
}

std::string SignalName(int signal) {
    switch (signal) {
        case SIGHUP: return "SIGHUP";
        case SIGINT: return "SIGINT";
        case SIGQUIT: return "SIGQUIT";
        case SIGILL: return "SIGILL";
        case SIGTRAP: return "SIGTRAP";
        case SIGABRT: return "SIGABRT";
        case SIGBUS: return "SIGBUS";
        case SIGFPE: return "SIGFPE";
        case SIGKILL: return "SIGKILL";
        case SIGUSR1: return "SIGUSR1";
        case SIGSEGV: return "SIGSEGV";
        case SIGUSR2: return "SIGUSR2";
        case SIGPIPE: return "SIGPIPE";
        case SIGALRM: return "SIGALRM";
        case SIGTERM: return "SIGTERM";
        case SIGXCPU: return "SIGXCPU";
        case SIGXFSZ: return "SIGXFSZ";
        case SIGSYS: return "SIGSYS";
        default: return "SIG" + std::to_string(signal);
    }
}

ProcessSupervisor::ProcessSupervisor(boost::asio::io_context& io,
                                     bus::EventChannel& channel,
                                     const SandboxRuntime& runtime,
                                     RunSession session,
                                     policy::ExecutionPolicy policy,
                                     SupervisorOptions options,
                                     FinishedHandler on_finished)
    : io_(io)
    , strand_(boost::asio::make_strand(io))
    , channel_(channel)
    , runtime_(runtime)
    , run_id_(session.run_id)
    , policy_(std::move(policy))
    , options_(options)
    , on_finished_(std::move(on_finished))
    , container_name_(MakeContainerName())
    , session_(std::move(session))
    , watchdog_(strand_)
    , drain_timer_(strand_) {
    session_.timeout_seconds = run::ClampTimeout(session_.timeout_seconds);
}

ProcessSupervisor::~ProcessSupervisor() {
    if (child_ && !exited_) {
        // The child destructor would block in waitpid; make sure it is gone.
        ProcessSupervisor::KillProcessGroup();
    }
}

void ProcessSupervisor::Start() {
    auto self = shared_from_this();
    boost::asio::post(strand_, [self] { self->Launch(); });
}

bool ProcessSupervisor::Cancel() {
    if (terminal_.load()) {
        return false;
    }
    auto self = shared_from_this();
    boost::asio::post(strand_, [self] { self->Kill(false); });
    return true;
}

RunState ProcessSupervisor::State() const {
    std::lock_guard<std::mutex> lock(session_mutex_);
    return session_.state;
}

RunSession ProcessSupervisor::Snapshot() const {
    std::lock_guard<std::mutex> lock(session_mutex_);
    return session_;
}

LaunchRequest ProcessSupervisor::MakeLaunchRequest() const {
    std::lock_guard<std::mutex> lock(session_mutex_);
    LaunchRequest request{};
    request.container_name = container_name_;
    request.file_name = session_.file_name;
    request.file_path = session_.file_path;
    request.policy = policy_;
    return request;
}

void ProcessSupervisor::Launch() {
    if (terminal_.load()) {
        return;
    }
    const auto request = MakeLaunchRequest();
    if (kill_requested_) {
        // Cancelled before the process existed.
        PublishStart();
        signal_ = SignalName(SIGKILL);
        exited_ = true;
        FinishWithExit();
        return;
    }

    const auto spec = runtime_.BuildLaunch(request);
    const auto program = ResolveProgram(spec.program);
    if (program.empty()) {
        PublishStart();
        FinishWithError("sandbox runtime unavailable: '" + spec.program + "' not found");
        return;
    }

    auto self = shared_from_this();
    try {
        stdout_pipe_ = std::make_unique<bp::async_pipe>(io_);
        stderr_pipe_ = std::make_unique<bp::async_pipe>(io_);
        child_ = std::make_unique<bp::child>(
            bp::exe = program,
            bp::args = spec.args,
            bp::start_dir = spec.working_dir.string(),
            bp::std_in.close(),
            bp::std_out > *stdout_pipe_,
            bp::std_err > *stderr_pipe_,
            bp::extend::on_exec_setup = [](auto&) { ::setpgid(0, 0); },
            io_,
            bp::on_exit = [self](int, const std::error_code& ec) {
                boost::asio::post(self->strand_, [self, ec] { self->OnProcessExit(ec); });
            });
    } catch (const bp::process_error& ex) {
        PublishStart();
        FinishWithError(std::string("failed to launch sandbox: ") + ex.what());
        return;
    } catch (const boost::system::system_error& ex) {
        PublishStart();
        FinishWithError(std::string("failed to launch sandbox: ") + ex.what());
        return;
    }

    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        session_.state = RunState::kRunning;
        session_.started_at = std::chrono::system_clock::now();
    }
    utils::LogInfo("supervisor", "launched " + request.file_name + " via " + runtime_.Name() +
                                 " (pid=" + std::to_string(child_->id()) + ")");
    PublishStart();

    open_streams_ = 2;
    ReadStream(*stdout_pipe_, stdout_buffer_, bus::EventKind::kStdout);
    ReadStream(*stderr_pipe_, stderr_buffer_, bus::EventKind::kStderr);
    ArmWatchdog();
}

void ProcessSupervisor::ReadStream(bp::async_pipe& pipe, ReadBuffer& buffer, bus::EventKind kind) {
    auto self = shared_from_this();
    pipe.async_read_some(
        boost::asio::buffer(buffer),
        boost::asio::bind_executor(
            strand_,
            [self, &pipe, &buffer, kind](const boost::system::error_code& ec, std::size_t size) {
                self->OnRead(pipe, buffer, kind, ec, size);
            }));
}

void ProcessSupervisor::OnRead(bp::async_pipe& pipe,
                               ReadBuffer& buffer,
                               bus::EventKind kind,
                               const boost::system::error_code& ec,
                               std::size_t size) {
    if (terminal_.load()) {
        return;
    }
    if (size > 0) {
        Publish(bus::MakeOutputEvent(kind, run_id_, std::string(buffer.data(), size)));
    }
    if (!ec) {
        ReadStream(pipe, buffer, kind);
        return;
    }
    if (ec == boost::asio::error::operation_aborted) {
        return;
    }
    --open_streams_;
    if (ec == boost::asio::error::eof || ec == boost::asio::error::broken_pipe) {
        if (exited_ && open_streams_ == 0) {
            FinishWithExit();
        }
        return;
    }
    FinishWithError("failed to read process output: " + ec.message());
}

void ProcessSupervisor::FailRead(bus::EventKind kind, const boost::system::error_code& ec) {
    auto self = shared_from_this();
    boost::asio::post(strand_, [self, kind, ec] {
        if (!self->stdout_pipe_ || !self->stderr_pipe_) {
            return;
        }
        if (kind == bus::EventKind::kStderr) {
            self->OnRead(*self->stderr_pipe_, self->stderr_buffer_, kind, ec, 0);
        } else {
            self->OnRead(*self->stdout_pipe_, self->stdout_buffer_, kind, ec, 0);
        }
    });
}

void ProcessSupervisor::OnProcessExit(const std::error_code& ec) {
    if (exited_) {
        return;
    }
    exited_ = true;
    watchdog_.cancel();
    if (!ec) {
        const int status = child_->native_exit_code();
        if (WIFEXITED(status)) {
            exit_code_ = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            signal_ = SignalName(WTERMSIG(status));
        }
    } else {
        utils::LogWarn("supervisor", "exit status unavailable: " + ec.message());
    }
    if (terminal_.load()) {
        return;
    }
    if (open_streams_ == 0) {
        FinishWithExit();
        return;
    }
    auto self = shared_from_this();
    drain_timer_.expires_after(options_.drain_grace);
    drain_timer_.async_wait([self](const boost::system::error_code& wait_ec) {
        if (wait_ec) {
            return;
        }
        self->FinishWithExit();
    });
}

void ProcessSupervisor::ArmWatchdog() {
    int timeout_seconds = 0;
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        timeout_seconds = session_.timeout_seconds;
    }
    auto self = shared_from_this();
    watchdog_.expires_after(std::chrono::seconds(timeout_seconds));
    watchdog_.async_wait([self](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        self->Kill(true);
    });
}

void ProcessSupervisor::Kill(bool timed_out) {
    // Once the exit has been observed the natural path owns the terminal
    // event; a late kill would only hit an already reaped pid.
    if (terminal_.load() || exited_ || kill_requested_) {
        return;
    }
    kill_requested_ = true;
    timed_out_ = timed_out;
    if (!child_) {
        return;
    }
    utils::LogInfo("supervisor", (timed_out ? "timeout reached, killing pid=" : "cancelled, killing pid=") +
                                 std::to_string(child_->id()));
    KillProcessGroup();
    ReclaimRuntimeState();

    auto self = shared_from_this();
    watchdog_.expires_after(options_.kill_grace);
    watchdog_.async_wait([self](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        self->OnKillGraceExpired();
    });
}

void ProcessSupervisor::KillProcessGroup() {
    if (!child_) {
        return;
    }
    const pid_t pid = child_->id();
    if (pid <= 0) {
        return;
    }
    if (::kill(-pid, SIGKILL) == 0) {
        return;
    }
    if (::kill(pid, SIGKILL) != 0 && errno != ESRCH) {
        utils::LogWarn("supervisor", std::string("kill failed: ") + std::strerror(errno));
    }
}

void ProcessSupervisor::ReclaimRuntimeState() {
    const auto spec = runtime_.BuildReclaim(MakeLaunchRequest());
    if (!spec) {
        return;
    }
    const auto program = ResolveProgram(spec->program);
    if (program.empty()) {
        return;
    }
    // Detached so it outlives this supervisor; the io_context reaps it.
    try {
        bp::child reclaim(
            bp::exe = program,
            bp::args = spec->args,
            bp::std_in.close(),
            bp::std_out > bp::null,
            bp::std_err > bp::null,
            io_,
            bp::on_exit = [](int code, const std::error_code&) {
                if (code != 0) {
                    utils::LogDebug("supervisor", "reclaim exited with " + std::to_string(code));
                }
            });
        reclaim.detach();
    } catch (const bp::process_error& ex) {
        utils::LogWarn("supervisor", std::string("reclaim failed: ") + ex.what());
    }
}

void ProcessSupervisor::OnKillGraceExpired() {
    if (terminal_.load()) {
        return;
    }
    if (!exited_) {
        utils::LogWarn("supervisor", "no exit notification after SIGKILL, finishing run");
        signal_ = SignalName(SIGKILL);
    }
    FinishWithExit();
}

void ProcessSupervisor::FinishWithExit() {
    const bool killed = kill_requested_ && !exit_code_.has_value();
    if (!MarkTerminal(killed ? RunState::kKilled : RunState::kCompleted)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        session_.exit_code = exit_code_;
        session_.signal = signal_;
    }
    Publish(bus::MakeExitEvent(run_id_, exit_code_, signal_, killed && timed_out_));
    Cleanup();
}

void ProcessSupervisor::FinishWithError(std::string message) {
    if (!MarkTerminal(RunState::kErrored)) {
        return;
    }
    if (child_ && !exited_) {
        KillProcessGroup();
        ReclaimRuntimeState();
    }
    utils::LogWarn("supervisor", message);
    Publish(bus::MakeErrorEvent(run_id_, std::move(message)));
    Cleanup();
}

bool ProcessSupervisor::MarkTerminal(RunState state) {
    if (terminal_.exchange(true)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(session_mutex_);
    session_.state = state;
    session_.finished_at = std::chrono::system_clock::now();
    return true;
}

void ProcessSupervisor::Cleanup() {
    watchdog_.cancel();
    drain_timer_.cancel();
    boost::system::error_code ec;
    if (stdout_pipe_) {
        stdout_pipe_->close(ec);
    }
    if (stderr_pipe_) {
        stderr_pipe_->close(ec);
    }
    const auto snapshot = Snapshot();
    utils::LogInfo("supervisor", "run of " + snapshot.file_name + " finished: " + ToString(snapshot.state));
    if (on_finished_) {
        on_finished_(snapshot);
    }
}

void ProcessSupervisor::Publish(const bus::RunEvent& event) {
    channel_.Publish(run_id_, event);
}

void ProcessSupervisor::PublishStart() {
    if (start_published_) {
        return;
    }
    start_published_ = true;
    std::string file_name;
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        file_name = session_.file_name;
    }
    Publish(bus::MakeStartEvent(run_id_, file_name));
}

}  // namespace scriptbox::sandbox
