#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "bus/events.hpp"
#include "config/config_loader.hpp"
#include "run/run_request.hpp"
#include "run/run_service.hpp"
#include "sandbox/sandbox_runtime.hpp"
#include "server/access_gate.hpp"
#include "server/http_gateway.hpp"
#include "storage/blob_store.hpp"
#include "utils/logging.hpp"

namespace {

volatile std::sig_atomic_t g_signal = 0;

void HandleSignal(int signal) {
    g_signal = signal;
}

void InstallSignalHandlers() {
    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

scriptbox::config::Config LoadAndApplyConfig() {
    auto config = scriptbox::config::LoadConfig();
    scriptbox::utils::LogConfig log_config{};
    log_config.min_level = scriptbox::utils::ParseLogLevel(config.logging.level);
    scriptbox::utils::SetLogConfig(log_config);
    return config;
}

int RunServer() {
    const auto config = LoadAndApplyConfig();
    scriptbox::storage::DirectoryBlobStore store(config.server.upload_dir);
    scriptbox::run::RunService runs(
        config.runs,
        store,
        scriptbox::sandbox::CreateRuntime(config.sandbox));
    scriptbox::server::HttpGateway gateway(
        config.server,
        store,
        runs,
        scriptbox::server::AccessGate(config.server.admin_token));

    InstallSignalHandlers();

    std::atomic<bool> listen_failed{false};
    std::thread http_thread([&gateway, &listen_failed]() {
        if (!gateway.Listen()) {
            listen_failed.store(true);
        }
    });

    std::cout << "scriptbox running at http://localhost:" << config.server.port << std::endl;
    while (g_signal == 0 && !listen_failed.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    gateway.Stop();
    if (http_thread.joinable()) {
        http_thread.join();
    }
    runs.Shutdown();
    if (listen_failed.load()) {
        std::cerr << "[http] failed to listen on " << config.server.host << ":" << config.server.port << std::endl;
        return 1;
    }
    return 0;
}

int ListFiles() {
    const auto config = LoadAndApplyConfig();
    scriptbox::storage::DirectoryBlobStore store(config.server.upload_dir);
    for (const auto& entry : store.List()) {
        std::cout << entry.name << "\t" << entry.size << std::endl;
    }
    return 0;
}

// Exit status follows the shell: the script's own code, 137 when killed by a
// signal, 124 for a timeout.
int RunOnce(const std::string& file_name, int timeout_seconds) {
    const auto config = LoadAndApplyConfig();
    scriptbox::storage::DirectoryBlobStore store(config.server.upload_dir);
    scriptbox::run::RunService runs(
        config.runs,
        store,
        scriptbox::sandbox::CreateRuntime(config.sandbox));

    scriptbox::run::RunRequest request{};
    request.file_name = file_name;
    request.timeout_seconds = timeout_seconds;
    const auto submitted = runs.Submit(request, true);
    if (!submitted.Accepted()) {
        std::cerr << "Error: " << submitted.error << std::endl;
        return 2;
    }

    InstallSignalHandlers();
    bool cancel_sent = false;
    int status = 1;
    scriptbox::bus::RunEvent event{};
    while (true) {
        if (g_signal != 0 && !cancel_sent) {
            cancel_sent = true;
            runs.Cancel(submitted.run_id);
        }
        const auto result = submitted.subscription->Next(event, std::chrono::milliseconds(200));
        if (result == scriptbox::bus::Subscription::WaitResult::kClosed) {
            break;
        }
        if (result == scriptbox::bus::Subscription::WaitResult::kTimeout) {
            continue;
        }
        switch (event.kind) {
            case scriptbox::bus::EventKind::kStart:
                break;
            case scriptbox::bus::EventKind::kStdout:
                std::cout << event.chunk << std::flush;
                break;
            case scriptbox::bus::EventKind::kStderr:
                std::cerr << event.chunk << std::flush;
                break;
            case scriptbox::bus::EventKind::kExit:
                if (event.timed_out) {
                    std::cerr << "[run] timed out after " << scriptbox::run::ClampTimeout(timeout_seconds)
                              << "s" << std::endl;
                    status = 124;
                } else if (event.exit_code.has_value()) {
                    status = *event.exit_code;
                } else {
                    std::cerr << "[run] terminated by " << event.signal.value_or("signal") << std::endl;
                    status = 137;
                }
                break;
            case scriptbox::bus::EventKind::kError:
                std::cerr << "[run] " << event.error << std::endl;
                status = 1;
                break;
        }
    }
    runs.Shutdown();
    return status;
}

void PrintUsage() {
    std::cout << "Usage: scriptbox serve | scriptbox files | scriptbox run <file> [timeoutSeconds]" << std::endl;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc >= 2 && std::string(argv[1]) == "serve") {
        return RunServer();
    }

    if (argc >= 2 && std::string(argv[1]) == "files") {
        return ListFiles();
    }

    if (argc >= 3 && std::string(argv[1]) == "run") {
        const int timeout = argc >= 4
            ? scriptbox::run::ParseTimeout(std::string(argv[3]))
            : scriptbox::run::kDefaultTimeoutSeconds;
        return RunOnce(argv[2], timeout);
    }

    PrintUsage();
    return 1;
}
