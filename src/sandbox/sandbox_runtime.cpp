#include "sandbox/sandbox_runtime.hpp"

#include <utility>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace scriptbox::sandbox {

DockerRuntime::DockerRuntime(config::SandboxConfig config)
    : config_(std::move(config)) {}

LaunchSpec DockerRuntime::BuildLaunch(const LaunchRequest& request) const {
    const auto upload_dir = request.file_path.parent_path();
    const auto command = policy::RenderCommand(request.policy, request.file_name);

    LaunchSpec spec{};
    spec.program = config_.docker_binary;
    spec.working_dir = upload_dir;
    spec.args = {"run", "--rm", "--name", request.container_name};
    if (config_.read_only) {
        spec.args.push_back("--read-only");
    }
    spec.args.insert(spec.args.end(), {
        "--network", config_.network,
        "--memory", config_.memory,
        "--cpus", config_.cpus,
        "--user", config_.user,
        "-v", upload_dir.string() + ":" + config_.mount_point + ":ro",
        "-w", config_.mount_point,
        request.policy.sandbox_image,
        "sh", "-c",
        "chmod +x " + utils::ShellQuote(request.file_name) + " 2>/dev/null || true; " + command
    });
    return spec;
}

std::optional<LaunchSpec> DockerRuntime::BuildReclaim(const LaunchRequest& request) const {
    LaunchSpec spec{};
    spec.program = config_.docker_binary;
    spec.working_dir = request.file_path.parent_path();
    spec.args = {"rm", "-f", request.container_name};
    return spec;
}

LocalRuntime::LocalRuntime(std::string shell)
    : shell_(std::move(shell)) {}

LaunchSpec LocalRuntime::BuildLaunch(const LaunchRequest& request) const {
    LaunchSpec spec{};
    spec.program = shell_;
    spec.working_dir = request.file_path.parent_path();
    spec.args = {"-c", policy::RenderCommand(request.policy, request.file_name)};
    return spec;
}

std::unique_ptr<SandboxRuntime> CreateRuntime(const config::SandboxConfig& config) {
    const auto name = utils::ToLower(config.runtime);
    if (name == "local") {
        utils::LogWarn("sandbox", "local runtime selected: scripts run without isolation");
        return std::make_unique<LocalRuntime>();
    }
    if (name != "docker") {
        utils::LogWarn("sandbox", "unknown runtime '" + config.runtime + "', using docker");
    }
    return std::make_unique<DockerRuntime>(config);
}

}  // namespace scriptbox::sandbox
