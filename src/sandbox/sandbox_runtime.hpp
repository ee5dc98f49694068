#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "policy/execution_policy.hpp"

namespace scriptbox::sandbox {

struct LaunchRequest {
    std::string container_name;
    std::string file_name;
    std::filesystem::path file_path;
    policy::ExecutionPolicy policy;
};

struct LaunchSpec {
    std::string program;
    std::vector<std::string> args;
    std::filesystem::path working_dir;
};

// Turns a run into the command line of an external runtime. The runtime
// enforces isolation; this side only describes it.
class SandboxRuntime {
public:
    virtual ~SandboxRuntime() = default;
    virtual std::string Name() const = 0;
    virtual LaunchSpec BuildLaunch(const LaunchRequest& request) const = 0;
    // Command that releases runtime state left behind by a killed run.
    virtual std::optional<LaunchSpec> BuildReclaim(const LaunchRequest& request) const {
        (void)request;
        return std::nullopt;
    }
};

class DockerRuntime : public SandboxRuntime {
public:
    explicit DockerRuntime(config::SandboxConfig config);

    std::string Name() const override { return "docker"; }
    LaunchSpec BuildLaunch(const LaunchRequest& request) const override;
    std::optional<LaunchSpec> BuildReclaim(const LaunchRequest& request) const override;

private:
    config::SandboxConfig config_;
};

// Runs the command with /bin/sh next to the file, without any isolation.
// Meant for development machines without docker and for tests.
class LocalRuntime : public SandboxRuntime {
public:
    explicit LocalRuntime(std::string shell = "/bin/sh");

    std::string Name() const override { return "local"; }
    LaunchSpec BuildLaunch(const LaunchRequest& request) const override;

private:
    std::string shell_;
};

std::unique_ptr<SandboxRuntime> CreateRuntime(const config::SandboxConfig& config);

}  // namespace scriptbox::sandbox
