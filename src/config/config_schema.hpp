#pragma once

#include <cstddef>
#include <string>

namespace scriptbox::config {

constexpr const char* kDefaultAdminToken = "changeme_localtoken";

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 3000;
    std::string public_dir = "public";
    std::string upload_dir = "uploads";
    std::string admin_token = kDefaultAdminToken;
    long long max_upload_bytes = 500LL * 1024 * 1024;
    // HTTP worker threads. Every open event stream holds one of them.
    int threads = 32;
    int max_streams = 24;
    int max_streams_per_run = 8;
};

struct SandboxConfig {
    std::string runtime = "docker";
    std::string docker_binary = "docker";
    std::string network = "none";
    std::string memory = "400m";
    std::string cpus = "0.5";
    std::string user = "65534:65534";
    std::string mount_point = "/srv/uploads";
    bool read_only = true;
};

struct RunsConfig {
    int workers = 2;
    std::size_t subscriber_queue = 1024;
    int drain_grace_ms = 500;
    int kill_grace_ms = 2000;
};

struct LoggingConfig {
    std::string level = "info";
};

struct Config {
    ServerConfig server;
    SandboxConfig sandbox;
    RunsConfig runs;
    LoggingConfig logging;
};

}  // namespace scriptbox::config
