#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>

#include "utils/logging.hpp"

namespace scriptbox::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

bool ParseBool(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

long long ParseLong(const std::string& value, long long fallback) {
    try {
        return std::stoll(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

void ReadString(const nlohmann::json& section, const char* key, std::string& target) {
    if (section.contains(key) && section[key].is_string()) {
        target = section[key].get<std::string>();
    }
}

void ReadInt(const nlohmann::json& section, const char* key, int& target) {
    if (section.contains(key) && section[key].is_number_integer()) {
        target = section[key].get<int>();
    }
}

}  // namespace

std::filesystem::path GetConfigPath() {
    const auto explicit_path = GetEnv("SCRIPTBOX_CONFIG");
    if (!explicit_path.empty()) {
        return explicit_path;
    }
    return GetHomePath() / ".scriptbox" / "config.json";
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("server") && data["server"].is_object()) {
        const auto& server = data["server"];
        ReadString(server, "host", config.server.host);
        ReadInt(server, "port", config.server.port);
        ReadString(server, "publicDir", config.server.public_dir);
        ReadString(server, "uploadDir", config.server.upload_dir);
        ReadString(server, "adminToken", config.server.admin_token);
        if (server.contains("maxUploadBytes") && server["maxUploadBytes"].is_number_integer()) {
            config.server.max_upload_bytes = server["maxUploadBytes"].get<long long>();
        }
        ReadInt(server, "threads", config.server.threads);
        ReadInt(server, "maxStreams", config.server.max_streams);
        ReadInt(server, "maxStreamsPerRun", config.server.max_streams_per_run);
    }

    if (data.contains("sandbox") && data["sandbox"].is_object()) {
        const auto& sandbox = data["sandbox"];
        ReadString(sandbox, "runtime", config.sandbox.runtime);
        ReadString(sandbox, "dockerBinary", config.sandbox.docker_binary);
        ReadString(sandbox, "network", config.sandbox.network);
        ReadString(sandbox, "memory", config.sandbox.memory);
        ReadString(sandbox, "cpus", config.sandbox.cpus);
        ReadString(sandbox, "user", config.sandbox.user);
        ReadString(sandbox, "mountPoint", config.sandbox.mount_point);
        if (sandbox.contains("readOnly") && sandbox["readOnly"].is_boolean()) {
            config.sandbox.read_only = sandbox["readOnly"].get<bool>();
        }
    }

    if (data.contains("runs") && data["runs"].is_object()) {
        const auto& runs = data["runs"];
        ReadInt(runs, "workers", config.runs.workers);
        if (runs.contains("subscriberQueue") && runs["subscriberQueue"].is_number_unsigned()) {
            config.runs.subscriber_queue = runs["subscriberQueue"].get<std::size_t>();
        }
        ReadInt(runs, "drainGraceMs", config.runs.drain_grace_ms);
        ReadInt(runs, "killGraceMs", config.runs.kill_grace_ms);
    }

    if (data.contains("log") && data["log"].is_object()) {
        ReadString(data["log"], "level", config.logging.level);
    }
}

void ApplyEnvOverrides(Config& config) {
    const auto host = GetEnvFallback("SCRIPTBOX_SERVER__HOST", "SCRIPTBOX_SERVER_HOST");
    if (!host.empty()) {
        config.server.host = host;
    }

    const auto port = GetEnvFallback("SCRIPTBOX_SERVER__PORT", "PORT");
    if (!port.empty()) {
        config.server.port = ParseInt(port, config.server.port);
    }

    const auto public_dir = GetEnvFallback("SCRIPTBOX_SERVER__PUBLIC_DIR", "SCRIPTBOX_SERVER_PUBLIC_DIR");
    if (!public_dir.empty()) {
        config.server.public_dir = public_dir;
    }

    const auto upload_dir = GetEnvFallback("SCRIPTBOX_SERVER__UPLOAD_DIR", "SCRIPTBOX_SERVER_UPLOAD_DIR");
    if (!upload_dir.empty()) {
        config.server.upload_dir = upload_dir;
    }

    const auto admin_token = GetEnvFallback("SCRIPTBOX_SERVER__ADMIN_TOKEN", "ADMIN_TOKEN");
    if (!admin_token.empty()) {
        config.server.admin_token = admin_token;
    }

    const auto max_upload = GetEnvFallback(
        "SCRIPTBOX_SERVER__MAX_UPLOAD_BYTES",
        "SCRIPTBOX_SERVER_MAX_UPLOAD_BYTES");
    if (!max_upload.empty()) {
        config.server.max_upload_bytes = ParseLong(max_upload, config.server.max_upload_bytes);
    }

    const auto threads = GetEnvFallback("SCRIPTBOX_SERVER__THREADS", "SCRIPTBOX_SERVER_THREADS");
    if (!threads.empty()) {
        config.server.threads = ParseInt(threads, config.server.threads);
    }

    const auto max_streams = GetEnvFallback("SCRIPTBOX_SERVER__MAX_STREAMS", "SCRIPTBOX_SERVER_MAX_STREAMS");
    if (!max_streams.empty()) {
        config.server.max_streams = ParseInt(max_streams, config.server.max_streams);
    }

    const auto max_streams_per_run = GetEnvFallback(
        "SCRIPTBOX_SERVER__MAX_STREAMS_PER_RUN",
        "SCRIPTBOX_SERVER_MAX_STREAMS_PER_RUN");
    if (!max_streams_per_run.empty()) {
        config.server.max_streams_per_run = ParseInt(max_streams_per_run, config.server.max_streams_per_run);
    }

    const auto runtime = GetEnvFallback("SCRIPTBOX_SANDBOX__RUNTIME", "SCRIPTBOX_SANDBOX_RUNTIME");
    if (!runtime.empty()) {
        config.sandbox.runtime = runtime;
    }

    const auto docker_binary = GetEnvFallback(
        "SCRIPTBOX_SANDBOX__DOCKER_BINARY",
        "SCRIPTBOX_SANDBOX_DOCKER_BINARY");
    if (!docker_binary.empty()) {
        config.sandbox.docker_binary = docker_binary;
    }

    const auto network = GetEnvFallback("SCRIPTBOX_SANDBOX__NETWORK", "SCRIPTBOX_SANDBOX_NETWORK");
    if (!network.empty()) {
        config.sandbox.network = network;
    }

    const auto user = GetEnvFallback("SCRIPTBOX_SANDBOX__USER", "SCRIPTBOX_SANDBOX_USER");
    if (!user.empty()) {
        config.sandbox.user = user;
    }

    const auto mount_point = GetEnvFallback("SCRIPTBOX_SANDBOX__MOUNT_POINT", "SCRIPTBOX_SANDBOX_MOUNT_POINT");
    if (!mount_point.empty()) {
        config.sandbox.mount_point = mount_point;
    }

    const auto memory = GetEnvFallback("SCRIPTBOX_SANDBOX__MEMORY", "SCRIPTBOX_SANDBOX_MEMORY");
    if (!memory.empty()) {
        config.sandbox.memory = memory;
    }

    const auto cpus = GetEnvFallback("SCRIPTBOX_SANDBOX__CPUS", "SCRIPTBOX_SANDBOX_CPUS");
    if (!cpus.empty()) {
        config.sandbox.cpus = cpus;
    }

    const auto read_only = GetEnvFallback("SCRIPTBOX_SANDBOX__READ_ONLY", "SCRIPTBOX_SANDBOX_READ_ONLY");
    if (!read_only.empty()) {
        config.sandbox.read_only = ParseBool(read_only);
    }

    const auto workers = GetEnvFallback("SCRIPTBOX_RUNS__WORKERS", "SCRIPTBOX_RUNS_WORKERS");
    if (!workers.empty()) {
        config.runs.workers = ParseInt(workers, config.runs.workers);
    }

    const auto subscriber_queue = GetEnvFallback(
        "SCRIPTBOX_RUNS__SUBSCRIBER_QUEUE",
        "SCRIPTBOX_RUNS_SUBSCRIBER_QUEUE");
    if (!subscriber_queue.empty()) {
        const auto parsed = ParseLong(subscriber_queue, -1);
        if (parsed >= 0) {
            config.runs.subscriber_queue = static_cast<std::size_t>(parsed);
        }
    }

    const auto drain_grace = GetEnvFallback("SCRIPTBOX_RUNS__DRAIN_GRACE_MS", "SCRIPTBOX_RUNS_DRAIN_GRACE_MS");
    if (!drain_grace.empty()) {
        config.runs.drain_grace_ms = ParseInt(drain_grace, config.runs.drain_grace_ms);
    }

    const auto kill_grace = GetEnvFallback("SCRIPTBOX_RUNS__KILL_GRACE_MS", "SCRIPTBOX_RUNS_KILL_GRACE_MS");
    if (!kill_grace.empty()) {
        config.runs.kill_grace_ms = ParseInt(kill_grace, config.runs.kill_grace_ms);
    }

    const auto level = GetEnvFallback("SCRIPTBOX_LOG__LEVEL", "SCRIPTBOX_LOG_LEVEL");
    if (!level.empty()) {
        config.logging.level = level;
    }
}

Config LoadConfigFromFile(const std::filesystem::path& path) {
    Config config{};
    if (!std::filesystem::exists(path)) {
        return config;
    }
    try {
        std::ifstream input(path);
        nlohmann::json data;
        input >> data;
        ApplyConfigFromJson(config, data);
    } catch (const nlohmann::json::exception& ex) {
        utils::LogWarn("config", "ignoring " + path.string() + ": " + ex.what());
    }
    return config;
}

Config LoadConfig() {
    auto config = LoadConfigFromFile(GetConfigPath());
    ApplyEnvOverrides(config);
    if (config.runs.workers < 1) {
        config.runs.workers = 1;
    }
    if (config.runs.subscriber_queue == 0) {
        config.runs.subscriber_queue = 1;
    }
    return config;
}

}  // namespace scriptbox::config
