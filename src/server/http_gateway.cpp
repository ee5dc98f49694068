#include "server/http_gateway.hpp"

#include <algorithm>
#include <chrono>
#include <utility>

#include "bus/events.hpp"
#include "run/run_request.hpp"
#include "utils/logging.hpp"

namespace scriptbox::server {
namespace {

constexpr auto kKeepAliveInterval = std::chrono::seconds(15);

std::size_t PoolSize(const config::ServerConfig& config) {
    return static_cast<std::size_t>(std::max(config.threads, 2));
}

// At least one worker always stays free for ordinary requests.
std::size_t StreamLimit(const config::ServerConfig& config) {
    const auto limit = static_cast<std::size_t>(std::max(config.max_streams, 1));
    return std::min(limit, PoolSize(config) - 1);
}

void SendJson(httplib::Response& res, int status, const nlohmann::json& body) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

void SendError(httplib::Response& res, int status, const std::string& message) {
    SendJson(res, status, {{"error", message}});
}

nlohmann::json ParseBody(const httplib::Request& req) {
    if (req.body.empty()) {
        return nlohmann::json::object();
    }
    auto body = nlohmann::json::parse(req.body, nullptr, false);
    if (!body.is_object()) {
        return nlohmann::json::object();
    }
    return body;
}

std::string BodyString(const nlohmann::json& body, const char* key) {
    if (body.contains(key) && body[key].is_string()) {
        return body[key].get<std::string>();
    }
    return {};
}

std::string FormatFrame(const bus::RunEvent& event) {
    return std::string("event: ") + bus::EventName(event.kind) + "\ndata: " + bus::ToWire(event) + "\n\n";
}

}  // namespace

HttpGateway::HttpGateway(const config::ServerConfig& config,
                         storage::BlobStore& store,
                         run::RunService& runs,
                         AccessGate gate)
    : config_(config)
    , store_(store)
    , runs_(runs)
    , gate_(std::move(gate))
    , streams_(StreamLimit(config_), static_cast<std::size_t>(std::max(config_.max_streams_per_run, 1))) {
    if (gate_.UsesDefaultToken()) {
        utils::LogWarn("http", "admin token is the default; set ADMIN_TOKEN before exposing this service");
    }
    if (StreamLimit(config_) < static_cast<std::size_t>(std::max(config_.max_streams, 1))) {
        utils::LogWarn("http", "maxStreams lowered to " + std::to_string(StreamLimit(config_)) +
                               " to fit " + std::to_string(PoolSize(config_)) + " worker threads");
    }
    const auto pool_size = PoolSize(config_);
    server_.new_task_queue = [pool_size] { return new httplib::ThreadPool(pool_size); };
    server_.set_payload_max_length(static_cast<std::size_t>(config_.max_upload_bytes));
    RegisterRoutes();
}

bool HttpGateway::Listen() {
    return Bind() && Serve();
}

bool HttpGateway::Bind() {
    if (config_.port == 0) {
        port_ = server_.bind_to_any_port(config_.host);
        if (port_ < 0) {
            port_ = 0;
            return false;
        }
    } else if (server_.bind_to_port(config_.host, config_.port)) {
        port_ = config_.port;
    } else {
        return false;
    }
    utils::LogInfo("http", "listening on " + config_.host + ":" + std::to_string(port_));
    return true;
}

bool HttpGateway::Serve() {
    return server_.listen_after_bind();
}

void HttpGateway::Stop() {
    server_.stop();
}

void HttpGateway::RegisterRoutes() {
    server_.Get("/api/files", [this](const httplib::Request& req, httplib::Response& res) {
        HandleListFiles(req, res);
    });
    server_.Post("/api/upload", [this](const httplib::Request& req, httplib::Response& res) {
        HandleUpload(req, res);
    });
    server_.Post("/api/delete", [this](const httplib::Request& req, httplib::Response& res) {
        HandleDelete(req, res);
    });
    server_.Post("/api/run", [this](const httplib::Request& req, httplib::Response& res) {
        HandleRun(req, res);
    });
    server_.Get(R"(/api/runs/([0-9a-fA-F\-]+)/events)", [this](const httplib::Request& req, httplib::Response& res) {
        HandleEvents(req, res);
    });
    server_.Post(R"(/api/runs/([0-9a-fA-F\-]+)/cancel)", [this](const httplib::Request& req, httplib::Response& res) {
        HandleCancel(req, res);
    });

    if (!config_.public_dir.empty() && !server_.set_mount_point("/", config_.public_dir)) {
        utils::LogWarn("http", "public directory " + config_.public_dir + " not found, static files disabled");
    }
}

bool HttpGateway::Authorize(const httplib::Request& req,
                            const nlohmann::json& body,
                            httplib::Response& res) const {
    auto token = req.get_header_value("X-Admin-Token");
    if (token.empty()) {
        token = BodyString(body, "token");
    }
    if (!gate_.IsAuthorized(token)) {
        SendError(res, 403, "forbidden");
        return false;
    }
    return true;
}

void HttpGateway::HandleListFiles(const httplib::Request&, httplib::Response& res) {
    nlohmann::json json = nlohmann::json::array();
    for (const auto& entry : store_.List()) {
        json.push_back({
            {"name", entry.name},
            {"size", entry.size},
            {"mtime", entry.mtime_ms}
        });
    }
    SendJson(res, 200, json);
}

void HttpGateway::HandleUpload(const httplib::Request& req, httplib::Response& res) {
    if (!req.has_file("file")) {
        SendError(res, 400, "no file");
        return;
    }
    const auto file = req.get_file_value("file");
    const auto stored = store_.Save(file.filename, file.content);
    if (!stored) {
        SendError(res, 500, "upload failed");
        return;
    }
    utils::LogInfo("http", "stored upload " + *stored + " (" + std::to_string(file.content.size()) + " bytes)");
    SendJson(res, 200, {{"ok", true}, {"filename", *stored}});
}

void HttpGateway::HandleDelete(const httplib::Request& req, httplib::Response& res) {
    const auto body = ParseBody(req);
    if (!Authorize(req, body, res)) {
        return;
    }
    const auto file_name = BodyString(body, "filename");
    if (file_name.empty()) {
        SendError(res, 400, "filename required");
        return;
    }
    if (!run::IsValidFileName(file_name)) {
        SendError(res, 400, "invalid filename");
        return;
    }
    const auto result = store_.Remove(file_name);
    switch (result.status) {
        case storage::RemoveStatus::kRemoved:
            SendJson(res, 200, {{"ok", true}});
            return;
        case storage::RemoveStatus::kNotFound:
            SendError(res, 404, "not found");
            return;
        case storage::RemoveStatus::kFailed:
            SendJson(res, 500, {{"error", "delete failed"}, {"detail", result.error}});
            return;
    }
}

void HttpGateway::HandleRun(const httplib::Request& req, httplib::Response& res) {
    const auto body = ParseBody(req);
    if (!Authorize(req, body, res)) {
        return;
    }
    run::RunRequest request{};
    request.file_name = BodyString(body, "filename");
    if (request.file_name.empty()) {
        SendError(res, 400, "filename required");
        return;
    }
    request.timeout_seconds = body.contains("timeoutSeconds")
        ? run::ParseTimeout(body["timeoutSeconds"])
        : run::kDefaultTimeoutSeconds;

    const auto result = runs_.Submit(request);
    switch (result.status) {
        case run::SubmitStatus::kAccepted:
            SendJson(res, 200, {{"ok", true}, {"runId", result.run_id}});
            return;
        case run::SubmitStatus::kInvalidFileName:
            SendError(res, 400, result.error);
            return;
        case run::SubmitStatus::kNotFound:
            SendError(res, 404, result.error);
            return;
    }
}

void HttpGateway::HandleEvents(const httplib::Request& req, httplib::Response& res) {
    const auto run_id = req.matches[1].str();
    auto subscription = runs_.Subscribe(run_id);
    if (!subscription) {
        SendError(res, 404, "run not found");
        return;
    }
    if (!streams_.TryAcquire(run_id)) {
        runs_.Unsubscribe(subscription);
        res.set_header("Retry-After", "5");
        SendError(res, 503, "too many open event streams");
        return;
    }
    res.set_header("Cache-Control", "no-cache");
    res.set_chunked_content_provider(
        "text/event-stream",
        [subscription](std::size_t, httplib::DataSink& sink) {
            bus::RunEvent event{};
            const auto result = subscription->Next(
                event,
                std::chrono::duration_cast<std::chrono::milliseconds>(kKeepAliveInterval));
            if (result == bus::Subscription::WaitResult::kClosed) {
                sink.done();
                return true;
            }
            const auto frame = result == bus::Subscription::WaitResult::kTimeout
                ? std::string(": keep-alive\n\n")
                : FormatFrame(event);
            return sink.write(frame.data(), frame.size());
        },
        [this, subscription, run_id](bool) {
            runs_.Unsubscribe(subscription);
            streams_.Release(run_id);
        });
}

void HttpGateway::HandleCancel(const httplib::Request& req, httplib::Response& res) {
    const auto body = ParseBody(req);
    if (!Authorize(req, body, res)) {
        return;
    }
    const auto run_id = req.matches[1].str();
    if (!runs_.Cancel(run_id)) {
        SendError(res, 404, "run not active");
        return;
    }
    SendJson(res, 200, {{"ok", true}});
}

}  // namespace scriptbox::server
