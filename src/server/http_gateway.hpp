#pragma once

#include <string>

#include "config/config_schema.hpp"
#include "httplib.h"
#include "nlohmann/json.hpp"
#include "run/run_service.hpp"
#include "server/access_gate.hpp"
#include "server/stream_gate.hpp"
#include "storage/blob_store.hpp"

namespace scriptbox::server {

// HTTP front of the service: file management, run submission and a
// server-sent events stream per run.
class HttpGateway {
public:
    HttpGateway(const config::ServerConfig& config,
                storage::BlobStore& store,
                run::RunService& runs,
                AccessGate gate);

    HttpGateway(const HttpGateway&) = delete;
    HttpGateway& operator=(const HttpGateway&) = delete;

    // Blocks until Stop() is called. False when the socket cannot be bound.
    bool Listen();
    // Listen() in two steps. Port 0 binds to any free port.
    bool Bind();
    bool Serve();
    void Stop();

    int Port() const { return port_; }

private:
    void RegisterRoutes();
    void HandleListFiles(const httplib::Request& req, httplib::Response& res);
    void HandleUpload(const httplib::Request& req, httplib::Response& res);
    void HandleDelete(const httplib::Request& req, httplib::Response& res);
    void HandleRun(const httplib::Request& req, httplib::Response& res);
    void HandleEvents(const httplib::Request& req, httplib::Response& res);
    void HandleCancel(const httplib::Request& req, httplib::Response& res);

    bool Authorize(const httplib::Request& req, const nlohmann::json& body, httplib::Response& res) const;

    config::ServerConfig config_;
    storage::BlobStore& store_;
    run::RunService& runs_;
    AccessGate gate_;
    StreamGate streams_;
    httplib::Server server_;
    int port_ = 0;
};

}  // namespace scriptbox::server
