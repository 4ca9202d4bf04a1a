#pragma once

#include "health_registry.hpp"
#include <httplib.h>
#include <atomic>
#include <memory>
#include <string>
#include <thread>

struct ServerOptions {
    std::string listen_addr = "0.0.0.0";
    int port = 0;  // 0 picks an ephemeral port
    std::string cert_path;
    std::string key_path;

    bool use_tls() const { return !cert_path.empty() && !key_path.empty(); }
};

// Serves a registry over HTTP:
//   /health  any method, readiness and liveness checks together
//   /live    any method, liveness only
//   /        HEAD only, same evaluation as GET /health; 404 otherwise
// 200 when every check passes, 503 with a JSON body of failing checks
// otherwise. "?full=1" lists passing checks as well.
//
// Connection limits: 5 s per socket read or write, 30 s keep-alive idle,
// 5 requests per keep-alive connection, 32 workers.
// httplib has no separate header deadline, so the 3 s read-header limit is
// not enforced; header reads fall under the 5 s per-read timeout.
class HealthServer {
public:
    HealthServer(const ServerOptions& options, const HealthRegistry& registry);
    ~HealthServer();

    HealthServer(const HealthServer&) = delete;
    HealthServer& operator=(const HealthServer&) = delete;

    // Binds and starts serving on a background thread. Throws
    // std::runtime_error when the certificate cannot be loaded or the
    // address cannot be bound.
    void start();
    void stop();

    bool is_running() const { return running_; }
    // True once the listener exited without stop() being called.
    bool failed() const { return failed_; }
    int port() const { return bound_port_; }

private:
    ServerOptions options_;
    const HealthRegistry& registry_;

    std::unique_ptr<httplib::Server> server_;
    std::atomic<bool> running_{false};
    std::atomic<bool> failed_{false};
    int bound_port_ = 0;
    std::thread server_thread_;

    void setup_routes();
    void route_all_methods(const std::string& pattern, const httplib::Server::Handler& handler);
    void handle_ready(const httplib::Request& req, httplib::Response& res);
    void handle_live(const httplib::Request& req, httplib::Response& res);
    void handle_root(const httplib::Request& req, httplib::Response& res);
};
