#include "health_server.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace {

// An idle keep-alive connection holds its worker for up to kIdleTimeoutSec.
constexpr size_t kWorkerThreads = 32;
constexpr size_t kKeepAliveMaxCount = 5;
constexpr time_t kReadTimeoutSec = 5;
constexpr time_t kWriteTimeoutSec = 5;
constexpr time_t kIdleTimeoutSec = 30;

void write_evaluation(const Evaluation& evaluation, const httplib::Request& req,
                      httplib::Response& res) {
    bool full = req.has_param("full") && req.get_param_value("full") == "1";
    res.status = evaluation.ok() ? 200 : 503;
    res.set_content(evaluation.to_json(full).dump() + "\n", "application/json");
}

std::unique_ptr<httplib::Server> make_server(const ServerOptions& options) {
    if (options.use_tls()) {
        return std::make_unique<httplib::SSLServer>(options.cert_path.c_str(), options.key_path.c_str());
    }
    return std::make_unique<httplib::Server>();
}

} // namespace

HealthServer::HealthServer(const ServerOptions& options, const HealthRegistry& registry)
    : options_(options)
    , registry_(registry)
    , server_(make_server(options))
{
    // fixed pool; these threads count against the thread-threshold check
    server_->new_task_queue = [] { return new httplib::ThreadPool(kWorkerThreads); };
    server_->set_read_timeout(kReadTimeoutSec, 0);
    server_->set_write_timeout(kWriteTimeoutSec, 0);
    server_->set_keep_alive_timeout(kIdleTimeoutSec);
    server_->set_keep_alive_max_count(kKeepAliveMaxCount);
}

HealthServer::~HealthServer() {
    stop();
}

void HealthServer::start() {
    if (running_) return;

    if (!server_->is_valid()) {
        throw std::runtime_error(fmt::format("Failed to load server certificate {} and key {}",
                                             options_.cert_path, options_.key_path));
    }

    setup_routes();

    if (options_.port == 0) {
        bound_port_ = server_->bind_to_any_port(options_.listen_addr);
        if (bound_port_ < 0) {
            throw std::runtime_error(fmt::format("Failed to bind health server on {}", options_.listen_addr));
        }
    } else {
        if (!server_->bind_to_port(options_.listen_addr, options_.port)) {
            throw std::runtime_error(fmt::format("Failed to bind health server on {}:{}",
                                                 options_.listen_addr, options_.port));
        }
        bound_port_ = options_.port;
    }

    running_ = true;
    failed_ = false;

    server_thread_ = std::thread([this]() {
        spdlog::info("Starting {} health server on {}:{}",
                     options_.use_tls() ? "HTTPS" : "HTTP", options_.listen_addr, bound_port_);
        bool clean = server_->listen_after_bind();

        if (running_.exchange(false)) {
            failed_ = true;
            spdlog::critical("Health server on port {} exited unexpectedly ({})",
                             bound_port_, clean ? "listener closed" : "accept failed");
        }
    });

    server_->wait_until_ready();
    spdlog::info("Health server started");
}

void HealthServer::stop() {
    bool was_running = running_.exchange(false);
    server_->stop();

    if (server_thread_.joinable()) {
        server_thread_.join();
    }

    if (was_running) {
        spdlog::info("Health server stopped");
    }
}

void HealthServer::route_all_methods(const std::string& pattern,
                                     const httplib::Server::Handler& handler) {
    // GET routes also answer HEAD
    server_->Get(pattern, handler);
    server_->Post(pattern, handler);
    server_->Put(pattern, handler);
    server_->Patch(pattern, handler);
    server_->Delete(pattern, handler);
    server_->Options(pattern, handler);
}

void HealthServer::setup_routes() {
    route_all_methods("/health",
        [this](const httplib::Request& req, httplib::Response& res) {
            handle_ready(req, res);
        });

    route_all_methods("/live",
        [this](const httplib::Request& req, httplib::Response& res) {
            handle_live(req, res);
        });

    server_->Get("/",
        [this](const httplib::Request& req, httplib::Response& res) {
            handle_root(req, res);
        });
}

void HealthServer::handle_ready(const httplib::Request& req, httplib::Response& res) {
    write_evaluation(registry_.evaluate_ready(), req, res);
}

void HealthServer::handle_live(const httplib::Request& req, httplib::Response& res) {
    write_evaluation(registry_.evaluate_liveness(), req, res);
}

void HealthServer::handle_root(const httplib::Request& req, httplib::Response& res) {
    // only HEAD checks the root path
    if (req.method != "HEAD") {
        res.status = 404;
        return;
    }
    handle_ready(req, res);
}
