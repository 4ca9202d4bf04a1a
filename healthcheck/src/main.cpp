#include "config.hpp"
#include "health.hpp"
#include "health_server.hpp"
#include "postgres_store.hpp"
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <signal.h>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

std::atomic<bool> shutdown_requested{false};

void signal_handler(int) {
    shutdown_requested = true;
}

void setup_logging(const std::string& log_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("inbox-health", console_sink);

    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

int main() {
    CURLcode curl_rc = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (curl_rc != CURLE_OK) {
        spdlog::critical("Fatal error: curl_global_init failed: {}", curl_easy_strerror(curl_rc));
        return 1;
    }

    int exit_code = 0;
    try {
        auto config = Config::from_env();
        setup_logging(config.log_level);

        spdlog::info("==============================================");
        spdlog::info("Inbox Health Service v1.0");
        spdlog::info("==============================================");

        config.validate();

        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        auto pg = std::make_shared<PostgresStore>(config.pg_dsn);
        auto health = std::make_shared<HealthCheck>(config.health_port, pg, config, config.tls());

        HealthServer server(health->server_options(), health->registry());
        server.start();

        while (!shutdown_requested && server.is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        if (server.failed()) {
            throw std::runtime_error("health listener terminated");
        }

        spdlog::info("Received shutdown signal, stopping");
        server.stop();
        spdlog::info("Shutdown complete");

    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        exit_code = 1;
    }

    curl_global_cleanup();
    return exit_code;
}
