#include "config.hpp"
#include <spdlog/spdlog.h>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* value = std::getenv(name);
    if (!value || *value == '\0') {
        return default_val;
    }

    std::size_t consumed = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(value, &consumed);
    } catch (const std::exception&) {
        throw std::runtime_error(fmt::format("Invalid integer value for env var {}: {}", name, value));
    }
    if (value[consumed] != '\0') {
        throw std::runtime_error(fmt::format("Invalid integer value for env var {}: {}", name, value));
    }
    return parsed;
}

Config Config::from_env() {
    Config cfg;

    cfg.service_name = get_env("SERVICE_NAME", "inbox-health");
    cfg.log_level = get_env("LOG_LEVEL", "info");

    cfg.listen_addr = get_env("LISTEN_ADDR", "0.0.0.0");
    cfg.health_port = get_env_int("HEALTH_PORT", 8888);
    cfg.server_cert = get_env("SERVER_CERT");
    cfg.server_key = get_env("SERVER_KEY");

    cfg.pg_dsn = get_env("PG_DSN");

    cfg.s3_url = get_env("INBOX_S3_URL");
    cfg.s3_port = get_env_int("INBOX_S3_PORT", 0);
    cfg.s3_ready_path = get_env("INBOX_S3_READYPATH");
    cfg.s3_ca_cert = get_env("INBOX_S3_CACERT");

    cfg.broker_host = get_env("BROKER_HOST");
    cfg.broker_port = get_env_int("BROKER_PORT", 5671);

    return cfg;
}

void Config::validate() const {
    if (pg_dsn.empty()) {
        throw std::runtime_error("PG_DSN is required");
    }

    if (s3_url.empty()) {
        throw std::runtime_error("INBOX_S3_URL is required");
    }

    if (broker_host.empty()) {
        throw std::runtime_error("BROKER_HOST is required");
    }

    if (health_port <= 0 || health_port > 65535) {
        throw std::runtime_error("HEALTH_PORT must be between 1 and 65535");
    }

    if (s3_port < 0 || s3_port > 65535) {
        throw std::runtime_error("INBOX_S3_PORT must be between 0 and 65535");
    }

    if (broker_port <= 0 || broker_port > 65535) {
        throw std::runtime_error("BROKER_PORT must be between 1 and 65535");
    }

    if (server_cert.empty() != server_key.empty()) {
        spdlog::warn("Only one of SERVER_CERT and SERVER_KEY is set, serving plain HTTP");
    }

    spdlog::info("Configuration validated");
}

TlsConfig Config::tls() const {
    return TlsConfig{s3_ca_cert};
}
