#include "health.hpp"
#include "util.hpp"
#include <chrono>
#include <spdlog/spdlog.h>

namespace {

constexpr int kThreadThreshold = 100;
constexpr std::chrono::milliseconds kStorageTimeout{5000};
constexpr std::chrono::milliseconds kBrokerTimeout{5000};
constexpr std::chrono::milliseconds kDatabaseTimeout{1000};

} // namespace

HealthCheck::HealthCheck(int port,
                         std::shared_ptr<PostgresStore> db,
                         const Config& config,
                         const TlsConfig& tls)
    : port_(port)
    , db_(std::move(db))
    , listen_addr_(config.listen_addr)
    , storage_url_(util::build_url(config.s3_url, config.s3_port, config.s3_ready_path))
    , broker_address_(util::join_host_port(config.broker_host, config.broker_port))
    , tls_(tls)
    , server_cert_(config.server_cert)
    , server_key_(config.server_key)
{
    register_checks();
    spdlog::info("Health checks target storage {} and broker {}", storage_url_, broker_address_);
}

void HealthCheck::register_checks() {
    registry_.add_liveness_check("thread-threshold", checks::thread_count_check(kThreadThreshold));

    registry_.add_readiness_check("S3-backend-http",
                                  checks::https_get_check(storage_url_, tls_, kStorageTimeout));
    registry_.add_readiness_check("broker-tcp",
                                  checks::tcp_dial_check(broker_address_, kBrokerTimeout));
    registry_.add_readiness_check("database",
                                  checks::database_ping_check(db_, kDatabaseTimeout));
}

ServerOptions HealthCheck::server_options() const {
    ServerOptions options;
    options.listen_addr = listen_addr_;
    options.port = port_;
    options.cert_path = server_cert_;
    options.key_path = server_key_;
    return options;
}
