#include <catch2/catch_test_macros.hpp>
#include "../src/health.hpp"
#include <httplib.h>
#include <thread>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace {

Config base_config() {
    Config cfg;
    cfg.service_name = "inbox-health";
    cfg.log_level = "info";
    cfg.listen_addr = "127.0.0.1";
    cfg.health_port = 8888;
    cfg.pg_dsn = "host=127.0.0.1 port=1 dbname=sda user=inbox";
    cfg.s3_url = "https://s3.example.org";
    cfg.s3_port = 9000;
    cfg.s3_ready_path = "/minio/health/ready";
    cfg.broker_host = "mq.example.org";
    cfg.broker_port = 5671;
    return cfg;
}

} // namespace

TEST_CASE("Checker construction", "[health]") {
    auto db = std::make_shared<PostgresStore>("host=127.0.0.1 port=1 dbname=sda user=inbox");
    Config cfg = base_config();

    SECTION("Storage URL and broker address are assembled") {
        HealthCheck health(8888, db, cfg, TlsConfig{});
        REQUIRE(health.storage_url() == "https://s3.example.org:9000/minio/health/ready");
        REQUIRE(health.broker_address() == "mq.example.org:5671");
    }

    SECTION("Optional URL parts are omitted") {
        cfg.s3_port = 0;
        cfg.s3_ready_path = "";
        HealthCheck health(8888, db, cfg, TlsConfig{});
        REQUIRE(health.storage_url() == "https://s3.example.org");
    }

    SECTION("IPv6 broker") {
        cfg.broker_host = "fd00::5";
        HealthCheck health(8888, db, cfg, TlsConfig{});
        REQUIRE(health.broker_address() == "[fd00::5]:5671");
    }

    SECTION("Checks are registered by category") {
        HealthCheck health(8888, db, cfg, TlsConfig{});
        REQUIRE(health.registry().liveness_check_names() == std::vector<std::string>{"thread-threshold"});
        REQUIRE(health.registry().readiness_check_names()
                == std::vector<std::string>{"S3-backend-http", "broker-tcp", "database"});
    }

    SECTION("Server options carry port and certificate") {
        cfg.server_cert = "/certs/tls.crt";
        cfg.server_key = "/certs/tls.key";
        HealthCheck health(9999, db, cfg, TlsConfig{});

        auto options = health.server_options();
        REQUIRE(options.port == 9999);
        REQUIRE(options.listen_addr == "127.0.0.1");
        REQUIRE(options.use_tls());
    }

    SECTION("Plain HTTP without a certificate") {
        HealthCheck health(9999, db, cfg, TlsConfig{});
        REQUIRE_FALSE(health.server_options().use_tls());
    }
}

TEST_CASE("Readiness against local dependencies", "[health]") {
    httplib::Server storage;
    storage.new_task_queue = [] { return new httplib::ThreadPool(4); };
    storage.Get("/ready", [](const httplib::Request&, httplib::Response& res) {
        res.set_content("ok", "text/plain");
    });
    int storage_port = storage.bind_to_any_port("127.0.0.1");
    std::thread storage_thread([&storage]() { storage.listen_after_bind(); });
    storage.wait_until_ready();

    int broker_fd = ::socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    REQUIRE(::bind(broker_fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
    REQUIRE(::listen(broker_fd, 4) == 0);
    socklen_t len = sizeof(addr);
    REQUIRE(::getsockname(broker_fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0);

    Config cfg = base_config();
    cfg.s3_url = "http://127.0.0.1";
    cfg.s3_port = storage_port;
    cfg.s3_ready_path = "/ready";
    cfg.broker_host = "127.0.0.1";
    cfg.broker_port = ntohs(addr.sin_port);

    auto db = std::make_shared<PostgresStore>(cfg.pg_dsn);
    HealthCheck health(0, db, cfg, cfg.tls());

    auto evaluation = health.registry().evaluate_readiness();
    REQUIRE_FALSE(evaluation.ok());
    REQUIRE(evaluation.failing_checks() == std::vector<std::string>{"database"});

    REQUIRE(health.registry().evaluate_liveness().ok());

    ::close(broker_fd);
    storage.stop();
    storage_thread.join();
}
