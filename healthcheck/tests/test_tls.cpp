#include <catch2/catch_test_macros.hpp>
#include "tls_certs.hpp"
#include "../src/checks.hpp"
#include "../src/health_server.hpp"
#include <httplib.h>
#include <memory>
#include <stdexcept>
#include <thread>

using namespace std::chrono_literals;

namespace {

std::string failure_of(const Check& check) {
    try {
        check();
        return "";
    } catch (const std::exception& e) {
        return e.what();
    }
}

// HTTPS storage double serving /ready.
class TlsStorage {
public:
    explicit TlsStorage(std::unique_ptr<httplib::SSLServer> server)
        : server_(std::move(server))
    {
        if (!server_->is_valid()) {
            throw std::runtime_error("TLS storage failed to load its certificate");
        }
        server_->new_task_queue = [] { return new httplib::ThreadPool(2); };
        server_->Get("/ready", [](const httplib::Request&, httplib::Response& res) {
            res.set_content("ok", "text/plain");
        });

        port_ = server_->bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this]() { server_->listen_after_bind(); });
        server_->wait_until_ready();
    }

    ~TlsStorage() {
        server_->stop();
        thread_.join();
    }

    std::string url(const std::string& path) const {
        return "https://127.0.0.1:" + std::to_string(port_) + path;
    }

private:
    std::unique_ptr<httplib::SSLServer> server_;
    int port_ = 0;
    std::thread thread_;
};

std::unique_ptr<httplib::SSLServer> signed_server(const TestCertificates& certs) {
    return std::make_unique<httplib::SSLServer>(certs.server_cert_path().c_str(),
                                                certs.server_key_path().c_str());
}

// Same certificate, but the server refuses to negotiate anything above TLS 1.1.
std::unique_ptr<httplib::SSLServer> legacy_server(const TestCertificates& certs) {
    std::string cert = certs.server_cert_path();
    std::string key = certs.server_key_path();
    return std::make_unique<httplib::SSLServer>([cert, key](SSL_CTX& ctx) {
        SSL_CTX_set_security_level(&ctx, 0);
        return SSL_CTX_set_min_proto_version(&ctx, TLS1_VERSION) == 1 &&
               SSL_CTX_set_max_proto_version(&ctx, TLS1_1_VERSION) == 1 &&
               SSL_CTX_use_certificate_chain_file(&ctx, cert.c_str()) == 1 &&
               SSL_CTX_use_PrivateKey_file(&ctx, key.c_str(), SSL_FILETYPE_PEM) == 1;
    });
}

} // namespace

TEST_CASE("Storage check over TLS", "[checks][storage][tls]") {
    TestCertificates certs;

    SECTION("Server signed by the configured CA passes") {
        TlsStorage storage(signed_server(certs));
        auto check = checks::https_get_check(storage.url("/ready"), TlsConfig{certs.ca_path()}, 5000ms);
        REQUIRE(failure_of(check) == "");
    }

    SECTION("Server signed by another CA fails verification") {
        TlsStorage storage(signed_server(certs));
        auto check = checks::https_get_check(storage.url("/ready"), TlsConfig{certs.other_ca_path()}, 5000ms);
        auto error = failure_of(check);
        REQUIRE(error.find("Get \"" + storage.url("/ready") + "\": ") == 0);
        REQUIRE(error.find("certificate") != std::string::npos);
    }

    SECTION("Missing CA bundle fails") {
        TlsStorage storage(signed_server(certs));
        auto check = checks::https_get_check(storage.url("/ready"), TlsConfig{"/nonexistent/ca.pem"}, 5000ms);
        REQUIRE_FALSE(failure_of(check).empty());
    }

    SECTION("Protocols below TLS 1.2 are refused") {
        TlsStorage storage(legacy_server(certs));
        auto check = checks::https_get_check(storage.url("/ready"), TlsConfig{certs.ca_path()}, 5000ms);
        REQUIRE_FALSE(failure_of(check).empty());
    }
}

TEST_CASE("Health server over TLS", "[server][tls]") {
    TestCertificates certs;

    HealthRegistry registry;
    registry.add_readiness_check("database", []() {});

    ServerOptions options;
    options.listen_addr = "127.0.0.1";
    options.port = 0;
    options.cert_path = certs.server_cert_path();
    options.key_path = certs.server_key_path();
    REQUIRE(options.use_tls());

    HealthServer server(options, registry);
    server.start();
    REQUIRE(server.is_running());

    SECTION("Client trusting the CA gets the report") {
        httplib::SSLClient client("127.0.0.1", server.port());
        client.set_ca_cert_path(certs.ca_path().c_str());
        client.enable_server_certificate_verification(true);

        auto res = client.Get("/health");
        REQUIRE(res);
        REQUIRE(res->status == 200);
        REQUIRE(nlohmann::json::parse(res->body) == nlohmann::json::object());

        auto head = client.Head("/");
        REQUIRE(head);
        REQUIRE(head->status == 200);
    }

    SECTION("Client trusting another CA is rejected") {
        httplib::SSLClient client("127.0.0.1", server.port());
        client.set_ca_cert_path(certs.other_ca_path().c_str());
        client.enable_server_certificate_verification(true);

        auto res = client.Get("/health");
        REQUIRE_FALSE(res);
    }

    SECTION("Plain HTTP is not served") {
        httplib::Client client("127.0.0.1", server.port());
        client.set_read_timeout(2, 0);
        auto res = client.Get("/health");
        REQUIRE_FALSE(res);
    }

    server.stop();
    REQUIRE_FALSE(server.failed());
}
