#pragma once

#include "config.hpp"
#include "health_registry.hpp"
#include "health_server.hpp"
#include "postgres_store.hpp"
#include <memory>
#include <string>

// Knows where the storage backend, the broker and the database live and
// registers one check per dependency. Immutable once built.
class HealthCheck {
public:
    HealthCheck(int port,
                std::shared_ptr<PostgresStore> db,
                const Config& config,
                const TlsConfig& tls);

    const HealthRegistry& registry() const { return registry_; }
    ServerOptions server_options() const;

    const std::string& storage_url() const { return storage_url_; }
    const std::string& broker_address() const { return broker_address_; }

private:
    int port_;
    std::shared_ptr<PostgresStore> db_;
    std::string listen_addr_;
    std::string storage_url_;
    std::string broker_address_;
    TlsConfig tls_;
    std::string server_cert_;
    std::string server_key_;
    HealthRegistry registry_;

    void register_checks();
};
