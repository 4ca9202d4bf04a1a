#pragma once

#include <string>
#include <cstdlib>
#include <stdexcept>

// Trust material for outbound TLS. An empty bundle leaves curl on its
// built-in store.
struct TlsConfig {
    std::string root_ca_file;
};

struct Config {
    // Service
    std::string service_name;
    std::string log_level;

    // HTTP server
    std::string listen_addr;
    int health_port;
    std::string server_cert;
    std::string server_key;

    // Database
    std::string pg_dsn;

    // Object storage
    std::string s3_url;
    int s3_port;
    std::string s3_ready_path;
    std::string s3_ca_cert;

    // Broker
    std::string broker_host;
    int broker_port;

    static Config from_env();
    void validate() const;

    TlsConfig tls() const;

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
};
