#pragma once

#include <chrono>
#include <string>
#include <pqxx/pqxx>

// DSN used for pings: the connect attempt and every statement are bounded
// by timeout, so an abandoned ping ends on its own shortly after.
std::string ping_connection_string(const std::string& dsn, std::chrono::milliseconds timeout);

// Database handle shared by the readiness checks. Every ping opens its own
// connection, so a single store can be pinged from many threads at once.
class PostgresStore {
public:
    explicit PostgresStore(const std::string& dsn);

    // Throws the libpqxx error when the server cannot be reached or the
    // query fails.
    void ping(std::chrono::milliseconds timeout);

    const std::string& dsn() const { return dsn_; }

private:
    std::string dsn_;

    pqxx::connection make_connection(std::chrono::milliseconds timeout);
};
