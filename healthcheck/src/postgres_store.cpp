#include "postgres_store.hpp"
#include "util.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

std::string ping_connection_string(const std::string& dsn, std::chrono::milliseconds timeout) {
    // libpq only honours whole seconds and treats anything below 2 as 2.
    auto seconds = std::max<long long>(2, (timeout.count() + 999) / 1000);
    std::string connect = "connect_timeout=" + std::to_string(seconds);
    std::string statement_ms = std::to_string(timeout.count());

    if (dsn.find("://") != std::string::npos) {
        return dsn + (dsn.find('?') == std::string::npos ? "?" : "&")
            + connect + "&options=-c%20statement_timeout%3D" + statement_ms;
    }
    std::string params = connect + " options='-c statement_timeout=" + statement_ms + "'";
    return dsn.empty() ? params : dsn + " " + params;
}

PostgresStore::PostgresStore(const std::string& dsn) : dsn_(dsn) {
    spdlog::info("PostgresStore initialized: {}", util::redact_dsn(dsn));
}

pqxx::connection PostgresStore::make_connection(std::chrono::milliseconds timeout) {
    return pqxx::connection(ping_connection_string(dsn_, timeout));
}

void PostgresStore::ping(std::chrono::milliseconds timeout) {
    auto conn = make_connection(timeout);
    pqxx::work txn(conn);
    txn.exec("SELECT 1");
    txn.commit();
}
