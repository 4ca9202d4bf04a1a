#pragma once

#include "config.hpp"
#include "postgres_store.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <string>

// A check returns normally when healthy and throws a std::exception whose
// what() describes the failure otherwise.
using Check = std::function<void()>;

namespace checks {
    // GET url with TLS 1.2 or newer, trusting only tls.root_ca_file when set.
    // Redirects are never followed; anything but a 200 fails.
    Check https_get_check(const std::string& url, const TlsConfig& tls,
                          std::chrono::milliseconds timeout);

    // Opens and closes a TCP connection to "host:port".
    Check tcp_dial_check(const std::string& address, std::chrono::milliseconds timeout);

    Check database_ping_check(std::shared_ptr<PostgresStore> db,
                              std::chrono::milliseconds timeout);

    // Fails once the process runs more than threshold threads.
    Check thread_count_check(int threshold);

    // Runs check on its own thread and gives up waiting after timeout. A
    // call that overruns keeps running until it returns by itself.
    Check with_timeout(Check check, std::chrono::milliseconds timeout);

    int current_thread_count();
}
