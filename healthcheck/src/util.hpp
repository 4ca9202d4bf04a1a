#pragma once

#include <string>
#include <utility>

namespace util {
    std::string redact_dsn(const std::string& dsn);

    // "host:port", with IPv6 literals bracketed ("[::1]:5671")
    std::string join_host_port(const std::string& host, int port);
    std::pair<std::string, std::string> split_host_port(const std::string& address);

    // scheme://host[:port][ready_path]; port 0 and an empty path are omitted
    std::string build_url(const std::string& base, int port, const std::string& path);
}
