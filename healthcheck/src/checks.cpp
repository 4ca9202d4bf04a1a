#include "checks.hpp"
#include "util.hpp"
#include <curl/curl.h>
#include <fmt/format.h>
#include <cerrno>
#include <fstream>
#include <future>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace {

struct CurlDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

struct AddrInfoDeleter {
    void operator()(addrinfo* info) const { freeaddrinfo(info); }
};

class ScopedSocket {
public:
    explicit ScopedSocket(int fd) : fd_(fd) {}
    ~ScopedSocket() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }
    ScopedSocket(const ScopedSocket&) = delete;
    ScopedSocket& operator=(const ScopedSocket&) = delete;

    int get() const { return fd_; }

private:
    int fd_;
};

size_t discard_body(char*, size_t size, size_t nmemb, void*) {
    return size * nmemb;
}

template <typename T>
void set_option(CURL* curl, CURLoption option, T value) {
    CURLcode rc = curl_easy_setopt(curl, option, value);
    if (rc != CURLE_OK) {
        throw std::runtime_error(fmt::format("curl option {} rejected: {}",
                                             static_cast<int>(option), curl_easy_strerror(rc)));
    }
}

std::string errno_message(int err) {
    return std::error_code(err, std::generic_category()).message();
}

void https_get(const std::string& url, const TlsConfig& tls, std::chrono::milliseconds timeout) {
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        throw std::runtime_error("Failed to initialize CURL");
    }

    char errbuf[CURL_ERROR_SIZE] = {0};

    set_option(curl.get(), CURLOPT_URL, url.c_str());
    set_option(curl.get(), CURLOPT_HTTPGET, 1L);
    set_option(curl.get(), CURLOPT_FOLLOWLOCATION, 0L);
    set_option(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    set_option(curl.get(), CURLOPT_NOSIGNAL, 1L);
    set_option(curl.get(), CURLOPT_SSLVERSION, static_cast<long>(CURL_SSLVERSION_TLSv1_2));
    set_option(curl.get(), CURLOPT_WRITEFUNCTION, discard_body);
    set_option(curl.get(), CURLOPT_ERRORBUFFER, errbuf);

    if (!tls.root_ca_file.empty()) {
        set_option(curl.get(), CURLOPT_CAINFO, tls.root_ca_file.c_str());
        // keep the system CA directory out of the trust decision
        set_option(curl.get(), CURLOPT_CAPATH, static_cast<const char*>(nullptr));
    }

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        std::string detail = errbuf[0] != '\0' ? std::string(errbuf) : curl_easy_strerror(res);
        throw std::runtime_error(fmt::format("Get \"{}\": {}", url, detail));
    }

    long status = 0;
    res = curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    if (res != CURLE_OK) {
        throw std::runtime_error(fmt::format("Get \"{}\": {}", url, curl_easy_strerror(res)));
    }

    if (status != 200) {
        throw std::runtime_error(fmt::format("returned status {}", status));
    }
}

void dial_tcp(const std::string& address, std::chrono::milliseconds timeout) {
    using clock = std::chrono::steady_clock;
    auto deadline = clock::now() + timeout;

    auto [host, port] = util::split_host_port(address);

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* found = nullptr;
    int rc = getaddrinfo(host.c_str(), port.c_str(), &hints, &found);
    if (rc != 0) {
        throw std::runtime_error(fmt::format("dial tcp {}: lookup {}: {}", address, host, gai_strerror(rc)));
    }
    std::unique_ptr<addrinfo, AddrInfoDeleter> addresses(found);

    std::string last_error = "no addresses found";
    for (addrinfo* ai = addresses.get(); ai != nullptr; ai = ai->ai_next) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now());
        if (remaining.count() <= 0) {
            last_error = "i/o timeout";
            break;
        }

        ScopedSocket sock(::socket(ai->ai_family, ai->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC,
                                   ai->ai_protocol));
        if (sock.get() < 0) {
            last_error = errno_message(errno);
            continue;
        }

        if (::connect(sock.get(), ai->ai_addr, ai->ai_addrlen) == 0) {
            return;
        }
        if (errno != EINPROGRESS) {
            last_error = errno_message(errno);
            continue;
        }

        pollfd pfd{sock.get(), POLLOUT, 0};
        int ready = 0;
        do {
            remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now());
            ready = ::poll(&pfd, 1, remaining.count() > 0 ? static_cast<int>(remaining.count()) : 0);
        } while (ready < 0 && errno == EINTR);

        if (ready == 0) {
            last_error = "i/o timeout";
            continue;
        }
        if (ready < 0) {
            last_error = errno_message(errno);
            continue;
        }

        int so_error = 0;
        socklen_t len = sizeof(so_error);
        if (::getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, &so_error, &len) < 0) {
            last_error = errno_message(errno);
            continue;
        }
        if (so_error == 0) {
            return;
        }
        last_error = errno_message(so_error);
    }

    throw std::runtime_error(fmt::format("dial tcp {}: {}", address, last_error));
}

} // namespace

namespace checks {

Check https_get_check(const std::string& url, const TlsConfig& tls,
                      std::chrono::milliseconds timeout) {
    return [url, tls, timeout]() {
        https_get(url, tls, timeout);
    };
}

Check tcp_dial_check(const std::string& address, std::chrono::milliseconds timeout) {
    return [address, timeout]() {
        dial_tcp(address, timeout);
    };
}

Check database_ping_check(std::shared_ptr<PostgresStore> db,
                          std::chrono::milliseconds timeout) {
    return with_timeout([db, timeout]() { db->ping(timeout); }, timeout);
}

Check thread_count_check(int threshold) {
    return [threshold]() {
        int count = current_thread_count();
        if (count > threshold) {
            throw std::runtime_error(fmt::format("too many threads ({} > {})", count, threshold));
        }
    };
}

Check with_timeout(Check check, std::chrono::milliseconds timeout) {
    return [check, timeout]() {
        auto task = std::make_shared<std::packaged_task<void()>>(check);
        auto result = task->get_future();

        std::thread([task]() { (*task)(); }).detach();

        if (result.wait_for(timeout) == std::future_status::timeout) {
            throw std::runtime_error(fmt::format("timed out after {}ms", timeout.count()));
        }
        result.get();
    };
}

int current_thread_count() {
    std::ifstream status("/proc/self/status");
    if (!status) {
        throw std::runtime_error("cannot open /proc/self/status");
    }

    std::string line;
    while (std::getline(status, line)) {
        if (line.rfind("Threads:", 0) == 0) {
            return std::stoi(line.substr(8));
        }
    }

    throw std::runtime_error("Threads entry missing from /proc/self/status");
}

} // namespace checks
