#include "readiness/ReadinessGate.hpp"
#include "core/GatewayError.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <iostream>
#include <memory>
#include <thread>

using namespace dockgate;
using Clock = std::chrono::steady_clock;

static size_t discard_cb(void*, size_t size, size_t nmemb, void*) {
    return size * nmemb;
}

ReadinessGate::ReadinessGate(std::chrono::milliseconds poll_interval,
                             std::chrono::milliseconds attempt_timeout)
    : poll_(poll_interval), attempt_(attempt_timeout) {}

std::string ReadinessGate::probe_url(uint16_t host_port, const std::string& health_path) {
    size_t start = health_path.find_first_not_of('/');
    std::string path = (start == std::string::npos) ? std::string() : health_path.substr(start);
    return "http://127.0.0.1:" + std::to_string(host_port) + "/" + path;
}

// One GET, no auth, no custom headers. Redirects are not followed: a 3xx is
// not ready.
bool ReadinessGate::probe_once(const std::string& url, std::chrono::milliseconds timeout) {
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> c(curl_easy_init(), &curl_easy_cleanup);
    if (!c) return false;

    long timeout_ms = std::max<long>(1, static_cast<long>(timeout.count()));
    curl_easy_setopt(c.get(), CURLOPT_URL,               url.c_str());
    curl_easy_setopt(c.get(), CURLOPT_HTTPGET,           1L);
    curl_easy_setopt(c.get(), CURLOPT_TIMEOUT_MS,        timeout_ms);
    curl_easy_setopt(c.get(), CURLOPT_CONNECTTIMEOUT_MS, timeout_ms);
    curl_easy_setopt(c.get(), CURLOPT_NOSIGNAL,          1L);
    curl_easy_setopt(c.get(), CURLOPT_WRITEFUNCTION,     discard_cb);

    CURLcode res = curl_easy_perform(c.get());
    long http_code = 0;
    curl_easy_getinfo(c.get(), CURLINFO_RESPONSE_CODE, &http_code);

    return res == CURLE_OK && http_code >= 200 && http_code < 300;
}

void ReadinessGate::await_ready(uint16_t host_port,
                                const std::string& health_path,
                                std::chrono::milliseconds timeout) const {
    const std::string url = probe_url(host_port, health_path);
    const auto started  = Clock::now();
    const auto deadline = started + timeout;

    std::cout << "[READY] Probing " << url << " for up to " << timeout.count() << "ms\n";

    int attempts = 0;
    for (;;) {
        auto now = Clock::now();
        if (now >= deadline) break;

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        ++attempts;
        bool ok = probe_once(url, std::min(attempt_, remaining));

        // A success that lands after the deadline still counts as a timeout.
        now = Clock::now();
        if (ok && now <= deadline) {
            auto took = std::chrono::duration_cast<std::chrono::milliseconds>(now - started);
            std::cout << "[READY] " << url << " ready after " << took.count()
                      << "ms (" << attempts << " attempts)\n";
            return;
        }
        if (now >= deadline) break;

        auto wait = std::min(poll_, std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now));
        std::this_thread::sleep_for(wait);
    }

    std::cerr << "[READY] " << url << " not ready within " << timeout.count()
              << "ms (" << attempts << " attempts)\n";
    throw GatewayError(ErrorKind::ReadinessTimeout,
                       "service at " + url + " not ready within " +
                       std::to_string(timeout.count()) + "ms");
}
