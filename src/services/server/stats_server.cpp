/// @file stats_server.cpp
/// @brief Minimal HTTP health/metrics/stats server implementation.
///
/// Uses POSIX sockets for a single-threaded, poll-based HTTP responder.

#include "sluice/service/stats_server.hpp"

#include "sluice/foundation/json_log_formatter.hpp"
#include "sluice/foundation/sluice_error.hpp"
#include "sluice/foundation/sluice_logger.hpp"
#include "sluice/foundation/sluice_metrics.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>

// POSIX socket headers
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace sluice::service {

using sluice::foundation::ErrorCode;
using sluice::foundation::LogCategory;
using sluice::foundation::SluiceError;
using sluice::foundation::SluiceResult;

namespace {

/// Format HealthCheckResult as JSON.
std::string healthToJson(const foundation::HealthCheckResult& result,
                         std::chrono::seconds uptime) {
    std::string out = R"({"status":")";
    out += foundation::toString(result.status);
    out += R"(","service":)";
    foundation::appendJsonString(out, result.serviceName);
    out += R"(,"uptime_seconds":)" + std::to_string(uptime.count());

    if (!result.components.empty()) {
        out += R"(,"components":{)";
        bool first = true;
        for (const auto& [name, status] : result.components) {
            if (!first) {
                out += ',';
            }
            first = false;
            foundation::appendJsonString(out, name);
            out += ":\"";
            out += foundation::toString(status);
            out += '"';
        }
        out += '}';
    }

    out += '}';
    return out;
}

/// Build a minimal HTTP response.
std::string httpResponse(int statusCode, std::string_view contentType, std::string_view body) {
    std::ostringstream out;
    out << "HTTP/1.1 " << statusCode;
    switch (statusCode) {
        case 200: out << " OK"; break;
        case 404: out << " Not Found"; break;
        case 500: out << " Internal Server Error"; break;
        case 503: out << " Service Unavailable"; break;
        default:  out << " Error"; break;
    }
    out << "\r\nContent-Type: " << contentType
        << "\r\nContent-Length: " << body.size()
        << "\r\nConnection: close"
        << "\r\n\r\n"
        << body;
    return out.str();
}

/// Extract the request path from an HTTP request line, without query.
/// e.g., "GET /stats?x=1 HTTP/1.1\r\n..." -> "/stats"
std::string_view extractPath(std::string_view request) {
    auto methodEnd = request.find(' ');
    if (methodEnd == std::string_view::npos) { return "/"; }
    auto pathStart = methodEnd + 1;
    auto pathEnd = request.find_first_of(" ?", pathStart);
    if (pathEnd == std::string_view::npos) { return "/"; }
    return request.substr(pathStart, pathEnd - pathStart);
}

void sendAll(int fd, std::string_view data) {
    while (!data.empty()) {
        auto written = ::send(fd, data.data(), data.size(), MSG_NOSIGNAL);
        if (written < 0 && errno == EINTR) {
            continue;
        }
        if (written <= 0) {
            return;
        }
        data.remove_prefix(static_cast<std::size_t>(written));
    }
}

} // anonymous namespace

// ── Impl ────────────────────────────────────────────────────────────────────

struct StatsServer::Impl {
    StatsServerConfig config;
    foundation::SluiceMetrics& metrics;
    StatsProvider statsProvider;
    std::atomic<bool> running{false};
    std::atomic<bool> ready{false};
    std::atomic<uint16_t> boundPort{0};
    std::thread serverThread;
    int listenFd{-1};
    std::chrono::steady_clock::time_point startTime{};

    Impl(StatsServerConfig cfg, foundation::SluiceMetrics& m)
        : config(std::move(cfg)), metrics(m), boundPort(config.port) {}

    void run() {
        while (running.load(std::memory_order_relaxed)) {
            struct pollfd pfd{};
            pfd.fd = listenFd;
            pfd.events = POLLIN;

            // 500ms timeout keeps shutdown responsive.
            int ret = poll(&pfd, 1, 500);
            if (ret <= 0) { continue; }

            if ((pfd.revents & POLLIN) == 0) { continue; }

            int clientFd = accept(listenFd, nullptr, nullptr);
            if (clientFd < 0) { continue; }

            handleClient(clientFd);
            close(clientFd);
        }
    }

    [[nodiscard]] std::string healthBody() const {
        auto health = metrics.healthCheck();
        health.serviceName = config.serviceName;
        auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::steady_clock::now() - startTime);
        return healthToJson(health, uptime);
    }

    void handleClient(int clientFd) {
        // Only the request line matters.
        std::array<char, 1024> buf{};
        auto bytesRead = read(clientFd, buf.data(), buf.size() - 1);
        if (bytesRead <= 0) { return; }

        std::string_view request(buf.data(), static_cast<std::size_t>(bytesRead));
        auto path = extractPath(request);

        std::string response;

        if (path == "/healthz") {
            response = httpResponse(200, "application/json", healthBody());
        } else if (path == "/readyz") {
            if (ready.load(std::memory_order_relaxed)) {
                response = httpResponse(200, "application/json", healthBody());
            } else {
                std::string body = R"({"status":"not_ready","service":)";
                foundation::appendJsonString(body, config.serviceName);
                body += '}';
                response = httpResponse(503, "application/json", body);
            }
        } else if (path == "/metrics") {
            response = httpResponse(200, "text/plain; version=0.0.4; charset=utf-8",
                                    metrics.scrape());
        } else if (path == "/stats" && statsProvider) {
            try {
                response = httpResponse(200, "application/json", statsProvider());
            } catch (const std::exception& e) {
                SLUICE_LOG_ERROR(LogCategory::Core, std::string("stats provider threw: ") + e.what());
                response = httpResponse(500, "application/json", R"({"error":"stats unavailable"})");
            }
        } else {
            response = httpResponse(404, "text/plain", "Not Found");
        }

        sendAll(clientFd, response);
    }
};

// ── Public API ──────────────────────────────────────────────────────────────

StatsServer::StatsServer(StatsServerConfig config, foundation::SluiceMetrics& metrics)
    : impl_(std::make_unique<Impl>(std::move(config), metrics)) {}

StatsServer::~StatsServer() {
    stop();
}

SluiceResult<void> StatsServer::start() {
    if (impl_->running.load()) {
        return SluiceResult<void>::ok();
    }

    impl_->listenFd = socket(AF_INET, SOCK_STREAM, 0);
    if (impl_->listenFd < 0) {
        return SluiceResult<void>::err(
            SluiceError(ErrorCode::ListenFailed,
                        std::string("failed to create stats server socket: ") + std::strerror(errno)));
    }

    int optval = 1;
    setsockopt(impl_->listenFd, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval));

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(impl_->config.port);

    if (bind(impl_->listenFd,
             reinterpret_cast<struct sockaddr*>(&addr),  // NOLINT
             sizeof(addr)) < 0) {
        auto reason = std::string(std::strerror(errno));
        close(impl_->listenFd);
        impl_->listenFd = -1;
        return SluiceResult<void>::err(
            SluiceError(ErrorCode::ListenFailed,
                        "failed to bind stats server on port " +
                            std::to_string(impl_->config.port) + ": " + reason));
    }

    // Small backlog: probes, scrapers and operators only.
    if (listen(impl_->listenFd, 8) < 0) {
        close(impl_->listenFd);
        impl_->listenFd = -1;
        return SluiceResult<void>::err(
            SluiceError(ErrorCode::ListenFailed, "failed to listen on stats server socket"));
    }

    struct sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (getsockname(impl_->listenFd, reinterpret_cast<struct sockaddr*>(&bound), &len) == 0) {  // NOLINT
        impl_->boundPort.store(ntohs(bound.sin_port));
    }

    impl_->startTime = std::chrono::steady_clock::now();
    impl_->running.store(true, std::memory_order_relaxed);
    impl_->serverThread = std::thread([this]() { impl_->run(); });

    SLUICE_LOG_INFO(LogCategory::Core,
                    "stats server listening on port " + std::to_string(impl_->boundPort.load()));
    return SluiceResult<void>::ok();
}

void StatsServer::stop() {
    if (!impl_->running.load(std::memory_order_relaxed)) {
        return;
    }

    impl_->running.store(false, std::memory_order_relaxed);

    if (impl_->serverThread.joinable()) {
        impl_->serverThread.join();
    }

    if (impl_->listenFd >= 0) {
        close(impl_->listenFd);
        impl_->listenFd = -1;
    }
}

void StatsServer::setReady(bool ready) {
    impl_->ready.store(ready, std::memory_order_relaxed);
    impl_->metrics.setGauge("sluice_ready", ready ? 1.0 : 0.0);
}

void StatsServer::setStatsProvider(StatsProvider provider) {
    impl_->statsProvider = std::move(provider);
}

bool StatsServer::isRunning() const {
    return impl_->running.load(std::memory_order_relaxed);
}

uint16_t StatsServer::port() const {
    return impl_->boundPort.load();
}

} // namespace sluice::service
