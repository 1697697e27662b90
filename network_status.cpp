#include "network_status.hpp"
#include "logger.hpp"

#include <cpr/cpr.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>

namespace {
    using Clock = std::chrono::steady_clock;

    std::mutex g_mtx;
    std::string g_url = "http://localhost:3002/health";
    int g_timeoutMs = 2000;
    int g_cacheMs = 5000;
    NetworkStatus::HealthCheck g_healthCheck;

    std::optional<bool> g_lastStatus;
    Clock::time_point g_lastCheck;

    std::map<int, NetworkStatus::Listener> g_listeners;
    int g_nextListenerId = 1;

    std::mutex g_monitorMtx;
    std::condition_variable g_monitorCv;
    std::thread g_monitor;
    std::atomic<bool> g_monitoring{false};

    bool httpHealthCheck(const std::string& url, int timeoutMs) {
        auto r = cpr::Get(cpr::Url{url}, cpr::Timeout{timeoutMs});
        if (r.error) {
            LOG_TRACE("Network", "Health check failed: " + r.error.message);
            return false;
        }
        return r.status_code >= 200 && r.status_code < 300;
    }

    bool runHealthCheck() {
        std::string url;
        int timeoutMs;
        NetworkStatus::HealthCheck check;
        {
            std::lock_guard<std::mutex> lock(g_mtx);
            url = g_url;
            timeoutMs = g_timeoutMs;
            check = g_healthCheck;
        }

        bool ok = check ? check(url, timeoutMs) : httpHealthCheck(url, timeoutMs);

        std::optional<bool> previous;
        {
            std::lock_guard<std::mutex> lock(g_mtx);
            previous = g_lastStatus;
            g_lastStatus = ok;
            g_lastCheck = Clock::now();
        }
        if (previous != ok) {
            LOG_DEBUG("Network", std::string("Backend ") + (ok ? "available" : "unreachable") + " (" + url + ")");
        }
        return ok;
    }

    void notifyListeners(bool available) {
        std::map<int, NetworkStatus::Listener> listeners;
        {
            std::lock_guard<std::mutex> lock(g_mtx);
            listeners = g_listeners;
        }
        for (auto& [id, listener] : listeners) {
            if (listener) listener(available);
        }
    }
}

namespace NetworkStatus {

void configure(const std::string& healthUrl, int timeoutMs, int cacheMs) {
    std::lock_guard<std::mutex> lock(g_mtx);
    g_url = healthUrl;
    g_timeoutMs = timeoutMs > 0 ? timeoutMs : 2000;
    g_cacheMs = cacheMs >= 0 ? cacheMs : 5000;
    g_lastStatus.reset();
}

void setHealthCheck(HealthCheck check) {
    std::lock_guard<std::mutex> lock(g_mtx);
    g_healthCheck = std::move(check);
}

bool isBackendAvailable() {
    {
        std::lock_guard<std::mutex> lock(g_mtx);
        if (g_lastStatus.has_value() &&
            Clock::now() - g_lastCheck < std::chrono::milliseconds(g_cacheMs)) {
            return *g_lastStatus;
        }
    }
    return runHealthCheck();
}

bool forceHealthCheck() {
    {
        std::lock_guard<std::mutex> lock(g_mtx);
        g_lastStatus.reset();
    }
    return runHealthCheck();
}

std::optional<bool> lastKnownStatus() {
    std::lock_guard<std::mutex> lock(g_mtx);
    return g_lastStatus;
}

long long msSinceLastCheck() {
    std::lock_guard<std::mutex> lock(g_mtx);
    if (g_lastCheck == Clock::time_point{}) return -1;
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - g_lastCheck).count();
}

int addListener(Listener listener) {
    std::lock_guard<std::mutex> lock(g_mtx);
    int id = g_nextListenerId++;
    g_listeners[id] = std::move(listener);
    return id;
}

void removeListener(int id) {
    std::lock_guard<std::mutex> lock(g_mtx);
    g_listeners.erase(id);
}

void startMonitoring(int intervalMs) {
    if (g_monitoring.exchange(true)) return;
    if (intervalMs <= 0) intervalMs = 10000;

    g_monitor = std::thread([intervalMs]() {
        LOG_DEBUG("Network", "Health monitoring every " + std::to_string(intervalMs) + " ms");
        std::unique_lock<std::mutex> lock(g_monitorMtx);
        while (g_monitoring) {
            if (g_monitorCv.wait_for(lock, std::chrono::milliseconds(intervalMs),
                                     [] { return !g_monitoring.load(); })) {
                break;
            }
            lock.unlock();
            notifyListeners(forceHealthCheck());
            lock.lock();
        }
    });
}

void stopMonitoring() {
    {
        std::lock_guard<std::mutex> lock(g_monitorMtx);
        if (!g_monitoring.exchange(false)) return;
    }
    g_monitorCv.notify_all();
    if (g_monitor.joinable()) g_monitor.join();
    LOG_DEBUG("Network", "Health monitoring stopped");
}

bool isMonitoring() {
    return g_monitoring;
}

void reset() {
    std::lock_guard<std::mutex> lock(g_mtx);
    g_lastStatus.reset();
    g_lastCheck = Clock::time_point{};
    g_listeners.clear();
}

} // namespace NetworkStatus
