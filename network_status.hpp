#pragma once
#include <functional>
#include <optional>
#include <string>

// ------------------------------------------------------------
// NetworkStatus
// Backend health check. Results are cached for a short window so
// callers can ask as often as they like.
// ------------------------------------------------------------
namespace NetworkStatus {
    // true = reachable. Runs on the calling thread.
    using HealthCheck = std::function<bool(const std::string& url, int timeoutMs)>;
    using Listener = std::function<void(bool available)>;

    void configure(const std::string& healthUrl, int timeoutMs = 2000, int cacheMs = 5000);

    // Replace the HTTP check (tests). nullptr restores the default.
    void setHealthCheck(HealthCheck check);

    bool isBackendAvailable();
    bool forceHealthCheck();

    std::optional<bool> lastKnownStatus();
    long long msSinceLastCheck();   // -1 before the first check

    int addListener(Listener listener);
    void removeListener(int id);

    // Background re-check every intervalMs; listeners hear each result.
    void startMonitoring(int intervalMs = 10000);
    void stopMonitoring();
    bool isMonitoring();

    // Forget the cached result and every listener.
    void reset();
}
