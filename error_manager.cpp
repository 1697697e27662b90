#include "error_manager.hpp"
#include "logger.hpp"

#include <fstream>
#include <filesystem>
#include <mutex>

// ------------------------------------------------------------
// Storage
// ------------------------------------------------------------
static std::mutex g_errorsMutex;
static nlohmann::json g_root;
static bool g_loaded = false;

nlohmann::json ErrorManager::defaults() {
    return {
        {"ERR_MIC_PERMISSION_DENIED", {
            {"user", "[Mic] Microphone access was refused. Check the input device and press connect again."},
            {"debug", "Input device could not be opened; connection aborted."}
        }},
        {"ERR_OUTPUT_DEVICE_UNAVAILABLE", {
            {"user", "[Audio] No usable playback device."},
            {"debug", "Output graph failed to open."}
        }},
        {"ERR_SESSION_OPEN_FAILED", {
            {"user", "[Session] Could not reach the voice service. Press connect to try again."},
            {"debug", "SessionConnector::connect threw or returned no session."}
        }},
        {"ERR_SESSION_ERROR", {
            {"user", "[Session] Connection error. Please try again."},
            {"debug", "Remote session reported an error event."}
        }},
        {"ERR_SESSION_CLOSED", {
            {"user", "[Session] Connection closed. Press connect to begin again."},
            {"debug", "Remote session closed while connected."}
        }},
        {"ERR_AUDIO_DECODE", {
            {"user", "[Audio] Skipped a damaged audio chunk."},
            {"debug", "Inbound audio chunk failed to decode; chunk dropped, scheduler untouched."}
        }},
        {"ERR_CONFIG_INVALID", {
            {"user", "[Config] Config file invalid, reset to defaults."},
            {"debug", "livewire_config.json failed parsing or validation."}
        }},
        {"ERR_BACKEND_UNREACHABLE", {
            {"user", "[Network] Backend is not reachable."},
            {"debug", "Health check failed or timed out."}
        }},
        {"ERR_MEDITATION_NOT_FOUND", {
            {"user", "[Meditation] No meditation with that id. Try: meditate list"},
            {"debug", "Narrator::select found no script with the requested id."}
        }},
        {"ERR_NOT_CONNECTED", {
            {"user", "[Session] Not connected."},
            {"debug", "Operation requires ConnectionState::Connected."}
        }},
        {"ERR_CORE_UNKNOWN_COMMAND", {
            {"user", "[Core] Unknown command"},
            {"debug", "No handler registered in commandMap."}
        }},
        {"ERR_CMD_EXCEPTION", {
            {"user", "[Core] Command failed"},
            {"debug", "Exception escaped a command handler."}
        }}
    };
}

static void ensureDefaults() {
    if (!g_loaded) {
        g_root = ErrorManager::defaults();
        g_loaded = true;
    }
}

bool ErrorManager::load(const std::string& path) {
    std::lock_guard<std::mutex> lock(g_errorsMutex);
    ensureDefaults();

    std::ifstream in(path);
    if (!in) {
        LOG_WARN("ErrorManager", "Could not open " + path + ", using built-in codes");
        return false;
    }

    try {
        nlohmann::json file;
        in >> file;

        const nlohmann::json& codes =
            (file.contains("errors") && file["errors"].is_object()) ? file["errors"] : file;

        int count = 0;
        for (auto& [key, val] : codes.items()) {
            if (val.is_object()) {
                g_root[key] = val;
                count++;
            }
        }
        LOG_DEBUG("ErrorManager", "Loaded " + std::to_string(count) + " codes from " +
                                  std::filesystem::absolute(path).string());
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("ErrorManager", "Failed to parse " + path + " -> " + e.what());
        return false;
    }
}

std::string ErrorManager::getUserMessage(const std::string& code) {
    std::lock_guard<std::mutex> lock(g_errorsMutex);
    ensureDefaults();
    if (g_root.contains(code) && g_root[code].contains("user")) {
        return g_root[code]["user"].get<std::string>();
    }
    return "[Error] Unknown error code: " + code;
}

std::string ErrorManager::getDebugMessage(const std::string& code) {
    std::lock_guard<std::mutex> lock(g_errorsMutex);
    ensureDefaults();
    if (g_root.contains(code) && g_root[code].contains("debug")) {
        return g_root[code]["debug"].get<std::string>();
    }
    return "[Debug] No debug message for code: " + code;
}

CommandResult ErrorManager::report(const std::string& code) {
    return report(code, "");
}

CommandResult ErrorManager::report(const std::string& code, const std::string& detail) {
    std::string userMsg  = getUserMessage(code);
    std::string debugMsg = getDebugMessage(code);

    LOG_ERROR("ErrorManager", code + " -> " + debugMsg + (detail.empty() ? "" : " (" + detail + ")"));

    CommandResult result;
    result.message   = userMsg;
    result.success   = false;
    result.color     = sf::Color::Red;
    result.errorCode = code;
    return result;
}
