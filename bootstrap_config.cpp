#include "bootstrap_config.hpp"
#include "error_manager.hpp"
#include "resources.hpp"
#include "logger.hpp"

#include <fstream>

namespace fs = std::filesystem;

// ----------------- helpers -----------------
static bool mergeDefaults(nlohmann::json& cfg,
                          const nlohmann::json& defs,
                          const std::string& prefix = "",
                          int* patchedCount = nullptr) {
    bool patched = false;
    for (auto& [key, defVal] : defs.items()) {
        if (!cfg.contains(key) || cfg[key].is_null()) {
            cfg[key] = defVal;
            patched = true;
            if (patchedCount) (*patchedCount)++;
        } else if (defVal.is_object() && cfg[key].is_object()) {
            if (mergeDefaults(cfg[key], defVal,
                              prefix.empty() ? key : prefix + "." + key,
                              patchedCount))
                patched = true;
        } else if (defVal.is_number() && cfg[key].is_number()) {
            // int/float mix is fine
        } else if (cfg[key].type() != defVal.type()) {
            LOG_WARN("Config", "Wrong type for " + (prefix.empty() ? key : prefix + "." + key) +
                               ", using default");
            cfg[key] = defVal;
            patched = true;
            if (patchedCount) (*patchedCount)++;
        }
    }
    return patched;
}

static void writeJson(const fs::path& path, const nlohmann::json& j) {
    std::ofstream out(path);
    if (!out) {
        LOG_WARN("Config", "Could not write " + path.string());
        return;
    }
    out << j.dump(2);
}

// ----------------- defaults -----------------
namespace bootstrap_config {

nlohmann::json defaultConfig() {
    return {
        {"session", {
            {"model", "loopback"},
            {"voice", "Charon"},
            {"persona_file", "persona.txt"}
        }},

        {"audio", {
            {"input_sample_rate", 16000},
            {"output_sample_rate", 24000},
            {"frame_size", 4096},
            {"input_device_index", -1},
            {"fft_size", 256},
            {"smoothing", 0.8},
            {"level_interval_ms", 16},
            {"speech_threshold", 0.02}
        }},

        {"network", {
            {"health_url", "http://localhost:3002/health"},
            {"health_timeout_ms", 2000},
            {"health_cache_ms", 5000},
            {"monitor_interval_ms", 10000}
        }},

        {"ui", {
            {"orb_window", true},
            {"width", 480},
            {"height", 640}
        }},

        {"logging", {
            {"level", "debug"}
        }}
    };
}

// ----------------- loader -----------------
bool loadConfig(const fs::path& path,
                const nlohmann::json& defaults,
                nlohmann::json& outConfig,
                const std::string& name,
                const std::string& errorCode) {
    if (!fs::exists(path)) {
        outConfig = defaults;
        writeJson(path, outConfig);

        LOG_PHASE(name + " created", true);
        return true;
    }

    auto resetToDefaults = [&](const std::string& reason) {
        LOG_ERROR("Config", name + " invalid → reset to defaults (" + reason + ")");
        LOG_PHASE(name + " load", false);

        if (!errorCode.empty())
            ErrorManager::report(errorCode);

        outConfig = defaults;
        writeJson(path, outConfig);
        return false;
    };

    try {
        std::ifstream f(path);
        f >> outConfig;
    } catch (const nlohmann::json::exception& e) {
        return resetToDefaults(e.what());
    }
    if (!outConfig.is_object()) {
        return resetToDefaults("top level is not an object");
    }

    int patchedCount = 0;
    if (mergeDefaults(outConfig, defaults, "", &patchedCount)) {
        writeJson(path, outConfig);
        LOG_PHASE(name + " patched", true);
        LOG_DEBUG("Config", name + " patched (" + std::to_string(patchedCount) + " keys)");
    } else {
        LOG_PHASE(name + " load", true);
    }
    return true;
}

PipelineOptions pipelineOptions(const nlohmann::json& cfg, const std::string& persona) {
    const nlohmann::json defs = defaultConfig();
    const nlohmann::json& audio = cfg.contains("audio") ? cfg["audio"] : defs["audio"];
    const nlohmann::json& session = cfg.contains("session") ? cfg["session"] : defs["session"];

    PipelineOptions opts;
    opts.inputSampleRate = audio.value("input_sample_rate", kInputSampleRate);
    opts.outputSampleRate = audio.value("output_sample_rate", kOutputSampleRate);
    opts.frameSize = audio.value("frame_size", kCaptureFrameSize);
    opts.levelInterval = std::chrono::milliseconds(audio.value("level_interval_ms", 16));
    opts.session.model = session.value("model", "loopback");
    opts.session.voiceName = session.value("voice", "Charon");
    opts.session.systemInstruction = persona;
    return opts;
}

// ----------------- entry -----------------
void initAll() {
    // errors.json
    fs::path errPath = fs::path(getResourcePath()) / "errors.json";
    if (ErrorManager::load(errPath.string())) {
        LOG_PHASE("Errors config load", true);
    } else {
        LOG_PHASE("Errors config load", false);
    }

    // livewire_config.json
    fs::path cfgPath = fs::current_path() / LIVEWIRE_CONFIG_FILE;
    loadConfig(cfgPath, defaultConfig(), appConfig, "Livewire config", "ERR_CONFIG_INVALID");

    setLogLevel(parseLogLevel(appConfig["logging"].value("level", "debug")));
}

} // namespace bootstrap_config
