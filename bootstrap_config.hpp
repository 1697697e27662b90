#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <filesystem>

#include "voice/voice_pipeline.hpp"

// Centralized config + resource bootstrap for Livewire
namespace bootstrap_config {

    // Load livewire_config.json, errors.json and the log level
    void initAll();

    // Generic loader → ensures defaults, patches missing keys, saves back
    bool loadConfig(const std::filesystem::path& path,
                    const nlohmann::json& defaults,
                    nlohmann::json& outConfig,
                    const std::string& name,
                    const std::string& errorCode = "");

    // Canonical defaults
    nlohmann::json defaultConfig();

    // Pipeline settings from the "audio" and "session" sections
    PipelineOptions pipelineOptions(const nlohmann::json& cfg, const std::string& persona);
}
