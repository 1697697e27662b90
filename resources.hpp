#pragma once
#include <string>
#include <nlohmann/json_fwd.hpp>

// ------------------------------------------------------------
// Constants
// ------------------------------------------------------------
inline constexpr const char* LIVEWIRE_CONFIG_FILE = "livewire_config.json";

// ------------------------------------------------------------
// Resource loading
// ------------------------------------------------------------
std::string getResourcePath();
std::string loadTextResource(const std::string& filename);
std::string findAnyFontInResources();

// ------------------------------------------------------------
// Global app config (livewire_config.json, loaded at bootstrap)
// ------------------------------------------------------------
extern nlohmann::json appConfig;
