#include "resources.hpp"
#include "logger.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

// -------------------------------------------------------------
// Global state definitions
// -------------------------------------------------------------
nlohmann::json appConfig = nlohmann::json::object();

// -------------------------------------------------------------
// Locate resource root (prefer repo/resources over build/resources)
// -------------------------------------------------------------
std::string getResourcePath() {
#if defined(LIVEWIRE_PORTABLE_ONLY)
    fs::path exePath = fs::canonical("/proc/self/exe").parent_path();
    fs::path portablePath = exePath / "resources";
    if (fs::exists(portablePath)) {
        LOG_DEBUG("Resources", "Using portable resource path: " + portablePath.string());
        return portablePath.string();
    }
    return exePath.string();
#else
    fs::path buildPath   = fs::current_path() / "resources";
    fs::path projectPath = fs::current_path().parent_path() / "resources";

    if (fs::exists(buildPath)) {
        LOG_TRACE("Resources", "Using resource path: " + buildPath.string());
        return buildPath.string();
    }
    if (fs::exists(projectPath)) {
        LOG_TRACE("Resources", "Using project resource path: " + projectPath.string());
        return projectPath.string();
    }

    LOG_DEBUG("Resources", "Falling back to cwd: " + fs::current_path().string());
    return fs::current_path().string();
#endif
}

// -------------------------------------------------------------
// Load text resource from resources/ folder
// -------------------------------------------------------------
std::string loadTextResource(const std::string& filename) {
    fs::path filePath = fs::path(getResourcePath()) / filename;
    std::ifstream file(filePath);
    if (!file.is_open()) {
        LOG_ERROR("Resources", "Resource not found: " + filename +
                               " (looked in " + filePath.string() + ")");
        LOG_PHASE("Resource load", false);
        return {};
    }

    LOG_PHASE("Resource load", true);
    LOG_DEBUG("Resources", "Loaded text resource: " + filename);
    return { std::istreambuf_iterator<char>(file),
             std::istreambuf_iterator<char>() };
}

// -------------------------------------------------------------
// Find any usable font: resources/ first, then system fonts
// -------------------------------------------------------------
static std::string firstFontIn(const fs::path& dir, bool recursive) {
    std::error_code ec;
    if (!fs::exists(dir, ec)) return {};

    auto isFont = [](const fs::path& p) {
        auto ext = p.extension().string();
        return ext == ".ttf" || ext == ".otf";
    };

    if (recursive) {
        for (auto it = fs::recursive_directory_iterator(dir, ec);
             !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (it->is_regular_file(ec) && isFont(it->path())) return it->path().string();
        }
    } else {
        for (auto it = fs::directory_iterator(dir, ec);
             !ec && it != fs::directory_iterator(); it.increment(ec)) {
            if (it->is_regular_file(ec) && isFont(it->path())) return it->path().string();
        }
    }
    return {};
}

std::string findAnyFontInResources() {
    std::string found = firstFontIn(getResourcePath(), false);
    if (found.empty()) found = firstFontIn("/usr/share/fonts", true);

    if (found.empty()) {
        LOG_ERROR("Resources", "No font found in resources/ or system fonts.");
        LOG_PHASE("Font search", false);
        return {};
    }

    LOG_PHASE("Font search", true);
    LOG_DEBUG("Resources", "Found font: " + found);
    return found;
}
