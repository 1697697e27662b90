#pragma once

#include <string>
#include <nlohmann/json.hpp>

// Undefine Windows ERROR macro if it leaks in
#ifdef ERROR
#undef ERROR
#endif

#include "commands/commands_core.hpp"

// ------------------------------------------------------------
// ErrorManager
// Error codes map to a user-facing and a debug message.
// Built-in defaults are always available; errors.json may
// override or extend them.
// ------------------------------------------------------------
namespace ErrorManager {
    // Load error codes from JSON (errors.json). Returns false if the
    // file is missing or invalid; defaults stay in effect either way.
    bool load(const std::string& path);

    // Canonical defaults
    nlohmann::json defaults();

    // Get messages
    std::string getUserMessage(const std::string& code);
    std::string getDebugMessage(const std::string& code);

    // Report an error (logs debug text, returns failed CommandResult)
    CommandResult report(const std::string& code);
    CommandResult report(const std::string& code, const std::string& detail);
}
