#pragma once
#include <atomic>
#include "commands_core.hpp"

// Set by `quit`; the REPL loop exits when it sees it.
extern std::atomic<bool> g_quitRequested;

CommandResult cmdDevices(const std::string& arg);
CommandResult cmdHealth(const std::string& arg);
CommandResult cmdShowHelp(const std::string& arg);
CommandResult cmdQuit(const std::string& arg);
