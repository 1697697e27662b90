#pragma once
#include "commands_core.hpp"

// Voice session commands
CommandResult cmdConnect(const std::string& arg);
CommandResult cmdDisconnect(const std::string& arg);
CommandResult cmdStatus(const std::string& arg);
CommandResult cmdLevels(const std::string& arg);
CommandResult cmdSay(const std::string& arg);
