#pragma once
#include "commands_core.hpp"

// Guided meditation commands
CommandResult cmdMeditate(const std::string& arg);
CommandResult cmdNextStep(const std::string& arg);
CommandResult cmdPrevStep(const std::string& arg);
CommandResult cmdStopMeditation(const std::string& arg);
