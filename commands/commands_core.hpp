#pragma once
#include <string>
#include <unordered_map>
#include <utility>
#include <SFML/Graphics/Color.hpp>

// ------------------------------------------------------------
// CommandResult: unified return type for all commands
// ------------------------------------------------------------
struct CommandResult {
    std::string message;    // user-facing text
    bool success = true;    // true if command succeeded
    sf::Color color = sf::Color::White;  // console display color
    std::string errorCode;  // optional error code for ErrorManager/Logger
};

// ------------------------------------------------------------
// Function pointer type for commands
// ------------------------------------------------------------
using CommandFunc = CommandResult(*)(const std::string& arg);

// ------------------------------------------------------------
// Globals (defined in commands_core.cpp)
// ------------------------------------------------------------
extern std::unordered_map<std::string, CommandFunc> commandMap;

// ------------------------------------------------------------
// Public API
// ------------------------------------------------------------
std::pair<std::string, std::string> parseInput(const std::string& input);
CommandResult dispatchCommand(const std::string& cmd, const std::string& arg);

// Parse, dispatch and print one REPL line.
CommandResult handleCommand(const std::string& line);
