#pragma once
#include <functional>
#include <string>

#include "commands_core.hpp"

class EventLoop;
class VoicePipeline;
class Narrator;

// ------------------------------------------------------------
// Objects the commands act on (wired up in main.cpp / tests)
// ------------------------------------------------------------
struct CommandContext {
    EventLoop* loop = nullptr;
    VoicePipeline* pipeline = nullptr;
    Narrator* narrator = nullptr;
};

void setCommandContext(const CommandContext& ctx);
const CommandContext& commandContext();

// Trim whitespace from both ends
std::string trim(const std::string& s);

// Run fn as a loop task and wait for its result. Runs inline when the
// loop has no worker thread or when already on it.
CommandResult runOnLoop(const std::function<CommandResult()>& fn);
