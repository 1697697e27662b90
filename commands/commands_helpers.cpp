#include "commands_helpers.hpp"
#include "event_loop.hpp"
#include "logger.hpp"

#include <exception>
#include <future>
#include <memory>

static CommandContext g_context;

void setCommandContext(const CommandContext& ctx) {
    g_context = ctx;
}

const CommandContext& commandContext() {
    return g_context;
}

std::string trim(const std::string& s) {
    const char* ws = " \t\n\r";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

CommandResult runOnLoop(const std::function<CommandResult()>& fn) {
    EventLoop* loop = g_context.loop;
    if (!loop || !loop->isRunning() || loop->isLoopThread()) {
        return fn();
    }

    auto promise = std::make_shared<std::promise<CommandResult>>();
    std::future<CommandResult> result = promise->get_future();
    loop->post([promise, fn]() {
        try {
            promise->set_value(fn());
        } catch (const std::exception&) {
            promise->set_exception(std::current_exception());
        }
    });

    // Rethrows into dispatchCommand, which maps it to ERR_CMD_EXCEPTION
    return result.get();
}
