#include "commands_voice.hpp"
#include "commands_helpers.hpp"
#include "voice/voice_pipeline.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

#include <SFML/Graphics/Color.hpp>
#include <iomanip>
#include <sstream>

static CommandResult noPipeline() {
    return {"[Session] Voice pipeline not available.", false, sf::Color::Red, "ERR_CMD_EXCEPTION"};
}

// ------------------------------------------------------------
// connect
// ------------------------------------------------------------
CommandResult cmdConnect([[maybe_unused]] const std::string& arg) {
    VoicePipeline* pipeline = commandContext().pipeline;
    if (!pipeline) return noPipeline();

    return runOnLoop([pipeline]() -> CommandResult {
        ConnectionState before = pipeline->state();
        if (before == ConnectionState::Connecting || before == ConnectionState::Connected) {
            return {std::string("[Session] Already ") + toString(before) + ".", false, sf::Color::Yellow, ""};
        }

        if (!pipeline->start()) {
            return {pipeline->lastErrorMessage(), false, sf::Color::Red, pipeline->lastError()};
        }
        return {"[Session] Connecting...", true, sf::Color::Green, ""};
    });
}

// ------------------------------------------------------------
// disconnect
// ------------------------------------------------------------
CommandResult cmdDisconnect([[maybe_unused]] const std::string& arg) {
    VoicePipeline* pipeline = commandContext().pipeline;
    if (!pipeline) return noPipeline();

    return runOnLoop([pipeline]() -> CommandResult {
        pipeline->stop();
        return {"[Session] Disconnected.", true, sf::Color::Green, ""};
    });
}

// ------------------------------------------------------------
// status
// ------------------------------------------------------------
CommandResult cmdStatus([[maybe_unused]] const std::string& arg) {
    VoicePipeline* pipeline = commandContext().pipeline;
    if (!pipeline) return noPipeline();

    return runOnLoop([pipeline]() -> CommandResult {
        std::ostringstream out;
        out << std::fixed << std::setprecision(3);
        out << "[Session Status]\n";
        out << "State          : " << toString(pipeline->state()) << "\n";
        out << "Attempt        : " << pipeline->generation() << "\n";
        out << "Frames sent    : " << pipeline->framesSent() << "\n";
        out << "Frames dropped : " << pipeline->framesDropped() << "\n";
        out << "Decode failures: " << pipeline->decodeFailures() << "\n";
        out << "Interrupts     : " << pipeline->interruptCount() << "\n";
        out << "Active buffers : " << pipeline->activeBuffers() << "\n";
        out << "Cursor         : " << pipeline->scheduleCursor() << " s\n";
        out << "Levels         : user " << pipeline->userLevel() << ", ai " << pipeline->aiLevel();
        if (!pipeline->lastError().empty()) {
            out << "\nLast error     : " << pipeline->lastError();
        }
        return {out.str(), true, sf::Color::Cyan, ""};
    });
}

// ------------------------------------------------------------
// levels
// ------------------------------------------------------------
static std::string meterBar(double level) {
    constexpr int width = 20;
    int filled = static_cast<int>(level * width + 0.5);
    return "[" + std::string(static_cast<size_t>(filled), '#') +
           std::string(static_cast<size_t>(width - filled), '.') + "]";
}

CommandResult cmdLevels([[maybe_unused]] const std::string& arg) {
    VoicePipeline* pipeline = commandContext().pipeline;
    if (!pipeline) return noPipeline();

    return runOnLoop([pipeline]() -> CommandResult {
        std::ostringstream out;
        out << std::fixed << std::setprecision(2);
        out << "You " << meterBar(pipeline->userLevel()) << " " << pipeline->userLevel() << "\n";
        out << "AI  " << meterBar(pipeline->aiLevel()) << " " << pipeline->aiLevel();
        return {out.str(), true, sf::Color::Cyan, ""};
    });
}

// ------------------------------------------------------------
// say <text>
// ------------------------------------------------------------
CommandResult cmdSay(const std::string& arg) {
    VoicePipeline* pipeline = commandContext().pipeline;
    if (!pipeline) return noPipeline();

    std::string text = trim(arg);
    if (text.empty()) {
        return {"[Session] Usage: say <text>", false, sf::Color::Yellow, ""};
    }

    return runOnLoop([pipeline, text]() -> CommandResult {
        if (!pipeline->sendText(text)) {
            return ErrorManager::report("ERR_NOT_CONNECTED");
        }
        return {"[Session] Sent.", true, sf::Color::Green, ""};
    });
}
