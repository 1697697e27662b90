#include "commands/commands_system.hpp"
#include "device_setups/audio_devices.hpp"
#include "network_status.hpp"
#include "error_manager.hpp"

#include <SFML/Graphics/Color.hpp>
#include <sstream>

std::atomic<bool> g_quitRequested{false};

CommandResult cmdDevices([[maybe_unused]] const std::string& arg) {
    auto devices = listAudioDevices();
    return {
        formatAudioDevices(devices),
        !devices.empty(),
        devices.empty() ? sf::Color::Yellow : sf::Color::Cyan,
        ""
    };
}

CommandResult cmdHealth([[maybe_unused]] const std::string& arg) {
    if (!NetworkStatus::forceHealthCheck()) {
        return ErrorManager::report("ERR_BACKEND_UNREACHABLE");
    }
    return {"[Network] Backend is available.", true, sf::Color::Green, ""};
}

CommandResult cmdShowHelp([[maybe_unused]] const std::string& arg) {
    std::string helpText =
        "[Help] Available commands:\n"
        "- connect                  start a voice session\n"
        "- disconnect               end the session\n"
        "- status                   session state and counters\n"
        "- levels                   current user/AI levels\n"
        "- say <text>               send a text turn\n"
        "- meditate [list|random|<id>]\n"
        "- next / prev              move through the meditation\n"
        "- stop_meditation          back to selection\n"
        "- devices                  list audio devices\n"
        "- health                   check the backend\n"
        "- help\n"
        "- quit";
    return {helpText, true, sf::Color::Cyan, ""};
}

CommandResult cmdQuit([[maybe_unused]] const std::string& arg) {
    g_quitRequested = true;
    return {"[Core] Shutting down.", true, sf::Color::White, ""};
}
