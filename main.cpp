#include "commands/commands_core.hpp"
#include "commands/commands_helpers.hpp"
#include "commands/commands_system.hpp"
#include "audio/input_device.hpp"
#include "audio/output_device.hpp"
#include "voice/voice_pipeline.hpp"
#include "voice/loopback_session.hpp"
#include "meditation/narrator.hpp"
#include "ui/orb_view.hpp"
#include "bootstrap_config.hpp"
#include "network_status.hpp"
#include "resources.hpp"
#include "event_loop.hpp"
#include "logger.hpp"

#include <SFML/Graphics/Color.hpp>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <thread>

namespace fs = std::filesystem;

// ============================================================
// Main entry point
// ============================================================
int main() {
    // Initialize logger (writes to livewire.log + stderr)
    initLogger("livewire.log");
    LOG_PHASE("Startup begin", true);

    // Configuration, error codes, log level; printed as one block
    beginPhaseGroup();
    bootstrap_config::initAll();
    LOG_PHASE("Bootstrap checks complete", true);
    endPhaseGroup();

    const nlohmann::json& audioCfg = appConfig["audio"];
    const nlohmann::json& netCfg = appConfig["network"];
    const nlohmann::json& uiCfg = appConfig["ui"];

    NetworkStatus::configure(netCfg.value("health_url", "http://localhost:3002/health"),
                             netCfg.value("health_timeout_ms", 2000),
                             netCfg.value("health_cache_ms", 5000));

    // Persona text is opaque to the pipeline
    std::string persona = loadTextResource(appConfig["session"].value("persona_file", "persona.txt"));
    PipelineOptions options = bootstrap_config::pipelineOptions(appConfig, persona);

    const int deviceIndex = audioCfg.value("input_device_index", -1);
    const std::size_t fftSize = audioCfg.value("fft_size", static_cast<std::size_t>(256));
    const double smoothing = audioCfg.value("smoothing", 0.8);

    // ============================================================
    // Pipeline wiring
    // ============================================================
    EventLoop loop;
    LoopbackConnector connector(audioCfg.value("speech_threshold", 0.02), options.outputSampleRate);

    VoicePipeline pipeline(
        loop, connector,
        [deviceIndex, fftSize, smoothing]() -> std::unique_ptr<InputDevice> {
            return std::make_unique<PortAudioInput>(deviceIndex, fftSize, smoothing);
        },
        [fftSize, smoothing]() -> std::unique_ptr<OutputDevice> {
            return std::make_unique<SfmlOutput>(fftSize, smoothing);
        },
        options);

    Narrator narrator(loop, pipeline);
    narrator.load((fs::path(getResourcePath()) / "meditations.json").string());

    std::unique_ptr<OrbView> orb;
    if (uiCfg.value("orb_window", true)) {
        orb = std::make_unique<OrbView>(uiCfg.value("width", 480u), uiCfg.value("height", 640u),
                                        findAnyFontInResources());
    }

    OrbView* orbPtr = orb.get();
    pipeline.onState([orbPtr](ConnectionState state) {
        if (orbPtr) orbPtr->setState(state);
        std::cout << "[Session] " << toString(state) << std::endl;
    });
    pipeline.onLevel([orbPtr](double user, double ai) {
        if (orbPtr) orbPtr->setLevels(user, ai);
    });
    pipeline.onTranscript([orbPtr](const std::string& user, const std::string& ai) {
        if (orbPtr) orbPtr->setTranscript(user, ai);
    });
    pipeline.onTurn([](const Turn& turn) {
        if (!turn.user.empty()) std::cout << "  you: " << turn.user << std::endl;
        if (!turn.assistant.empty()) std::cout << "  ai : " << turn.assistant << std::endl;
    });

    setCommandContext({&loop, &pipeline, &narrator});

    loop.start();
    LOG_PHASE("Event loop started", true);

    // Backend health in the background
    NetworkStatus::addListener([](bool available) {
        static std::optional<bool> last;
        if (last != available) {
            LOG_DEBUG("Network", std::string("Backend ") + (available ? "online" : "offline"));
            last = available;
        }
    });
    NetworkStatus::startMonitoring(netCfg.value("monitor_interval_ms", 10000));

    // ============================================================
    // Orb window in background thread
    // ============================================================
    std::thread orbThread;
    if (orb) {
        orbThread = std::thread([orbPtr]() { orbPtr->run(); });
        LOG_PHASE("Orb UI launched", true);
    }

    LOG_PHASE("Startup complete, entering main loop", true);
    std::cout << "Livewire ready. Type 'help' for commands." << std::endl;

    // ============================================================
    // Console REPL loop
    // ============================================================
    std::string line;
    while (!g_quitRequested) {
        std::cout << "> "; // REPL prompt
        if (!std::getline(std::cin, line)) {
            break; // EOF / Ctrl+D
        }

        if (line.empty()) {
            continue;
        }

        LOG_TRACE("Console", "Dispatching command: " + line);
        handleCommand(line);
    }
    LOG_PHASE("Shutdown requested", true);

    // ============================================================
    // Shutdown cleanup
    // ============================================================
    runOnLoop([&narrator, &pipeline]() -> CommandResult {
        narrator.reset();
        pipeline.stop();
        return {"", true, sf::Color::White, ""};
    });

    NetworkStatus::stopMonitoring();

    if (orb) {
        orb->requestClose();
        if (orbThread.joinable()) orbThread.join();
    }

    loop.stop();
    LOG_PHASE("Shutdown complete", true);

    shutdownLogger();
    return 0;
}
