#include "commands_meditation.hpp"
#include "commands_helpers.hpp"
#include "meditation/narrator.hpp"
#include "voice/voice_pipeline.hpp"
#include "error_manager.hpp"

#include <SFML/Graphics/Color.hpp>
#include <sstream>

static CommandResult noNarrator() {
    return {"[Meditation] Narrator not available.", false, sf::Color::Red, "ERR_CMD_EXCEPTION"};
}

// Step heading plus the text being narrated
static CommandResult describeStep(const Narrator& narrator) {
    std::ostringstream out;
    const Meditation* m = narrator.current();
    out << "[Meditation] " << (m ? m->title : "") << " | " << narrator.stepLabel() << "\n";
    out << narrator.narrationText();

    VoicePipeline* pipeline = commandContext().pipeline;
    if (!pipeline || pipeline->state() != ConnectionState::Connected) {
        out << "\n(connect to hear it spoken)";
    }
    return {out.str(), true, sf::Color(200, 160, 255), ""};
}

// ------------------------------------------------------------
// meditate [list|random|<id>]
// ------------------------------------------------------------
CommandResult cmdMeditate(const std::string& arg) {
    Narrator* narrator = commandContext().narrator;
    if (!narrator) return noNarrator();

    std::string choice = trim(arg);
    return runOnLoop([narrator, choice]() -> CommandResult {
        if (choice.empty() || choice == "list") {
            std::ostringstream out;
            out << "[Meditation] Available:";
            for (const auto& m : narrator->meditations()) {
                out << "\n- " << m.id << " : " << m.title;
                if (!m.subtitle.empty()) out << " (" << m.subtitle << ")";
            }
            if (narrator->meditations().empty()) out << " none loaded";
            return {out.str(), true, sf::Color::Cyan, ""};
        }

        bool ok = (choice == "random") ? narrator->selectRandom() : narrator->select(choice);
        if (!ok) {
            return ErrorManager::report("ERR_MEDITATION_NOT_FOUND", choice);
        }
        return describeStep(*narrator);
    });
}

// ------------------------------------------------------------
// next / prev
// ------------------------------------------------------------
CommandResult cmdNextStep([[maybe_unused]] const std::string& arg) {
    Narrator* narrator = commandContext().narrator;
    if (!narrator) return noNarrator();

    return runOnLoop([narrator]() -> CommandResult {
        if (!narrator->current()) {
            return {"[Meditation] Nothing selected. Try: meditate random", false, sf::Color::Yellow, ""};
        }
        if (!narrator->next()) {
            return {"[Meditation] Already at the closing.", false, sf::Color::Yellow, ""};
        }
        return describeStep(*narrator);
    });
}

CommandResult cmdPrevStep([[maybe_unused]] const std::string& arg) {
    Narrator* narrator = commandContext().narrator;
    if (!narrator) return noNarrator();

    return runOnLoop([narrator]() -> CommandResult {
        if (!narrator->current()) {
            return {"[Meditation] Nothing selected. Try: meditate random", false, sf::Color::Yellow, ""};
        }
        if (!narrator->prev()) {
            return {"[Meditation] Already at the introduction.", false, sf::Color::Yellow, ""};
        }
        return describeStep(*narrator);
    });
}

// ------------------------------------------------------------
// stop_meditation
// ------------------------------------------------------------
CommandResult cmdStopMeditation([[maybe_unused]] const std::string& arg) {
    Narrator* narrator = commandContext().narrator;
    if (!narrator) return noNarrator();

    return runOnLoop([narrator]() -> CommandResult {
        narrator->reset();
        return {"[Meditation] Back to selection.", true, sf::Color::Green, ""};
    });
}
