#include "meditation/narrator.hpp"
#include "voice/voice_pipeline.hpp"
#include "logger.hpp"

#include <nlohmann/json.hpp>
#include <fstream>

Narrator::Narrator(EventLoop& loop, VoicePipeline& pipeline, std::chrono::milliseconds narrationDelay)
    : loop_(loop), pipeline_(pipeline), delay_(narrationDelay) {}

Narrator::~Narrator() {
    cancelNarration();
}

// =========================================================
// Scripts
// =========================================================
static Meditation parseMeditation(const nlohmann::json& j) {
    Meditation m;
    m.id = j.at("id").get<std::string>();
    m.title = j.value("title", m.id);
    m.subtitle = j.value("subtitle", "");
    m.intro = j.value("intro", "");
    m.outro = j.value("outro", "");

    for (const auto& s : j.value("steps", nlohmann::json::array())) {
        MeditationStep step;
        step.title = s.value("title", "");
        step.content = s.value("content", "");
        step.keyPhrase = s.value("keyPhrase", "");
        step.keyLabel = s.value("keyLabel", "");
        step.isNeonSign = s.value("isNeonSign", false);
        m.steps.push_back(std::move(step));
    }
    return m;
}

bool Narrator::load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        LOG_ERROR("Narrator", "Meditation scripts not found: " + path);
        LOG_PHASE("Meditations load", false);
        return false;
    }

    try {
        nlohmann::json j;
        f >> j;

        std::vector<Meditation> loaded;
        for (const auto& entry : j.at("meditations")) {
            loaded.push_back(parseMeditation(entry));
        }
        setMeditations(std::move(loaded));
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Narrator", std::string("Invalid meditation scripts: ") + e.what());
        LOG_PHASE("Meditations load", false);
        return false;
    }

    LOG_PHASE("Meditations load", true);
    LOG_DEBUG("Narrator", "Loaded " + std::to_string(meditations_.size()) + " meditation(s)");
    return true;
}

void Narrator::setMeditations(std::vector<Meditation> meditations) {
    reset();
    meditations_ = std::move(meditations);
}

// =========================================================
// Navigation
// =========================================================
bool Narrator::select(const std::string& id) {
    for (std::size_t i = 0; i < meditations_.size(); i++) {
        if (meditations_[i].id == id) {
            current_ = static_cast<int>(i);
            step_ = kIntro;
            LOG_DEBUG("Narrator", "Selected \"" + meditations_[i].title + "\"");
            scheduleNarration();
            return true;
        }
    }
    LOG_WARN("Narrator", "No meditation with id \"" + id + "\"");
    return false;
}

bool Narrator::selectRandom() {
    if (meditations_.empty()) return false;
    std::uniform_int_distribution<std::size_t> pick(0, meditations_.size() - 1);
    return select(meditations_[pick(rng_)].id);
}

bool Narrator::next() {
    const Meditation* m = current();
    if (!m || step_ >= static_cast<int>(m->steps.size())) return false;
    step_++;
    scheduleNarration();
    return true;
}

bool Narrator::prev() {
    if (!current() || step_ <= kIntro) return false;
    step_--;
    scheduleNarration();
    return true;
}

void Narrator::reset() {
    cancelNarration();
    current_ = -1;
    step_ = kSelection;
}

const Meditation* Narrator::current() const {
    if (current_ < 0 || current_ >= static_cast<int>(meditations_.size())) return nullptr;
    return &meditations_[static_cast<std::size_t>(current_)];
}

bool Narrator::isOutro() const {
    const Meditation* m = current();
    return m && step_ == static_cast<int>(m->steps.size());
}

std::string Narrator::narrationText() const {
    const Meditation* m = current();
    if (!m || step_ == kSelection) return {};
    if (step_ == kIntro) return m->intro;
    if (isOutro()) return m->outro;

    const MeditationStep& s = m->steps[static_cast<std::size_t>(step_)];
    std::string text = s.title + ". " + s.content;
    if (!s.keyPhrase.empty()) text += " " + s.keyPhrase;
    return text;
}

std::string Narrator::stepLabel() const {
    const Meditation* m = current();
    if (!m) return "Selection";
    if (step_ == kIntro) return "Introduction";
    if (isOutro()) return "Closing";
    return "Step " + std::to_string(step_ + 1) + " of " + std::to_string(m->steps.size()) +
           ": " + m->steps[static_cast<std::size_t>(step_)].title;
}

// =========================================================
// Narration
// =========================================================
void Narrator::scheduleNarration() {
    cancelNarration();
    std::string text = narrationText();
    if (text.empty()) return;

    pending_ = loop_.postDelayed(delay_, [this, text]() {
        pending_ = 0;
        if (pipeline_.sendText(text)) {
            sent_++;
        } else {
            LOG_DEBUG("Narrator", "Narration skipped, pipeline not connected");
        }
    });
}

void Narrator::cancelNarration() {
    if (pending_) {
        loop_.cancel(pending_);
        pending_ = 0;
    }
}
