#pragma once
#include <chrono>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

#include "event_loop.hpp"

class VoicePipeline;

struct MeditationStep {
    std::string title;
    std::string content;
    std::string keyPhrase;
    std::string keyLabel;
    bool isNeonSign = false;
};

struct Meditation {
    std::string id;
    std::string title;
    std::string subtitle;
    std::string intro;
    std::vector<MeditationStep> steps;
    std::string outro;
};

// ------------------------------------------------------------
// Narrator
// Walks a guided meditation one step at a time and speaks each
// step through the shared VoicePipeline.
//   -2 = selection, -1 = intro, 0..n-1 = steps, n = outro
// ------------------------------------------------------------
class Narrator {
public:
    static constexpr int kSelection = -2;
    static constexpr int kIntro = -1;

    Narrator(EventLoop& loop, VoicePipeline& pipeline,
             std::chrono::milliseconds narrationDelay = std::chrono::milliseconds(300));
    ~Narrator();

    Narrator(const Narrator&) = delete;
    Narrator& operator=(const Narrator&) = delete;

    // Load scripts from JSON. On failure the current list is kept.
    bool load(const std::string& path);
    void setMeditations(std::vector<Meditation> meditations);
    const std::vector<Meditation>& meditations() const { return meditations_; }

    bool select(const std::string& id);
    bool selectRandom();
    bool next();     // stops at the outro
    bool prev();     // stops at the intro
    void reset();    // back to selection

    int stepIndex() const { return step_; }
    const Meditation* current() const;
    bool isOutro() const;
    std::string narrationText() const;
    std::string stepLabel() const;

    bool narrationPending() const { return pending_ != 0; }
    std::uint64_t narrationsSent() const { return sent_; }

private:
    void scheduleNarration();
    void cancelNarration();

    EventLoop& loop_;
    VoicePipeline& pipeline_;
    std::chrono::milliseconds delay_;

    std::vector<Meditation> meditations_;
    int current_ = -1;
    int step_ = kSelection;

    EventLoop::TimerId pending_ = 0;
    std::uint64_t sent_ = 0;
    std::mt19937 rng_{std::random_device{}()};
};
