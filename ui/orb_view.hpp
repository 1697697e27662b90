#pragma once
#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>

#include <SFML/Graphics/Color.hpp>

#include "voice/session.hpp"

// ---------------- Orb Tunables ----------------
inline constexpr float kOrbRadius = 80.f;
inline constexpr float kOrbRingThickness = 4.f;
inline constexpr unsigned kOrbStatusFontSize = 18;
inline constexpr unsigned kOrbTranscriptFontSize = 16;
inline constexpr unsigned kOrbFramerate = 60;

/// What the view shows, copied out of the pipeline callbacks.
struct OrbSnapshot {
    ConnectionState state = ConnectionState::Idle;
    double userLevel = 0.0;
    double aiLevel = 0.0;
    std::string interimUser;
    std::string interimAi;
};

/// Derived drawing parameters. Pure function of the snapshot.
struct OrbStyle {
    float userGlowScale = 1.f;
    float aiGlowScale = 1.f;
    float userGlowAlpha = 0.f;   // 0..1
    float aiGlowAlpha = 0.f;     // 0..1
    sf::Color ringColor = sf::Color(120, 120, 130);
    bool idleListening = false;
    std::string statusText;
    bool showStatus = true;
};

OrbStyle computeOrbStyle(const OrbSnapshot& snapshot);

// ------------------------------------------------------------
// OrbView: SFML window, rendered on its own thread
// ------------------------------------------------------------
class OrbView {
public:
    OrbView(unsigned width, unsigned height, std::string fontPath);

    // Any thread
    void update(const OrbSnapshot& snapshot);
    void setLevels(double user, double ai);
    void setState(ConnectionState state);
    void setTranscript(const std::string& user, const std::string& ai);
    OrbSnapshot snapshot() const;

    // Blocks until the window closes or requestClose() is called.
    void run();
    void requestClose() { closeRequested_ = true; }
    bool isRunning() const { return running_; }

private:
    unsigned width_;
    unsigned height_;
    std::string fontPath_;

    mutable std::mutex mtx_;
    OrbSnapshot snapshot_;

    std::atomic<bool> closeRequested_{false};
    std::atomic<bool> running_{false};
};
