#include "ui/orb_view.hpp"
#include "logger.hpp"

#include <SFML/Graphics.hpp>

#include <algorithm>
#include <cmath>
#include <optional>

// Idle-listening threshold on both levels
static constexpr double kQuietLevel = 0.05;

static std::uint8_t toAlpha(float a) {
    return static_cast<std::uint8_t>(std::clamp(a, 0.f, 1.f) * 255.f);
}

OrbStyle computeOrbStyle(const OrbSnapshot& s) {
    const float user = static_cast<float>(std::clamp(s.userLevel, 0.0, 1.0));
    const float ai = static_cast<float>(std::clamp(s.aiLevel, 0.0, 1.0));

    OrbStyle style;
    style.userGlowScale = 1.f + user * 1.5f;
    style.aiGlowScale = 1.f + ai * 2.5f;
    style.userGlowAlpha = user * 0.5f;
    style.aiGlowAlpha = ai * 0.7f;

    switch (s.state) {
        case ConnectionState::Idle:
            style.ringColor = sf::Color(120, 120, 130);
            style.statusText = "Press connect to begin.";
            break;
        case ConnectionState::Connecting:
            style.ringColor = sf::Color(240, 180, 40);
            style.statusText = "Connecting...";
            break;
        case ConnectionState::Connected:
            style.ringColor = sf::Color(60, 200, 110);
            style.statusText = "Listening...";
            break;
        case ConnectionState::Error:
            style.ringColor = sf::Color(220, 50, 50);
            style.statusText = "Connection error. Please try again.";
            break;
        case ConnectionState::Closed:
            style.ringColor = sf::Color(70, 70, 75);
            style.statusText = "Connection closed. Press connect to begin again.";
            break;
    }

    style.idleListening = s.state == ConnectionState::Connected &&
                          s.userLevel < kQuietLevel && s.aiLevel < kQuietLevel;
    style.showStatus = s.interimUser.empty() && s.interimAi.empty();
    return style;
}

// =========================================================
// OrbView
// =========================================================
OrbView::OrbView(unsigned width, unsigned height, std::string fontPath)
    : width_(width), height_(height), fontPath_(std::move(fontPath)) {}

void OrbView::update(const OrbSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(mtx_);
    snapshot_ = snapshot;
}

void OrbView::setLevels(double user, double ai) {
    std::lock_guard<std::mutex> lock(mtx_);
    snapshot_.userLevel = user;
    snapshot_.aiLevel = ai;
}

void OrbView::setState(ConnectionState state) {
    std::lock_guard<std::mutex> lock(mtx_);
    snapshot_.state = state;
}

void OrbView::setTranscript(const std::string& user, const std::string& ai) {
    std::lock_guard<std::mutex> lock(mtx_);
    snapshot_.interimUser = user;
    snapshot_.interimAi = ai;
}

OrbSnapshot OrbView::snapshot() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return snapshot_;
}

static void drawCentered(sf::RenderWindow& window, sf::Text& text, float y) {
    sf::FloatRect b = text.getLocalBounds();
    text.setOrigin({b.position.x + b.size.x / 2.f, 0.f});
    text.setPosition({window.getSize().x / 2.f, y});
    window.draw(text);
}

static sf::CircleShape makeCircle(float radius, sf::Vector2f center) {
    sf::CircleShape c(radius, 96);
    c.setOrigin({radius, radius});
    c.setPosition(center);
    return c;
}

void OrbView::run() {
    sf::RenderWindow window(sf::VideoMode({width_, height_}), "Livewire");
    window.setFramerateLimit(kOrbFramerate);
    running_ = true;
    LOG_PHASE("Orb window open", true);

    sf::Font font;
    const bool haveFont = !fontPath_.empty() && font.openFromFile(fontPath_);
    if (!haveFont) {
        LOG_WARN("Orb", "No font loaded, status text disabled");
    }

    sf::Clock clock;
    while (window.isOpen() && !closeRequested_) {
        while (const std::optional<sf::Event> event = window.pollEvent()) {
            if (event->is<sf::Event::Closed>()) {
                window.close();
            }
        }
        if (!window.isOpen()) break;

        const OrbSnapshot snap = snapshot();
        const OrbStyle style = computeOrbStyle(snap);
        const sf::Vector2f center{width_ / 2.f, height_ * 0.42f};

        window.clear(sf::Color(14, 14, 18));

        // Glows behind the core
        sf::CircleShape aiGlow = makeCircle(kOrbRadius * style.aiGlowScale, center);
        aiGlow.setFillColor(sf::Color(170, 90, 255, toAlpha(style.aiGlowAlpha)));
        window.draw(aiGlow);

        sf::CircleShape userGlow = makeCircle(kOrbRadius * style.userGlowScale, center);
        userGlow.setFillColor(sf::Color(60, 160, 255, toAlpha(style.userGlowAlpha)));
        window.draw(userGlow);

        // Core + ring; a slow breath while idle-listening
        float radius = kOrbRadius;
        if (style.idleListening) {
            radius += 4.f * std::sin(clock.getElapsedTime().asSeconds() * 2.f);
        }
        sf::CircleShape core = makeCircle(radius, center);
        core.setFillColor(sf::Color(28, 28, 36));
        core.setOutlineColor(style.ringColor);
        core.setOutlineThickness(kOrbRingThickness);
        window.draw(core);

        if (haveFont) {
            const float textTop = center.y + kOrbRadius * 3.5f * 0.5f + 40.f;
            if (style.showStatus) {
                sf::Text status(font, style.statusText, kOrbStatusFontSize);
                status.setFillColor(sf::Color(200, 200, 210));
                drawCentered(window, status, textTop);
            } else {
                sf::Text you(font, snap.interimUser, kOrbTranscriptFontSize);
                you.setFillColor(sf::Color(120, 180, 255));
                drawCentered(window, you, textTop);

                sf::Text ai(font, snap.interimAi, kOrbTranscriptFontSize);
                ai.setFillColor(sf::Color(200, 160, 255));
                drawCentered(window, ai, textTop + kOrbTranscriptFontSize * 1.6f);
            }
        }

        window.display();
    }

    if (window.isOpen()) window.close();
    running_ = false;
    LOG_PHASE("Orb window closed", true);
}
