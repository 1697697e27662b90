#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

#include "event_loop.hpp"

class Analyser;

/// LevelMeter
/// Fixed-interval task on the event loop. Each tick reads both
/// analysers and publishes (userLevel, aiLevel), each in [0, 1].
class LevelMeter {
public:
    using LevelCallback = std::function<void(double user, double ai)>;

    explicit LevelMeter(EventLoop& loop,
                        std::chrono::milliseconds interval = std::chrono::milliseconds(16));
    ~LevelMeter();

    LevelMeter(const LevelMeter&) = delete;
    LevelMeter& operator=(const LevelMeter&) = delete;

    // Either analyser may be null; a missing one reads as 0.
    void attach(Analyser* input, Analyser* output);
    void onLevel(LevelCallback cb) { onLevel_ = std::move(cb); }

    void start();
    // Cancels the pending tick. Safe when already stopped.
    void stop();

    bool isRunning() const { return running_; }
    double userLevel() const { return user_; }
    double aiLevel() const { return ai_; }

    // min(1, mean(bins) / 128); 0 for no bins.
    static double normalize(const std::vector<std::uint8_t>& bins);

    // One measurement, outside the cadence (tests, first frame).
    void tick();

private:
    void schedule();
    void publish(double user, double ai);

    EventLoop& loop_;
    std::chrono::milliseconds interval_;
    Analyser* input_ = nullptr;
    Analyser* output_ = nullptr;
    LevelCallback onLevel_;

    bool running_ = false;
    EventLoop::TimerId timer_ = 0;
    double user_ = 0.0;
    double ai_ = 0.0;

    // Ticks already taken by the loop check this before touching *this
    std::shared_ptr<int> alive_ = std::make_shared<int>(0);
};
