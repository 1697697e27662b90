#include "voice/level_meter.hpp"
#include "audio/analyser.hpp"
#include "logger.hpp"

#include <algorithm>
#include <numeric>

LevelMeter::LevelMeter(EventLoop& loop, std::chrono::milliseconds interval)
    : loop_(loop), interval_(interval.count() > 0 ? interval : std::chrono::milliseconds(16)) {}

LevelMeter::~LevelMeter() {
    if (timer_) loop_.cancel(timer_);
}

void LevelMeter::attach(Analyser* input, Analyser* output) {
    input_ = input;
    output_ = output;
}

double LevelMeter::normalize(const std::vector<std::uint8_t>& bins) {
    if (bins.empty()) return 0.0;
    double sum = std::accumulate(bins.begin(), bins.end(), 0.0);
    double mean = sum / static_cast<double>(bins.size());
    return std::clamp(mean / 128.0, 0.0, 1.0);
}

void LevelMeter::start() {
    if (running_) return;
    running_ = true;
    LOG_TRACE("Meter", "Level meter started (" + std::to_string(interval_.count()) + " ms)");
    schedule();
}

void LevelMeter::stop() {
    if (!running_) return;
    running_ = false;
    if (timer_) {
        loop_.cancel(timer_);
        timer_ = 0;
    }
    publish(0.0, 0.0);
    LOG_TRACE("Meter", "Level meter stopped");
}

void LevelMeter::schedule() {
    std::weak_ptr<int> alive = alive_;
    timer_ = loop_.postDelayed(interval_, [this, alive]() {
        if (alive.expired()) return;
        timer_ = 0;
        if (!running_) return;
        tick();
        if (running_) schedule();
    });
}

void LevelMeter::tick() {
    double user = input_ ? normalize(input_->byteFrequencyData()) : 0.0;
    double ai = output_ ? normalize(output_->byteFrequencyData()) : 0.0;
    publish(user, ai);
}

void LevelMeter::publish(double user, double ai) {
    user_ = user;
    ai_ = ai;
    if (onLevel_) onLevel_(user, ai);
}
