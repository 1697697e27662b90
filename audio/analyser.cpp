#include "audio/analyser.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

static constexpr double PI = 3.14159265358979323846;

// FFTW's planner is not thread-safe; plans are created and destroyed under this.
static std::mutex g_plannerMutex;

static bool isPowerOfTwo(std::size_t n) {
    return n >= 32 && (n & (n - 1)) == 0;
}

Analyser::Analyser(std::size_t fftSize, double smoothing, double minDb, double maxDb)
    : fftSize_(fftSize),
      smoothing_(std::clamp(smoothing, 0.0, 1.0)),
      minDb_(minDb),
      maxDb_(maxDb)
{
    if (!isPowerOfTwo(fftSize_))
        throw std::invalid_argument("Analyser fftSize must be a power of two >= 32");
    if (maxDb_ <= minDb_)
        throw std::invalid_argument("Analyser maxDb must exceed minDb");

    ring_.assign(fftSize_, 0.0f);
    smoothed_.assign(frequencyBinCount(), 0.0);

    // Blackman window
    window_.resize(fftSize_);
    const double a0 = 0.42, a1 = 0.5, a2 = 0.08;
    for (std::size_t i = 0; i < fftSize_; i++) {
        double x = static_cast<double>(i) / fftSize_;
        window_[i] = a0 - a1 * std::cos(2.0 * PI * x) + a2 * std::cos(4.0 * PI * x);
    }

    std::lock_guard<std::mutex> lock(g_plannerMutex);
    in_  = static_cast<double*>(fftw_malloc(sizeof(double) * fftSize_));
    out_ = static_cast<fftw_complex*>(fftw_malloc(sizeof(fftw_complex) * (fftSize_ / 2 + 1)));
    if (!in_ || !out_) {
        if (in_) fftw_free(in_);
        if (out_) fftw_free(out_);
        throw std::runtime_error("fftw_malloc failed");
    }
    plan_ = fftw_plan_dft_r2c_1d(static_cast<int>(fftSize_), in_, out_, FFTW_ESTIMATE);
    if (!plan_) {
        fftw_free(in_);
        fftw_free(out_);
        throw std::runtime_error("fftw_plan_dft_r2c_1d failed");
    }
}

Analyser::~Analyser() {
    std::lock_guard<std::mutex> lock(g_plannerMutex);
    if (plan_)
        fftw_destroy_plan(plan_);
    if (in_)
        fftw_free(in_);
    if (out_)
        fftw_free(out_);
}

void Analyser::push(const float* samples, std::size_t count) {
    if (!samples || count == 0) return;
    std::lock_guard<std::mutex> lock(ringMtx_);
    // Only the newest fftSize_ samples matter
    if (count > fftSize_) {
        samples += count - fftSize_;
        count = fftSize_;
    }
    for (std::size_t i = 0; i < count; i++) {
        ring_[writePos_] = samples[i];
        writePos_ = (writePos_ + 1) % fftSize_;
    }
}

void Analyser::reset() {
    {
        std::lock_guard<std::mutex> lock(ringMtx_);
        std::fill(ring_.begin(), ring_.end(), 0.0f);
        writePos_ = 0;
    }
    std::lock_guard<std::mutex> lock(fftMtx_);
    std::fill(smoothed_.begin(), smoothed_.end(), 0.0);
}

std::vector<std::uint8_t> Analyser::byteFrequencyData() {
    std::lock_guard<std::mutex> fftLock(fftMtx_);

    // Oldest sample first
    {
        std::lock_guard<std::mutex> lock(ringMtx_);
        for (std::size_t i = 0; i < fftSize_; i++) {
            in_[i] = static_cast<double>(ring_[(writePos_ + i) % fftSize_]) * window_[i];
        }
    }

    fftw_execute(plan_);

    const std::size_t bins = frequencyBinCount();
    const double rangeScale = 255.0 / (maxDb_ - minDb_);
    std::vector<std::uint8_t> bytes(bins, 0);

    for (std::size_t k = 0; k < bins; k++) {
        double re = out_[k][0], im = out_[k][1];
        double magnitude = std::sqrt(re * re + im * im) / static_cast<double>(fftSize_);
        smoothed_[k] = smoothing_ * smoothed_[k] + (1.0 - smoothing_) * magnitude;

        if (smoothed_[k] <= 0.0) continue;   // -inf dB -> 0
        double db = 20.0 * std::log10(smoothed_[k]);
        double scaled = rangeScale * (db - minDb_);
        bytes[k] = static_cast<std::uint8_t>(std::clamp(scaled, 0.0, 255.0));
    }
    return bytes;
}
