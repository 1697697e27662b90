#pragma once
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <vector>

#include <fftw3.h>

/// Analyser
/// Frequency-domain tap on an audio graph. Device threads push()
/// samples as they flow; the level meter pulls byteFrequencyData().
///
/// Magnitudes follow the usual analyser-node recipe: Blackman window,
/// |X[k]| / N, exponential smoothing over successive snapshots, then
/// decibels mapped linearly from [minDb, maxDb] onto [0, 255].
class Analyser {
public:
    explicit Analyser(std::size_t fftSize = 256,
                      double smoothing = 0.8,
                      double minDb = -100.0,
                      double maxDb = -30.0);
    ~Analyser();

    Analyser(const Analyser&) = delete;
    Analyser& operator=(const Analyser&) = delete;

    void push(const float* samples, std::size_t count);
    std::vector<std::uint8_t> byteFrequencyData();
    void reset();

    std::size_t fftSize() const { return fftSize_; }
    std::size_t frequencyBinCount() const { return fftSize_ / 2; }

private:
    std::size_t fftSize_;
    double smoothing_;
    double minDb_;
    double maxDb_;

    // Rolling time-domain window (guarded by ringMtx_)
    std::mutex ringMtx_;
    std::vector<float> ring_;
    std::size_t writePos_ = 0;

    // FFT state, only touched by byteFrequencyData()/reset()
    std::mutex fftMtx_;
    std::vector<double> window_;
    std::vector<double> smoothed_;
    double* in_ = nullptr;
    fftw_complex* out_ = nullptr;
    fftw_plan plan_ = nullptr;
};
