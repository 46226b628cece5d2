#pragma once
#include "peq/biquad.hpp"

#include <array>
#include <cstddef>
#include <vector>

namespace peq::dsp {

constexpr std::size_t kNumBands = 10;
constexpr std::array<double, kNumBands> kBandFrequencies = {
    31, 62, 125, 250, 500, 1000, 2000, 4000, 8000, 16000
};

// True when a band at `frequency` is representable at `sample_rate`.
bool band_within_nyquist(int sample_rate, double frequency);

// Fixed 10-band cascade of peaking filters, lowest band first.
// Not synchronized: process() and the setters must not run concurrently.
class EqualizerProcessor {
public:
    explicit EqualizerProcessor(int sample_rate = 44100);

    // Extra values are ignored, missing ones leave their band as is.
    void set_bands(const std::vector<double>& gains);
    // Rebuilds every band at the new rate; gains survive, history does not.
    void set_sample_rate(int sample_rate);

    bool enabled() const { return enabled_; }
    void set_enabled(bool on) { enabled_ = on; }

    // Returns `in` itself when disabled or when every band is at 0 dB.
    // Otherwise the result lives in a buffer owned by the processor and
    // stays valid until the next call.
    const Buffer& process(const Buffer& in);
    const Buffer& process(Buffer&&) = delete;

    void reset();

    int sample_rate() const { return fs_; }
    std::array<double, kNumBands> gains() const;
    const BiquadFilter& band(std::size_t i) const { return bands_.at(i); }

    double response_db(double frequency) const;
    std::vector<double> frequency_response(std::size_t points, double fmin, double fmax) const;

private:
    void build_bands();

    int fs_;
    bool enabled_{false};
    std::vector<BiquadFilter> bands_;
    Buffer out_;
};

} // namespace peq::dsp
