#include "peq/equalizer.hpp"
#include <algorithm>
#include <cmath>

namespace peq::dsp {

bool band_within_nyquist(int sample_rate, double frequency) {
    return sample_rate > 0 && frequency > 0.0 && frequency < sample_rate / 2.0;
}

EqualizerProcessor::EqualizerProcessor(int sample_rate) : fs_(sample_rate) {
    build_bands();
}

void EqualizerProcessor::build_bands() {
    bands_.clear();
    bands_.reserve(kNumBands);
    for (double f : kBandFrequencies) bands_.emplace_back(fs_, f, 0.0);
}

void EqualizerProcessor::set_bands(const std::vector<double>& gains) {
    const std::size_t n = std::min(gains.size(), bands_.size());
    for (std::size_t i = 0; i < n; ++i) bands_[i].set_gain(gains[i]);
}

void EqualizerProcessor::set_sample_rate(int sample_rate) {
    if (fs_ == sample_rate) return;
    const auto g = gains();
    fs_ = sample_rate;
    build_bands();
    set_bands(std::vector<double>(g.begin(), g.end()));
}

const Buffer& EqualizerProcessor::process(const Buffer& in) {
    if (!enabled_) return in;

    const Buffer* cur = &in;
    for (auto& bq : bands_) {
        if (bq.bypassed()) continue;
        // `in` may already be out_ when fed back from a previous call
        if (cur != &out_) {
            out_.assign(in.begin(), in.end());
            cur = &out_;
        }
        bq.process_stereo(out_.data(), out_.size());
    }
    return *cur;
}

void EqualizerProcessor::reset() {
    for (auto& bq : bands_) bq.reset();
}

std::array<double, kNumBands> EqualizerProcessor::gains() const {
    std::array<double, kNumBands> g{};
    for (std::size_t i = 0; i < kNumBands; ++i) g[i] = bands_[i].gain_db();
    return g;
}

double EqualizerProcessor::response_db(double frequency) const {
    double db = 0.0;
    for (const auto& bq : bands_) db += bq.coefficients().magnitude_db(frequency, fs_);
    return db;
}

std::vector<double> EqualizerProcessor::frequency_response(std::size_t points, double fmin, double fmax) const {
    std::vector<double> out(points);
    if (points == 0) return out;
    const double lo = std::log10(fmin), hi = std::log10(fmax);
    for (std::size_t i = 0; i < points; ++i) {
        const double t = (points > 1) ? static_cast<double>(i) / (points - 1) : 0.0;
        out[i] = response_db(std::pow(10.0, lo + t * (hi - lo)));
    }
    return out;
}

} // namespace peq::dsp
