#include "peq/biquad.hpp"
#include <cmath>
#include <complex>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace peq::dsp {

double FilterCoefficients::magnitude_db(double frequency, double fs) const {
    if (is_unity()) return 0.0;
    const double w = 2.0 * M_PI * frequency / fs;
    const std::complex<double> z1 = std::polar(1.0, -w);
    const std::complex<double> z2 = z1 * z1;
    const std::complex<double> num = b0 + b1*z1 + b2*z2;
    const std::complex<double> den = 1.0 + a1*z1 + a2*z2;
    return 20.0 * std::log10(std::abs(num) / std::abs(den));
}

static inline FilterCoefficients normalize(double b0, double b1, double b2, double a0, double a1, double a2) {
    FilterCoefficients c;
    c.b0 = b0 / a0; c.b1 = b1 / a0; c.b2 = b2 / a0;
    c.a1 = a1 / a0; c.a2 = a2 / a0;
    return c;
}

FilterCoefficients design_peaking(double fs, double f0, double gain_db, double Q) {
    if (gain_db == 0.0) return FilterCoefficients{};
    const double A = std::pow(10.0, gain_db / 40.0);
    const double w0 = 2.0 * M_PI * f0 / fs;
    const double c = std::cos(w0), s = std::sin(w0);
    const double alpha = s / (2.0 * Q);
    const double b0 = 1.0 + alpha * A;
    const double b1 = -2.0 * c;
    const double b2 = 1.0 - alpha * A;
    const double a0 = 1.0 + alpha / A;
    const double a1 = -2.0 * c;
    const double a2 = 1.0 - alpha / A;
    return normalize(b0, b1, b2, a0, a1, a2);
}

BiquadFilter::BiquadFilter(int sample_rate, double frequency, double gain_db, double Q)
    : fs_(sample_rate), f0_(frequency), gain_db_(gain_db), Q_(Q),
      coeffs_(design_peaking(sample_rate, frequency, gain_db, Q)) {}

void BiquadFilter::set_gain(double gain_db) {
    if (gain_db_ == gain_db) return;
    gain_db_ = gain_db;
    // channel history is left as is
    coeffs_ = design_peaking(fs_, f0_, gain_db_, Q_);
}

const Buffer& BiquadFilter::process_stereo(const Buffer& in) {
    if (bypassed()) return in;
    out_.resize(in.size());
    run(in.data(), out_.data(), in.size());
    return out_;
}

void BiquadFilter::process_stereo(float* samples, std::size_t len) {
    if (bypassed()) return;
    run(samples, samples, len);
}

void BiquadFilter::run(const float* in, float* out, std::size_t len) {
    const std::size_t paired = len & ~std::size_t(1);
    for (std::size_t i = 0; i < paired; i += 2) {
        out[i]     = static_cast<float>(left_.step(coeffs_, in[i]));
        out[i + 1] = static_cast<float>(right_.step(coeffs_, in[i + 1]));
    }
    if (paired != len) out[paired] = in[paired];
}

void BiquadFilter::reset() {
    left_.clear();
    right_.clear();
}

} // namespace peq::dsp
