#pragma once
#include <cstddef>
#include <vector>

namespace peq::dsp {

using Buffer = std::vector<float>;

struct FilterCoefficients {
    double b0{1}, b1{0}, b2{0}, a1{0}, a2{0};

    bool is_unity() const {
        return b0 == 1.0 && b1 == 0.0 && b2 == 0.0 && a1 == 0.0 && a2 == 0.0;
    }
    // Magnitude of H(e^jw) at `frequency`, in dB.
    double magnitude_db(double frequency, double fs) const;
};

// Last two inputs and outputs of one channel.
struct ChannelState {
    double x1{0}, x2{0}, y1{0}, y2{0};

    double step(const FilterCoefficients& c, double x0) {
        const double y0 = c.b0*x0 + c.b1*x1 + c.b2*x2 - c.a1*y1 - c.a2*y2;
        x2 = x1; x1 = x0;
        y2 = y1; y1 = y0;
        return y0;
    }
    void clear() { x1 = x2 = y1 = y2 = 0; }
};

// RBJ cookbook peaking EQ. gain_db == 0.0 yields exact unity.
FilterCoefficients design_peaking(double fs, double f0, double gain_db, double Q);

// One peaking band over interleaved stereo [L0,R0,L1,R1,...].
// A gain of exactly 0 dB bypasses the band: the input is handed back untouched.
// An unpaired trailing sample is passed through and does not touch history.
class BiquadFilter {
public:
    static constexpr double kDefaultQ = 1.4;

    BiquadFilter(int sample_rate, double frequency, double gain_db, double Q = kDefaultQ);

    void set_gain(double gain_db);

    // Returns `in` itself when bypassed, otherwise a buffer owned by this
    // filter that stays valid until the next call.
    const Buffer& process_stereo(const Buffer& in);
    const Buffer& process_stereo(Buffer&&) = delete;
    void process_stereo(float* samples, std::size_t len);

    void reset();

    bool bypassed() const { return gain_db_ == 0.0; }
    int sample_rate() const { return fs_; }
    double frequency() const { return f0_; }
    double gain_db() const { return gain_db_; }
    double q() const { return Q_; }
    const FilterCoefficients& coefficients() const { return coeffs_; }
    const ChannelState& left_state() const { return left_; }
    const ChannelState& right_state() const { return right_; }

private:
    void run(const float* in, float* out, std::size_t len);

    int fs_;
    double f0_;
    double gain_db_;
    double Q_;
    FilterCoefficients coeffs_;
    ChannelState left_, right_;
    Buffer out_;
};

} // namespace peq::dsp
