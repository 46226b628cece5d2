#include <catch2/catch.hpp>

#include "peq/biquad.hpp"

#include <array>
#include <type_traits>
#include <utility>
#include <vector>

using namespace peq::dsp;

namespace {

// Stereo impulse on the left channel, silence on the right.
Buffer left_impulse(std::size_t frames) {
    Buffer b(frames * 2, 0.0f);
    b[0] = 1.0f;
    return b;
}

template <typename T, typename = void>
struct takes_temporary : std::false_type {};
template <typename T>
struct takes_temporary<T, std::void_t<decltype(std::declval<BiquadFilter&>().process_stereo(std::declval<T>()))>>
    : std::true_type {};

} // namespace

TEST_CASE("zero gain designs exact unity coefficients", "[biquad]") {
    const auto c = design_peaking(44100, 1000, 0.0, 1.4);
    CHECK(c.b0 == 1.0);
    CHECK(c.b1 == 0.0);
    CHECK(c.b2 == 0.0);
    CHECK(c.a1 == 0.0);
    CHECK(c.a2 == 0.0);
    CHECK(c.is_unity());
}

TEST_CASE("zero gain filter hands back the same buffer", "[biquad]") {
    BiquadFilter bq(44100, 1000, 0.0);
    SECTION("even length") {
        const Buffer in = {0.1f, -0.2f, 0.3f, -0.4f};
        const Buffer& out = bq.process_stereo(in);
        CHECK(&out == &in);
        CHECK(out == Buffer({0.1f, -0.2f, 0.3f, -0.4f}));
    }
    SECTION("empty") {
        const Buffer in;
        CHECK(&bq.process_stereo(in) == &in);
    }
    SECTION("odd length") {
        const Buffer in = {0.5f, 0.25f, 0.125f};
        CHECK(&bq.process_stereo(in) == &in);
    }
    CHECK(bq.left_state().y1 == 0.0);
}

TEST_CASE("identical parameters give bit-identical coefficients", "[biquad]") {
    BiquadFilter a(48000, 250, -3.5, 0.9);
    BiquadFilter b(48000, 250, -3.5, 0.9);
    CHECK(a.coefficients().b0 == b.coefficients().b0);
    CHECK(a.coefficients().b1 == b.coefficients().b1);
    CHECK(a.coefficients().b2 == b.coefficients().b2);
    CHECK(a.coefficients().a1 == b.coefficients().a1);
    CHECK(a.coefficients().a2 == b.coefficients().a2);
}

TEST_CASE("1 kHz +6 dB impulse response", "[biquad][regression]") {
    BiquadFilter bq(44100, 1000, 6.0, 1.4);
    bq.reset();

    const auto& c = bq.coefficients();
    CHECK(c.b0 == Approx(1.0344930836003479).epsilon(1e-12));
    CHECK(c.b1 == Approx(-1.9111227194596088).epsilon(1e-12));
    CHECK(c.b2 == Approx(0.8961923586562969).epsilon(1e-12));
    CHECK(c.a1 == Approx(-1.9111227194596088).epsilon(1e-12));
    CHECK(c.a2 == Approx(0.9306854422566447).epsilon(1e-12));

    const std::array<double, 8> expected = {
        1.034493088722229,
        0.06592051684856415,
        0.059386901557445526,
        0.05214438959956169,
        0.044383805245161057,
        0.03629287704825401,
        0.02805277705192566,
        0.01983504742383957,
    };

    const Buffer in = left_impulse(expected.size());
    const Buffer& out = bq.process_stereo(in);
    REQUIRE(out.size() == in.size());
    CHECK(&out != &in);
    for (std::size_t n = 0; n < expected.size(); ++n) {
        INFO("frame " << n);
        CHECK(out[2*n] == Approx(expected[n]).epsilon(1e-6));
        CHECK(out[2*n + 1] == 0.0f);
    }
}

TEST_CASE("channels keep separate history", "[biquad]") {
    BiquadFilter left(44100, 1000, 6.0);
    BiquadFilter right(44100, 1000, 6.0);

    Buffer l = left_impulse(16);
    Buffer r(32, 0.0f);
    r[1] = 1.0f;

    const Buffer outL = left.process_stereo(l);
    const Buffer outR = right.process_stereo(r);
    for (std::size_t n = 0; n < 16; ++n) {
        CHECK(outL[2*n] == outR[2*n + 1]);
        CHECK(outR[2*n] == 0.0f);
    }
    CHECK(left.right_state().x1 == 0.0);
    CHECK(right.left_state().y1 == 0.0);
}

TEST_CASE("history carries over between calls", "[biquad]") {
    BiquadFilter whole(44100, 125, 4.0);
    BiquadFilter split(44100, 125, 4.0);

    Buffer sig(64);
    for (std::size_t i = 0; i < sig.size(); ++i) sig[i] = (i % 7) * 0.1f - 0.3f;

    const Buffer all = whole.process_stereo(sig);
    const Buffer a(sig.begin(), sig.begin() + 20);
    const Buffer b(sig.begin() + 20, sig.end());
    Buffer joined = split.process_stereo(a);
    const Buffer& second = split.process_stereo(b);
    joined.insert(joined.end(), second.begin(), second.end());

    CHECK(joined == all);
}

TEST_CASE("set_gain keeps history and recomputes coefficients", "[biquad]") {
    BiquadFilter bq(44100, 1000, 6.0);
    const Buffer imp = left_impulse(4);
    bq.process_stereo(imp);
    const ChannelState before = bq.left_state();
    REQUIRE(before.y1 != 0.0);

    SECTION("same value is a no-op") {
        const FilterCoefficients c = bq.coefficients();
        bq.set_gain(6.0);
        CHECK(bq.coefficients().b0 == c.b0);
        CHECK(bq.coefficients().a2 == c.a2);
    }
    SECTION("new value") {
        bq.set_gain(-6.0);
        CHECK(bq.gain_db() == -6.0);
        CHECK(bq.coefficients().b0 == design_peaking(44100, 1000, -6.0, 1.4).b0);
        CHECK(bq.left_state().y1 == before.y1);
        CHECK(bq.left_state().x2 == before.x2);
    }
    SECTION("back to zero bypasses but does not clear history") {
        bq.set_gain(0.0);
        CHECK(bq.coefficients().is_unity());
        const Buffer in = {1.0f, 1.0f};
        CHECK(&bq.process_stereo(in) == &in);
        CHECK(bq.left_state().y1 == before.y1);
    }
}

TEST_CASE("reset clears history only", "[biquad]") {
    BiquadFilter bq(44100, 62, 8.0);
    const Buffer in = {0.5f, -0.5f, 0.25f, -0.25f};
    bq.process_stereo(in);
    const FilterCoefficients c = bq.coefficients();
    bq.reset();
    CHECK(bq.left_state().x1 == 0.0);
    CHECK(bq.left_state().x2 == 0.0);
    CHECK(bq.left_state().y1 == 0.0);
    CHECK(bq.left_state().y2 == 0.0);
    CHECK(bq.right_state().x1 == 0.0);
    CHECK(bq.right_state().y2 == 0.0);
    CHECK(bq.coefficients().b0 == c.b0);
    CHECK(bq.coefficients().a1 == c.a1);
}

TEST_CASE("unpaired trailing sample passes through", "[biquad]") {
    BiquadFilter bq(44100, 1000, 6.0);
    const Buffer in = {0.25f, 0.0f, 0.5f};
    const Buffer& out = bq.process_stereo(in);
    REQUIRE(out.size() == 3);
    CHECK(out[2] == 0.5f);
    CHECK(bq.left_state().x1 == 0.25);
    CHECK(bq.left_state().x2 == 0.0);
}

TEST_CASE("in-place processing matches the buffer form", "[biquad]") {
    BiquadFilter a(44100, 4000, -5.0);
    BiquadFilter b(44100, 4000, -5.0);
    Buffer sig = {0.3f, -0.1f, 0.2f, 0.7f, -0.9f, 0.0f, 0.05f, 0.4f};
    const Buffer expected = a.process_stereo(sig);
    b.process_stereo(sig.data(), sig.size());
    CHECK(sig == expected);
}

TEST_CASE("output buffer is reused across calls", "[biquad]") {
    BiquadFilter bq(44100, 500, 3.0);
    const Buffer in(256, 0.1f);
    const Buffer* first = &bq.process_stereo(in);
    const Buffer* second = &bq.process_stereo(in);
    CHECK(first == second);
    CHECK(first->data() == second->data());
}

TEST_CASE("peaking magnitude at the centre equals the gain", "[biquad][response]") {
    const auto boost = design_peaking(44100, 1000, 6.0, 1.4);
    CHECK(boost.magnitude_db(1000, 44100) == Approx(6.0).margin(1e-9));
    const auto cut = design_peaking(48000, 250, -9.0, 1.4);
    CHECK(cut.magnitude_db(250, 48000) == Approx(-9.0).margin(1e-9));
    CHECK(cut.magnitude_db(16000, 48000) == Approx(0.0).margin(0.05));
    CHECK(FilterCoefficients{}.magnitude_db(1000, 44100) == 0.0);
}

TEST_CASE("buffer form only binds to lvalues", "[biquad]") {
    STATIC_REQUIRE(takes_temporary<const Buffer&>::value);
    STATIC_REQUIRE(takes_temporary<Buffer&>::value);
    STATIC_REQUIRE_FALSE(takes_temporary<Buffer>::value);
    STATIC_REQUIRE_FALSE(takes_temporary<Buffer&&>::value);
}
