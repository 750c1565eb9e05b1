#include <gtest/gtest.h>
#include "biquad_filter.hpp"
#include "equalizer.hpp"
#include <cmath>
#include <random>
#include <vector>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

class BiquadFilterTest : public ::testing::Test {
protected:
    static constexpr double SAMPLE_RATE = 44100.0;

    std::vector<float> impulse_response(oneamp::BiquadFilter& filter, size_t length) {
        std::vector<float> out(length);
        for (size_t i = 0; i < length; ++i) {
            out[i] = filter.process_sample(i == 0 ? 1.0f : 0.0f);
        }
        return out;
    }
};

TEST_F(BiquadFilterTest, DefaultIsPassthrough) {
    oneamp::BiquadFilter filter;
    EXPECT_TRUE(filter.is_passthrough());
    EXPECT_FLOAT_EQ(filter.process_sample(0.25f), 0.25f);
    EXPECT_FLOAT_EQ(filter.process_sample(-0.5f), -0.5f);
}

TEST_F(BiquadFilterTest, ImpulseResponseDecaysForAllBandsAndGains) {
    const size_t length = 44100;

    for (double frequency : oneamp::Equalizer::band_frequencies()) {
        for (int gain = -12; gain <= 12; gain += 2) {
            oneamp::BiquadFilter filter;
            filter.configure(frequency, gain, SAMPLE_RATE, oneamp::Equalizer::Q_FACTOR);
            filter.reset();

            auto response = impulse_response(filter, length);

            for (float y : response) {
                ASSERT_TRUE(std::isfinite(y)) << "frequency " << frequency << " gain " << gain;
            }
            for (size_t i = length - 1000; i < length; ++i) {
                ASSERT_LT(std::fabs(response[i]), 1e-6f) << "frequency " << frequency << " gain " << gain;
            }
        }
    }
}

TEST_F(BiquadFilterTest, ZeroGainIsUnity) {
    oneamp::BiquadFilter filter;
    filter.configure(1000.0, 0.0, SAMPLE_RATE, 1.0);

    std::mt19937 rng(7);
    std::uniform_real_distribution<float> dist(-1.0f, 1.0f);
    for (int i = 0; i < 2048; ++i) {
        const float x = dist(rng);
        EXPECT_NEAR(filter.process_sample(x), x, 1e-6f);
    }
}

TEST_F(BiquadFilterTest, BoostRaisesCenterFrequencyLevel) {
    oneamp::BiquadFilter filter;
    filter.configure(1000.0, 6.0, SAMPLE_RATE, 1.0);

    float peak = 0.0f;
    for (int i = 0; i < 44100; ++i) {
        const float x = static_cast<float>(std::sin(2.0 * M_PI * 1000.0 * i / SAMPLE_RATE));
        const float y = filter.process_sample(x);
        if (i > 22050) {
            peak = std::max(peak, std::fabs(y));
        }
    }
    // +6 dB is a factor of about 1.995
    EXPECT_NEAR(peak, 1.995f, 0.02f);
}

TEST_F(BiquadFilterTest, ResetTwiceEqualsResetOnce) {
    oneamp::BiquadFilter once;
    oneamp::BiquadFilter twice;
    once.configure(125.0, 9.0, SAMPLE_RATE, 1.0);
    twice.configure(125.0, 9.0, SAMPLE_RATE, 1.0);

    std::mt19937 rng(42);
    std::uniform_real_distribution<float> dist(-1.0f, 1.0f);
    for (int i = 0; i < 512; ++i) {
        const float x = dist(rng);
        once.process_sample(x);
        twice.process_sample(x);
    }

    once.reset();
    twice.reset();
    twice.reset();

    auto a = impulse_response(once, 4096);
    auto b = impulse_response(twice, 4096);
    EXPECT_EQ(a, b);
}

TEST_F(BiquadFilterTest, SilenceAfterResetIsExactlyZero) {
    oneamp::BiquadFilter filter;
    filter.configure(62.5, 12.0, SAMPLE_RATE, 1.0);

    for (int i = 0; i < 1000; ++i) {
        filter.process_sample(i % 2 == 0 ? 0.9f : -0.9f);
    }
    filter.reset();

    for (int i = 0; i < 10000; ++i) {
        ASSERT_EQ(filter.process_sample(0.0f), 0.0f);
    }
}

TEST_F(BiquadFilterTest, SilenceSettlesWithoutNaN) {
    oneamp::BiquadFilter filter;
    filter.configure(31.25, 12.0, SAMPLE_RATE, 1.0);

    for (int i = 0; i < 1000; ++i) {
        filter.process_sample(1.0f);
    }

    float last = 1.0f;
    for (int i = 0; i < 200000; ++i) {
        last = filter.process_sample(0.0f);
        ASSERT_TRUE(std::isfinite(last));
    }
    EXPECT_LT(std::fabs(last), 1e-12f);
}

TEST_F(BiquadFilterTest, BandAtOrAboveNyquistIsPassthrough) {
    oneamp::BiquadFilter filter;
    filter.configure(16000.0, 12.0, 22050.0, 1.0);
    EXPECT_TRUE(filter.is_passthrough());

    filter.configure(16000.0, 12.0, 44100.0, 1.0);
    EXPECT_FALSE(filter.is_passthrough());

    filter.configure(1000.0, 6.0, 0.0, 1.0);
    EXPECT_TRUE(filter.is_passthrough());
}

TEST_F(BiquadFilterTest, ConfigureKeepsDelayState) {
    oneamp::BiquadFilter filter;
    filter.configure(250.0, 6.0, SAMPLE_RATE, 1.0);
    filter.process_sample(1.0f);

    filter.configure(250.0, -6.0, SAMPLE_RATE, 1.0);
    // Registers still hold the impulse, so silence does not produce silence
    EXPECT_NE(filter.process_sample(0.0f), 0.0f);
}
