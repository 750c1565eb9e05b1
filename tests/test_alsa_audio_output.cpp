#include <gtest/gtest.h>
#include "audio_output.hpp"
#include <thread>
#include <vector>

using namespace std::chrono_literals;

// Runs against the "null" PCM from alsa-lib's configuration, so no sound
// card is needed. Skipped when alsa-lib cannot provide it.
class AlsaAudioOutputTest : public ::testing::Test {
protected:
    void SetUp() override {
        format.sample_rate = 8000;
        format.channels = 2;
        settings.device = "null";
        settings.buffer_ms = 200;
        settings.period_ms = 20;
        if (output.open(format, settings) != oneamp::AudioError::SUCCESS) {
            GTEST_SKIP() << "ALSA null device unavailable";
        }
    }

    void TearDown() override {
        output.close();
    }

    size_t fill(size_t count) {
        std::vector<float> samples(count, 0.25f);
        return output.write(samples.data(), samples.size(), 50ms);
    }

    bool wait_until_played(std::chrono::milliseconds limit) {
        const auto deadline = std::chrono::steady_clock::now() + limit;
        while (std::chrono::steady_clock::now() < deadline) {
            if (output.pending_samples() == 0) {
                return true;
            }
            std::this_thread::sleep_for(5ms);
        }
        return output.pending_samples() == 0;
    }

    oneamp::AlsaAudioOutput output;
    oneamp::AudioFormat format;
    oneamp::OutputSettings settings;
};

TEST_F(AlsaAudioOutputTest, PendingIncludesRing) {
    EXPECT_EQ(fill(1600), 1600u);
    EXPECT_EQ(output.buffered_samples(), 1600u);
    EXPECT_GE(output.pending_samples(), 1600u);
}

TEST_F(AlsaAudioOutputTest, StopDiscardsEverythingQueued) {
    fill(3200);
    ASSERT_TRUE(output.start());
    std::this_thread::sleep_for(30ms);

    ASSERT_TRUE(output.stop());
    EXPECT_EQ(output.buffered_samples(), 0u);
    EXPECT_EQ(output.pending_samples(), 0u);
    EXPECT_TRUE(output.is_open());
    EXPECT_EQ(output.device_error(), oneamp::AudioError::SUCCESS);
}

TEST_F(AlsaAudioOutputTest, RepeatedFlushesKeepDeviceHealthy) {
    for (int i = 0; i < 20; ++i) {
        fill(800);
        ASSERT_TRUE(output.start());
        std::this_thread::sleep_for(2ms);
        ASSERT_TRUE(output.stop());
        EXPECT_EQ(output.pending_samples(), 0u);
    }
    EXPECT_EQ(output.device_error(), oneamp::AudioError::SUCCESS);
}

TEST_F(AlsaAudioOutputTest, DrainPlaysOutEverything) {
    fill(1600);
    ASSERT_TRUE(output.start());
    output.drain();

    EXPECT_TRUE(wait_until_played(2000ms));
    EXPECT_EQ(output.buffered_samples(), 0u);
    EXPECT_EQ(output.device_error(), oneamp::AudioError::SUCCESS);

    // The sink is reusable after a drained track
    ASSERT_TRUE(output.stop());
    EXPECT_EQ(fill(100), 100u);
    ASSERT_TRUE(output.start());
}

TEST_F(AlsaAudioOutputTest, PauseKeepsUnplayedSamples) {
    fill(3200);
    ASSERT_TRUE(output.start());
    std::this_thread::sleep_for(10ms);
    ASSERT_TRUE(output.pause());
    EXPECT_FALSE(output.is_playing());

    ASSERT_TRUE(output.resume());
    output.drain();
    EXPECT_TRUE(wait_until_played(2000ms));
    EXPECT_EQ(output.device_error(), oneamp::AudioError::SUCCESS);
}
