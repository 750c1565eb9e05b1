#include <gtest/gtest.h>
#include "playback_mirror.hpp"

class PlaybackMirrorTest : public ::testing::Test {
protected:
    oneamp::PlaybackMirror mirror;

    static oneamp::TrackMetadata track(double duration) {
        oneamp::TrackMetadata metadata;
        metadata.file_path = "song.flac";
        metadata.title = "Song";
        metadata.duration = duration;
        return metadata;
    }
};

TEST_F(PlaybackMirrorTest, InitialState) {
    EXPECT_EQ(mirror.state(), oneamp::EngineState::IDLE);
    EXPECT_EQ(mirror.playback_state(), oneamp::PlaybackState::STOPPED);
    EXPECT_FALSE(mirror.track().has_value());
    EXPECT_DOUBLE_EQ(mirror.progress(), 0.0);
}

TEST_F(PlaybackMirrorTest, FollowsTrackAndPosition) {
    mirror.apply(oneamp::AudioEvent::state_changed(oneamp::EngineState::LOADING));
    mirror.apply(oneamp::AudioEvent::track_loaded(track(200.0)));
    mirror.apply(oneamp::AudioEvent::state_changed(oneamp::EngineState::READY));
    mirror.apply(oneamp::AudioEvent::state_changed(oneamp::EngineState::PLAYING));
    mirror.apply(oneamp::AudioEvent::position_changed(50.0));

    ASSERT_TRUE(mirror.track().has_value());
    EXPECT_EQ(mirror.track()->title, "Song");
    EXPECT_EQ(mirror.playback_state(), oneamp::PlaybackState::PLAYING);
    EXPECT_DOUBLE_EQ(mirror.position(), 50.0);
    EXPECT_DOUBLE_EQ(mirror.progress(), 0.25);

    mirror.apply(oneamp::AudioEvent::state_changed(oneamp::EngineState::PAUSED));
    EXPECT_EQ(mirror.playback_state(), oneamp::PlaybackState::PAUSED);
}

TEST_F(PlaybackMirrorTest, StopResetsPosition) {
    mirror.apply(oneamp::AudioEvent::track_loaded(track(100.0)));
    mirror.apply(oneamp::AudioEvent::position_changed(42.0));
    mirror.apply(oneamp::AudioEvent::playback_stopped());
    EXPECT_DOUBLE_EQ(mirror.position(), 0.0);
    EXPECT_TRUE(mirror.track().has_value());
}

TEST_F(PlaybackMirrorTest, ErrorThenIdleDropsTrack) {
    mirror.apply(oneamp::AudioEvent::track_loaded(track(100.0)));
    mirror.apply(oneamp::AudioEvent::state_changed(oneamp::EngineState::ERROR));
    mirror.apply(oneamp::AudioEvent::error("device gone"));
    mirror.apply(oneamp::AudioEvent::state_changed(oneamp::EngineState::IDLE));

    EXPECT_EQ(mirror.last_error(), "device gone");
    EXPECT_FALSE(mirror.track().has_value());
    EXPECT_EQ(mirror.state(), oneamp::EngineState::IDLE);

    mirror.clear_error();
    EXPECT_TRUE(mirror.last_error().empty());
}

TEST_F(PlaybackMirrorTest, KeepsEqualizerSettings) {
    oneamp::Equalizer::GainArray gains{};
    gains[4] = 3.0f;
    mirror.apply(oneamp::AudioEvent::equalizer_updated(true, gains));
    EXPECT_TRUE(mirror.equalizer_enabled());
    EXPECT_FLOAT_EQ(mirror.equalizer_gains()[4], 3.0f);

    mirror.apply(oneamp::AudioEvent::info("underrun"));
    EXPECT_EQ(mirror.last_info(), "underrun");
}

TEST_F(PlaybackMirrorTest, ProgressIsClamped) {
    mirror.apply(oneamp::AudioEvent::track_loaded(track(10.0)));
    mirror.apply(oneamp::AudioEvent::position_changed(12.0));
    EXPECT_DOUBLE_EQ(mirror.progress(), 1.0);
}

TEST_F(PlaybackMirrorTest, FormatTime) {
    EXPECT_EQ(oneamp::format_time(0.0), "0:00");
    EXPECT_EQ(oneamp::format_time(59.9), "0:59");
    EXPECT_EQ(oneamp::format_time(125.0), "2:05");
    EXPECT_EQ(oneamp::format_time(-4.0), "0:00");
}
