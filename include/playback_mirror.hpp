#pragma once

#include "audio_messages.hpp"
#include <optional>
#include <string>

namespace oneamp {

// UI-side view of the engine, rebuilt only from received events
class PlaybackMirror {
private:
    EngineState m_state = EngineState::IDLE;
    std::optional<TrackMetadata> m_track;
    double m_position = 0.0;
    bool m_equalizer_enabled = false;
    Equalizer::GainArray m_gains{};
    std::string m_last_error;
    std::string m_last_info;

public:
    void apply(const AudioEvent& event);

    EngineState state() const { return m_state; }
    PlaybackState playback_state() const { return to_playback_state(m_state); }
    const std::optional<TrackMetadata>& track() const { return m_track; }
    double position() const { return m_position; }
    bool equalizer_enabled() const { return m_equalizer_enabled; }
    const Equalizer::GainArray& equalizer_gains() const { return m_gains; }
    const std::string& last_error() const { return m_last_error; }
    const std::string& last_info() const { return m_last_info; }

    // 0..1 progress through the current track
    double progress() const;
    void clear_error() { m_last_error.clear(); }
};

std::string format_time(double seconds);

}
