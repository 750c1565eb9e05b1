#include "playback_mirror.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>

namespace oneamp {

void PlaybackMirror::apply(const AudioEvent& event) {
    switch (event.type) {
        case EventType::TRACK_LOADED:
            m_track = event.track;
            m_position = 0.0;
            m_last_error.clear();
            break;
        case EventType::POSITION_CHANGED:
            m_position = event.position;
            break;
        case EventType::PLAYBACK_STOPPED:
            m_position = 0.0;
            break;
        case EventType::PLAYBACK_FINISHED:
            break;
        case EventType::STATE_CHANGED:
            m_state = event.state;
            if (m_state == EngineState::IDLE) {
                m_track.reset();
                m_position = 0.0;
            }
            break;
        case EventType::EQUALIZER_UPDATED:
            m_equalizer_enabled = event.equalizer_enabled;
            m_gains = event.gains;
            break;
        case EventType::REQUEST_NEXT:
        case EventType::REQUEST_PREVIOUS:
            break;
        case EventType::INFO:
            m_last_info = event.message;
            break;
        case EventType::ERROR:
            m_last_error = event.message;
            break;
    }
}

double PlaybackMirror::progress() const {
    if (!m_track || m_track->duration <= 0.0) {
        return 0.0;
    }
    return std::clamp(m_position / m_track->duration, 0.0, 1.0);
}

std::string format_time(double seconds) {
    if (!std::isfinite(seconds) || seconds < 0.0) {
        seconds = 0.0;
    }
    const int total = static_cast<int>(seconds);
    char text[16];
    std::snprintf(text, sizeof(text), "%d:%02d", total / 60, total % 60);
    return text;
}

}
