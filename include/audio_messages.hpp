#pragma once

#include "types.hpp"
#include "equalizer.hpp"
#include <string>

namespace oneamp {

enum class CommandType {
    LOAD_FILE,
    PLAY,
    PAUSE,
    STOP,
    SEEK,
    NEXT,
    PREVIOUS,
    SET_VOLUME,
    SET_EQUALIZER_GAIN,
    SET_EQUALIZER_GAINS,
    SET_EQUALIZER_ENABLED,
    RESET_EQUALIZER
};

struct AudioCommand {
    CommandType type = CommandType::STOP;
    std::string path;
    float value = 0.0f;
    int band = 0;
    bool enabled = false;
    Equalizer::GainArray gains{};

    static AudioCommand load_file(const std::string& path);
    static AudioCommand play();
    static AudioCommand pause();
    static AudioCommand stop();
    static AudioCommand seek(float seconds);
    static AudioCommand next();
    static AudioCommand previous();
    static AudioCommand set_volume(float volume);
    static AudioCommand set_equalizer_gain(int band, float gain_db);
    static AudioCommand set_equalizer_gains(const Equalizer::GainArray& gains);
    static AudioCommand set_equalizer_enabled(bool enabled);
    static AudioCommand reset_equalizer();
};

enum class EventType {
    TRACK_LOADED,
    POSITION_CHANGED,
    PLAYBACK_STOPPED,
    PLAYBACK_FINISHED,
    STATE_CHANGED,
    EQUALIZER_UPDATED,
    REQUEST_NEXT,
    REQUEST_PREVIOUS,
    INFO,
    ERROR
};

struct AudioEvent {
    EventType type = EventType::INFO;
    TrackMetadata track;
    double position = 0.0;
    EngineState state = EngineState::IDLE;
    bool equalizer_enabled = false;
    Equalizer::GainArray gains{};
    std::string message;

    static AudioEvent track_loaded(const TrackMetadata& track);
    static AudioEvent position_changed(double seconds);
    static AudioEvent playback_stopped();
    static AudioEvent playback_finished();
    static AudioEvent state_changed(EngineState state);
    static AudioEvent equalizer_updated(bool enabled, const Equalizer::GainArray& gains);
    static AudioEvent request_next();
    static AudioEvent request_previous();
    static AudioEvent info(const std::string& message);
    static AudioEvent error(const std::string& message);
};

const char* to_string(CommandType type);
const char* to_string(EventType type);

}
