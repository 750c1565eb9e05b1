#include "audio_messages.hpp"

namespace oneamp {

namespace {

AudioCommand make_command(CommandType type) {
    AudioCommand command;
    command.type = type;
    return command;
}

AudioEvent make_event(EventType type) {
    AudioEvent event;
    event.type = type;
    return event;
}

}

AudioCommand AudioCommand::load_file(const std::string& path) {
    AudioCommand command = make_command(CommandType::LOAD_FILE);
    command.path = path;
    return command;
}

AudioCommand AudioCommand::play() { return make_command(CommandType::PLAY); }
AudioCommand AudioCommand::pause() { return make_command(CommandType::PAUSE); }
AudioCommand AudioCommand::stop() { return make_command(CommandType::STOP); }
AudioCommand AudioCommand::next() { return make_command(CommandType::NEXT); }
AudioCommand AudioCommand::previous() { return make_command(CommandType::PREVIOUS); }
AudioCommand AudioCommand::reset_equalizer() { return make_command(CommandType::RESET_EQUALIZER); }

AudioCommand AudioCommand::seek(float seconds) {
    AudioCommand command = make_command(CommandType::SEEK);
    command.value = seconds;
    return command;
}

AudioCommand AudioCommand::set_volume(float volume) {
    AudioCommand command = make_command(CommandType::SET_VOLUME);
    command.value = volume;
    return command;
}

AudioCommand AudioCommand::set_equalizer_gain(int band, float gain_db) {
    AudioCommand command = make_command(CommandType::SET_EQUALIZER_GAIN);
    command.band = band;
    command.value = gain_db;
    return command;
}

AudioCommand AudioCommand::set_equalizer_gains(const Equalizer::GainArray& gains) {
    AudioCommand command = make_command(CommandType::SET_EQUALIZER_GAINS);
    command.gains = gains;
    return command;
}

AudioCommand AudioCommand::set_equalizer_enabled(bool enabled) {
    AudioCommand command = make_command(CommandType::SET_EQUALIZER_ENABLED);
    command.enabled = enabled;
    return command;
}

AudioEvent AudioEvent::track_loaded(const TrackMetadata& track) {
    AudioEvent event = make_event(EventType::TRACK_LOADED);
    event.track = track;
    return event;
}

AudioEvent AudioEvent::position_changed(double seconds) {
    AudioEvent event = make_event(EventType::POSITION_CHANGED);
    event.position = seconds;
    return event;
}

AudioEvent AudioEvent::playback_stopped() { return make_event(EventType::PLAYBACK_STOPPED); }
AudioEvent AudioEvent::playback_finished() { return make_event(EventType::PLAYBACK_FINISHED); }
AudioEvent AudioEvent::request_next() { return make_event(EventType::REQUEST_NEXT); }
AudioEvent AudioEvent::request_previous() { return make_event(EventType::REQUEST_PREVIOUS); }

AudioEvent AudioEvent::state_changed(EngineState state) {
    AudioEvent event = make_event(EventType::STATE_CHANGED);
    event.state = state;
    return event;
}

AudioEvent AudioEvent::equalizer_updated(bool enabled, const Equalizer::GainArray& gains) {
    AudioEvent event = make_event(EventType::EQUALIZER_UPDATED);
    event.equalizer_enabled = enabled;
    event.gains = gains;
    return event;
}

AudioEvent AudioEvent::info(const std::string& message) {
    AudioEvent event = make_event(EventType::INFO);
    event.message = message;
    return event;
}

AudioEvent AudioEvent::error(const std::string& message) {
    AudioEvent event = make_event(EventType::ERROR);
    event.message = message;
    return event;
}

const char* to_string(CommandType type) {
    switch (type) {
        case CommandType::LOAD_FILE: return "LoadFile";
        case CommandType::PLAY: return "Play";
        case CommandType::PAUSE: return "Pause";
        case CommandType::STOP: return "Stop";
        case CommandType::SEEK: return "Seek";
        case CommandType::NEXT: return "Next";
        case CommandType::PREVIOUS: return "Previous";
        case CommandType::SET_VOLUME: return "SetVolume";
        case CommandType::SET_EQUALIZER_GAIN: return "SetEqualizerGain";
        case CommandType::SET_EQUALIZER_GAINS: return "SetEqualizerGains";
        case CommandType::SET_EQUALIZER_ENABLED: return "SetEqualizerEnabled";
        case CommandType::RESET_EQUALIZER: return "ResetEqualizer";
        default: return "Unknown";
    }
}

const char* to_string(EventType type) {
    switch (type) {
        case EventType::TRACK_LOADED: return "TrackLoaded";
        case EventType::POSITION_CHANGED: return "PositionChanged";
        case EventType::PLAYBACK_STOPPED: return "PlaybackStopped";
        case EventType::PLAYBACK_FINISHED: return "PlaybackFinished";
        case EventType::STATE_CHANGED: return "StateChanged";
        case EventType::EQUALIZER_UPDATED: return "EqualizerUpdated";
        case EventType::REQUEST_NEXT: return "RequestNext";
        case EventType::REQUEST_PREVIOUS: return "RequestPrevious";
        case EventType::INFO: return "Info";
        case EventType::ERROR: return "Error";
        default: return "Unknown";
    }
}

}
