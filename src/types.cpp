#include "types.hpp"
#include "audio_error.hpp"

namespace oneamp {

const char* to_string(EngineState state) {
    switch (state) {
        case EngineState::IDLE: return "Idle";
        case EngineState::LOADING: return "Loading";
        case EngineState::READY: return "Ready";
        case EngineState::PLAYING: return "Playing";
        case EngineState::PAUSED: return "Paused";
        case EngineState::STOPPED: return "Stopped";
        case EngineState::FINISHED: return "Finished";
        case EngineState::ERROR: return "Error";
        default: return "Unknown";
    }
}

PlaybackState to_playback_state(EngineState state) {
    switch (state) {
        case EngineState::PLAYING: return PlaybackState::PLAYING;
        case EngineState::PAUSED: return PlaybackState::PAUSED;
        default: return PlaybackState::STOPPED;
    }
}

const char* describe_error(AudioError error) {
    switch (error) {
        case AudioError::SUCCESS: return "Success";
        case AudioError::FILE_NOT_FOUND: return "File not found";
        case AudioError::IO_ERROR: return "File could not be read";
        case AudioError::UNSUPPORTED_FORMAT: return "Unsupported audio format";
        case AudioError::CORRUPT_STREAM: return "Corrupt or malformed stream";
        case AudioError::DECODE_PACKET_ERROR: return "Too many undecodable packets";
        case AudioError::DEVICE_UNAVAILABLE: return "Audio device unavailable";
        case AudioError::DEVICE_ERROR: return "Audio device failed";
        case AudioError::SEEK_ERROR: return "Seek target unreachable";
        default: return "Unknown error";
    }
}

}
