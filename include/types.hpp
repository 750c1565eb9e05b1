#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <cstddef>

namespace oneamp {

enum class PlaybackState {
    STOPPED,
    PLAYING,
    PAUSED
};

// Player engine state machine. ERROR is transient: the engine reports it and
// falls back to IDLE.
enum class EngineState {
    IDLE,
    LOADING,
    READY,
    PLAYING,
    PAUSED,
    STOPPED,
    FINISHED,
    ERROR
};

enum class SeekMode {
    ACCURATE,
    COARSE
};

struct AudioFormat {
    int sample_rate{44100};
    int channels{2};
};

struct TrackMetadata {
    std::string file_path;
    std::string title{"Unknown"};
    std::string artist{"Unknown"};
    std::string album{"Unknown"};
    double duration{0.0};
    int sample_rate{0};
    int channels{0};
    std::string codec;
    std::optional<int> bitrate_kbps;
};

// A file queued for playback, before its decoder has been opened
struct PlaylistEntry {
    std::string file_path;
    std::string display_name;
};

using TrackList = std::vector<PlaylistEntry>;

// Interleaved float samples
using AudioBuffer = std::vector<float>;

struct PcmFrame {
    AudioBuffer samples;
    int sample_rate{0};
    int channels{0};
    // Stream position of the first sample frame in `samples`
    uint64_t first_frame{0};

    size_t frame_count() const {
        return channels > 0 ? samples.size() / static_cast<size_t>(channels) : 0;
    }

    double start_seconds() const {
        return sample_rate > 0 ? static_cast<double>(first_frame) / sample_rate : 0.0;
    }
};

const char* to_string(EngineState state);
PlaybackState to_playback_state(EngineState state);

}
