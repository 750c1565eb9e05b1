#pragma once

#include "types.hpp"
#include "equalizer.hpp"
#include "audio_output.hpp"
#include <string>

namespace oneamp {

struct EqualizerConfig {
    bool enabled = false;
    Equalizer::GainArray gains{};
};

struct PlayerConfig {
    static constexpr int MIN_POSITION_INTERVAL_MS = 100;

    EqualizerConfig equalizer;
    float volume = 0.8f;
    SeekMode seek_mode = SeekMode::ACCURATE;
    int position_interval_ms = MIN_POSITION_INTERVAL_MS;
    OutputSettings output;

    // Pulls out-of-range values back to something usable. Returns false if
    // anything had to be corrected.
    bool validate();
};

// $XDG_CONFIG_HOME/oneamp/config.ini, else $HOME/.config/oneamp/config.ini
std::string default_config_path();

// Loads `path` into `config`. A missing file is not an error: defaults are
// used and `first_run` is set. Returns false when the file exists but could
// not be parsed (defaults are used in that case as well).
bool load_config(const std::string& path, PlayerConfig& config, bool& first_run);

// Writes `config`, creating the parent directory when needed
bool save_config(const std::string& path, const PlayerConfig& config);

const char* to_string(SeekMode mode);
bool parse_seek_mode(const std::string& text, SeekMode& mode);

}
