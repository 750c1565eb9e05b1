#include "config.hpp"
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/ini_parser.hpp>
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <iostream>

namespace pt = boost::property_tree;

namespace oneamp {

namespace {

std::string gain_key(size_t band) {
    return "gain" + std::to_string(band);
}

}

bool PlayerConfig::validate() {
    bool all_valid = true;

    for (auto& gain : equalizer.gains) {
        if (!std::isfinite(gain)) {
            gain = 0.0f;
            all_valid = false;
        } else if (gain < Equalizer::MIN_GAIN_DB || gain > Equalizer::MAX_GAIN_DB) {
            gain = Equalizer::clamp_gain(gain);
            all_valid = false;
        }
    }

    if (!std::isfinite(volume)) {
        volume = 0.8f;
        all_valid = false;
    } else if (volume < 0.0f || volume > 1.0f) {
        volume = std::max(0.0f, std::min(1.0f, volume));
        all_valid = false;
    }

    // PositionChanged must stay at or below 10 per second
    if (position_interval_ms < MIN_POSITION_INTERVAL_MS) {
        position_interval_ms = MIN_POSITION_INTERVAL_MS;
        all_valid = false;
    }

    if (output.device.empty()) {
        output.device = "default";
        all_valid = false;
    }
    if (output.buffer_ms < 50 || output.buffer_ms > 5000) {
        output.buffer_ms = 500;
        all_valid = false;
    }
    if (output.period_ms < 5 || output.period_ms > output.buffer_ms) {
        output.period_ms = std::min(50, output.buffer_ms);
        all_valid = false;
    }

    return all_valid;
}

std::string default_config_path() {
    std::filesystem::path base;
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg != nullptr && *xdg != '\0') {
        base = xdg;
    } else if (const char* home = std::getenv("HOME"); home != nullptr && *home != '\0') {
        base = std::filesystem::path(home) / ".config";
    } else {
        base = std::filesystem::current_path();
    }
    return (base / "oneamp" / "config.ini").string();
}

bool load_config(const std::string& path, PlayerConfig& config, bool& first_run) {
    config = PlayerConfig{};
    first_run = false;

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        first_run = true;
        return true;
    }

    try {
        pt::ptree tree;
        pt::read_ini(path, tree);

        if (auto eq = tree.get_child_optional("equalizer")) {
            config.equalizer.enabled = eq->get<bool>("enabled", false);
            for (size_t band = 0; band < Equalizer::BAND_COUNT; ++band) {
                config.equalizer.gains[band] = eq->get<float>(gain_key(band), 0.0f);
            }
        }

        if (auto playback = tree.get_child_optional("playback")) {
            config.volume = playback->get<float>("volume", 0.8f);
            const std::string mode = playback->get<std::string>("seek_mode", "accurate");
            if (!parse_seek_mode(mode, config.seek_mode)) {
                std::cerr << "Config: unknown seek_mode '" << mode << "', using accurate\n";
                config.seek_mode = SeekMode::ACCURATE;
            }
            config.position_interval_ms = playback->get<int>("position_interval_ms",
                                                             PlayerConfig::MIN_POSITION_INTERVAL_MS);
        }

        if (auto output = tree.get_child_optional("output")) {
            config.output.device = output->get<std::string>("device", "default");
            config.output.buffer_ms = output->get<int>("buffer_ms", 500);
            config.output.period_ms = output->get<int>("period_ms", 50);
        }

        if (!config.validate()) {
            std::cerr << "Config: out-of-range values in " << path << " were corrected\n";
        }
        return true;
    } catch (const pt::ini_parser_error& e) {
        std::cerr << "Config: cannot parse " << path << ": " << e.what() << "\n";
    } catch (const pt::ptree_error& e) {
        std::cerr << "Config: bad value in " << path << ": " << e.what() << "\n";
    }

    config = PlayerConfig{};
    return false;
}

bool save_config(const std::string& path, const PlayerConfig& config) {
    try {
        const std::filesystem::path parent = std::filesystem::path(path).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent);
        }

        pt::ptree tree;
        tree.put("equalizer.enabled", config.equalizer.enabled);
        for (size_t band = 0; band < Equalizer::BAND_COUNT; ++band) {
            tree.put("equalizer." + gain_key(band), config.equalizer.gains[band]);
        }
        tree.put("playback.volume", config.volume);
        tree.put("playback.seek_mode", to_string(config.seek_mode));
        tree.put("playback.position_interval_ms", config.position_interval_ms);
        tree.put("output.device", config.output.device);
        tree.put("output.buffer_ms", config.output.buffer_ms);
        tree.put("output.period_ms", config.output.period_ms);

        pt::write_ini(path, tree);
        return true;
    } catch (const pt::ini_parser_error& e) {
        std::cerr << "Config: cannot write " << path << ": " << e.what() << "\n";
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "Config: cannot create directory for " << path << ": " << e.what() << "\n";
    }
    return false;
}

const char* to_string(SeekMode mode) {
    return mode == SeekMode::COARSE ? "coarse" : "accurate";
}

bool parse_seek_mode(const std::string& text, SeekMode& mode) {
    if (text == "accurate") {
        mode = SeekMode::ACCURATE;
        return true;
    } else if (text == "coarse") {
        mode = SeekMode::COARSE;
        return true;
    }
    return false;
}

}
