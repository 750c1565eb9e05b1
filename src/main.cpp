#include "player_engine.hpp"
#include "playback_mirror.hpp"
#include "playlist.hpp"
#include "file_scanner.hpp"
#include "message_channel.hpp"
#include "config.hpp"
#include "audio_decoder.hpp"
#include <iostream>
#include <sstream>
#include <thread>
#include <atomic>
#include <chrono>
#include <algorithm>
#include <memory>

namespace oneamp {

class ConsolePlayer {
private:
    PlayerConfig m_config;
    std::string m_config_path;
    std::unique_ptr<PlayerEngine> m_engine;
    std::unique_ptr<IPlaylist> m_playlist;
    std::unique_ptr<IFileScanner> m_file_scanner;
    PlaybackMirror m_mirror;

    // Shared with the detached stdin reader, which may outlive the player
    std::shared_ptr<MessageChannel<std::string>> m_input_lines =
        std::make_shared<MessageChannel<std::string>>(64);
    std::shared_ptr<std::atomic<bool>> m_input_closed = std::make_shared<std::atomic<bool>>(false);
    std::atomic<bool> m_should_quit{false};
    bool m_shut_down = false;

    void start_input_reader() {
        std::thread([lines = m_input_lines, closed = m_input_closed]() {
            std::string line;
            while (std::getline(std::cin, line)) {
                lines->try_send(line);
            }
            *closed = true;
        }).detach();
    }

    void play_current() {
        const PlaylistEntry* entry = m_playlist->current();
        if (entry == nullptr) {
            return;
        }
        std::cout << "Loading [" << (m_playlist->current_index() + 1) << "/" << m_playlist->size() << "] "
                  << entry->display_name << "\n";
        m_engine->send_command(AudioCommand::load_file(entry->file_path));
        m_engine->send_command(AudioCommand::play());
    }

    void handle_event(const AudioEvent& event) {
        m_mirror.apply(event);

        switch (event.type) {
            case EventType::TRACK_LOADED: {
                const auto& track = event.track;
                std::cout << "Now playing: " << track.artist << " - " << track.title
                          << " [" << track.album << "] " << format_time(track.duration)
                          << " " << track.codec << " " << track.sample_rate << "Hz "
                          << track.channels << "ch";
                if (track.bitrate_kbps) {
                    std::cout << " " << *track.bitrate_kbps << "kbps";
                }
                std::cout << "\n";
                break;
            }
            case EventType::PLAYBACK_FINISHED:
                // Auto-advance
                if (m_playlist->size() > 1) {
                    m_playlist->next();
                    play_current();
                } else {
                    std::cout << "Playback finished\n";
                    // Nobody left to type commands
                    if (*m_input_closed) {
                        m_should_quit = true;
                    }
                }
                break;
            case EventType::REQUEST_NEXT:
                m_playlist->next();
                play_current();
                break;
            case EventType::REQUEST_PREVIOUS:
                m_playlist->previous();
                play_current();
                break;
            case EventType::PLAYBACK_STOPPED:
                std::cout << "Stopped\n";
                break;
            case EventType::EQUALIZER_UPDATED: {
                std::cout << "EQ " << (event.equalizer_enabled ? "on" : "off") << ":";
                for (float gain : event.gains) {
                    std::cout << " " << gain;
                }
                std::cout << "\n";
                m_config.equalizer.enabled = event.equalizer_enabled;
                m_config.equalizer.gains = event.gains;
                break;
            }
            case EventType::INFO:
                std::cout << "Info: " << event.message << "\n";
                break;
            case EventType::ERROR:
                std::cerr << "Error: " << event.message << "\n";
                break;
            default:
                break;
        }
    }

    void print_status() const {
        std::cout << to_string(m_mirror.state()) << " " << format_time(m_mirror.position());
        if (m_mirror.track()) {
            std::cout << " / " << format_time(m_mirror.track()->duration) << "  " << m_mirror.track()->title;
        }
        std::cout << "\n";
    }

    void print_commands() const {
        std::cout << "Commands: play, pause, stop, seek <s>, vol <0..1>, eq <band> <db>,\n"
                  << "          eq on|off|reset, next, prev, status, quit\n";
    }

    void handle_line(const std::string& line) {
        std::istringstream input(line);
        std::string command;
        input >> command;

        if (command.empty()) {
            return;
        } else if (command == "quit" || command == "q") {
            m_should_quit = true;
        } else if (command == "play") {
            m_engine->send_command(AudioCommand::play());
        } else if (command == "pause") {
            m_engine->send_command(AudioCommand::pause());
        } else if (command == "stop") {
            m_engine->send_command(AudioCommand::stop());
        } else if (command == "next" || command == "n") {
            m_engine->send_command(AudioCommand::next());
        } else if (command == "prev" || command == "p") {
            m_engine->send_command(AudioCommand::previous());
        } else if (command == "status") {
            print_status();
        } else if (command == "seek") {
            float seconds = 0.0f;
            if (input >> seconds) {
                m_engine->send_command(AudioCommand::seek(seconds));
            } else {
                std::cout << "Usage: seek <seconds>\n";
            }
        } else if (command == "vol") {
            float volume = 0.0f;
            if (input >> volume) {
                m_config.volume = std::max(0.0f, std::min(1.0f, volume));
                m_engine->send_command(AudioCommand::set_volume(m_config.volume));
            } else {
                std::cout << "Usage: vol <0..1>\n";
            }
        } else if (command == "eq") {
            std::string argument;
            input >> argument;
            if (argument == "on" || argument == "off") {
                m_engine->send_command(AudioCommand::set_equalizer_enabled(argument == "on"));
            } else if (argument == "reset") {
                m_engine->send_command(AudioCommand::reset_equalizer());
            } else {
                std::istringstream band_input(argument);
                int band = -1;
                float gain = 0.0f;
                if (band_input >> band && input >> gain) {
                    m_engine->send_command(AudioCommand::set_equalizer_gain(band, gain));
                } else {
                    std::cout << "Usage: eq <band 0-9> <dB> | eq on | eq off | eq reset\n";
                }
            }
        } else {
            std::cout << "Unknown command: " << command << "\n";
            print_commands();
        }
    }

public:
    ConsolePlayer(const PlayerConfig& config, const std::string& config_path, bool null_output)
        : m_config(config), m_config_path(config_path) {
        m_engine = std::make_unique<PlayerEngine>(
            config, [null_output]() { return create_audio_output(null_output); });
        m_playlist = create_playlist();
        m_file_scanner = create_file_scanner();
    }

    ~ConsolePlayer() {
        shutdown();
    }

    bool load_directory(const std::string& directory, bool shuffle) {
        TrackList entries = m_file_scanner->scan_directory(directory);
        if (entries.empty()) {
            std::cerr << "No supported audio files found in directory: " << directory << "\n";
            return false;
        }

        m_playlist->clear();
        m_playlist->add_all(entries);
        m_playlist->set_shuffle(shuffle);

        std::cout << "Loaded " << entries.size() << " tracks from " << directory << "\n";
        return true;
    }

    bool load_file(const std::string& file_path) {
        if (!m_file_scanner->is_supported_format(file_path)) {
            std::cout << "Warning: unrecognized extension, trying to sniff " << file_path << "\n";
        }
        m_playlist->clear();
        m_playlist->add(FileScanner::make_entry(file_path));
        return true;
    }

    void run() {
        std::cout << "OneAmp - console player\n";
        std::cout << "=======================\n";
        print_commands();
        std::cout << "=======================\n\n";

        m_engine->start();
        m_engine->send_command(AudioCommand::set_volume(m_config.volume));
        play_current();

        start_input_reader();

        while (!m_should_quit) {
            AudioEvent event;
            while (m_engine->poll_event(event)) {
                handle_event(event);
            }

            std::string line;
            while (m_input_lines->try_receive(line)) {
                handle_line(line);
            }

            std::this_thread::sleep_for(std::chrono::milliseconds(16));
        }
    }

    void shutdown() {
        if (m_shut_down) {
            return;
        }
        m_shut_down = true;
        m_should_quit = true;

        std::cout << "Shutting down player...\n";
        m_engine->shutdown();

        if (save_config(m_config_path, m_config)) {
            std::cout << "Saved settings to " << m_config_path << "\n";
        }
        std::cout << "Shutdown complete\n";
    }
};

}

int main(int argc, char* argv[]) {
    try {
        std::string target_path;
        bool is_file = false;
        bool shuffle = false;
        bool null_output = false;
        std::string config_path = oneamp::default_config_path();

        for (int i = 1; i < argc; ++i) {
            std::string arg(argv[i]);
            if (arg == "--file" || arg == "-f") {
                if (i + 1 < argc) {
                    target_path = argv[++i];
                    is_file = true;
                } else {
                    std::cerr << "Error: --file requires a file path\n";
                    return 1;
                }
            } else if (arg == "--folder" || arg == "-d") {
                if (i + 1 < argc) {
                    target_path = argv[++i];
                    is_file = false;
                } else {
                    std::cerr << "Error: --folder requires a directory path\n";
                    return 1;
                }
            } else if (arg == "--config" || arg == "-c") {
                if (i + 1 < argc) {
                    config_path = argv[++i];
                } else {
                    std::cerr << "Error: --config requires a file path\n";
                    return 1;
                }
            } else if (arg == "--shuffle" || arg == "-s") {
                shuffle = true;
            } else if (arg == "--null-output") {
                null_output = true;
            } else if (arg == "--help" || arg == "-h") {
                std::cout << "Usage: oneamp [options]\n";
                std::cout << "Options:\n";
                std::cout << "  --file <path>, -f <path>     Play a single audio file\n";
                std::cout << "  --folder <path>, -d <path>   Play all supported files under a directory\n";
                std::cout << "  --shuffle, -s                Shuffle the folder playlist\n";
                std::cout << "  --config <ini>, -c <ini>     Settings file (default " << config_path << ")\n";
                std::cout << "  --null-output                Decode and play without an audio device\n";
                std::cout << "  --help, -h                   Show this help message\n";
                std::cout << "\nSupported formats:";
                for (const auto& extension : oneamp::supported_extensions()) {
                    std::cout << " " << extension;
                }
                std::cout << "\n";
                return 0;
            } else {
                std::cerr << "Unknown argument: " << arg << "\n";
                std::cerr << "Use --help for usage information\n";
                return 1;
            }
        }

        oneamp::PlayerConfig config;
        bool first_run = false;
        if (!oneamp::load_config(config_path, config, first_run)) {
            std::cerr << "Warning: using default settings\n";
        } else if (first_run) {
            std::cout << "No settings at " << config_path << ", starting with defaults\n";
        }

        oneamp::ConsolePlayer player(config, config_path, null_output);

        bool loaded = false;
        if (is_file) {
            loaded = player.load_file(target_path);
        } else {
            loaded = player.load_directory(target_path.empty() ? "." : target_path, shuffle);
        }
        if (!loaded) {
            return 1;
        }

        player.run();
        player.shutdown();

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
