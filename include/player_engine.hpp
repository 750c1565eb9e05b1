#pragma once

#include "audio_messages.hpp"
#include "audio_output.hpp"
#include "capture_buffer.hpp"
#include "config.hpp"
#include <chrono>
#include <functional>
#include <memory>

namespace oneamp {

using OutputFactory = std::function<std::unique_ptr<IAudioOutput>()>;

// Owns decoding, equalization and output for one track at a time. All
// playback state lives on the engine's control thread; other threads talk to
// it through send_command() and poll_event() only.
class PlayerEngine {
private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;

public:
    // `output_factory` defaults to the ALSA sink
    explicit PlayerEngine(const PlayerConfig& config = PlayerConfig{}, OutputFactory output_factory = nullptr);
    ~PlayerEngine();

    PlayerEngine(const PlayerEngine&) = delete;
    PlayerEngine& operator=(const PlayerEngine&) = delete;

    // Spawns the control thread
    bool start();
    void shutdown();
    bool is_running() const;

    // Never blocks. Returns false when the command queue is full.
    bool send_command(const AudioCommand& command);
    // Never blocks. Returns false when no event is pending.
    bool poll_event(AudioEvent& event);

    std::shared_ptr<CaptureBuffer> capture_buffer() const;

    // One iteration of the control loop: drain commands, then advance
    // playback by at most one decoded frame. When nothing is playing, waits
    // up to `idle_wait` for the next command. Called by the control thread;
    // tests may drive it directly instead of calling start().
    void tick(std::chrono::milliseconds idle_wait = std::chrono::milliseconds(20));

    EngineState state() const;
};

}
