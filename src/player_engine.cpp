#include "player_engine.hpp"
#include "audio_decoder.hpp"
#include "message_channel.hpp"
#include <algorithm>
#include <atomic>
#include <cmath>
#include <iostream>
#include <sstream>
#include <thread>

namespace oneamp {

namespace {

constexpr size_t COMMAND_QUEUE_CAPACITY = 256;
constexpr size_t EVENT_QUEUE_CAPACITY = 1024;
// Longest a single output write may block before commands are looked at again
constexpr std::chrono::milliseconds OUTPUT_WRITE_WAIT{20};
// Poll interval while waiting for the output to play out the last samples
constexpr std::chrono::milliseconds DRAIN_POLL{10};

}

struct PlayerEngine::Impl {
    PlayerConfig config;
    OutputFactory output_factory;

    MessageChannel<AudioCommand> commands{COMMAND_QUEUE_CAPACITY};
    MessageChannel<AudioEvent> events{EVENT_QUEUE_CAPACITY};
    std::shared_ptr<CaptureBuffer> capture = std::make_shared<CaptureBuffer>();

    Equalizer equalizer;
    std::unique_ptr<IAudioDecoder> decoder;
    std::unique_ptr<IAudioOutput> output;
    TrackMetadata track;
    AudioFormat format;

    std::atomic<EngineState> state{EngineState::IDLE};
    float volume = 0.8f;

    // Decoded and equalized samples not yet accepted by the output
    PcmFrame frame;
    AudioBuffer pending;
    size_t pending_offset = 0;
    // Stream sample index (frames * channels) just past the last sample handed to the output
    uint64_t output_cursor = 0;
    // Accurate seek: decoded frames before this stream frame are dropped
    uint64_t trim_until_frame = 0;
    bool draining = false;

    double last_position = -1.0;
    std::chrono::steady_clock::time_point last_position_time;
    size_t reported_underruns = 0;

    std::thread control_thread;
    std::atomic<bool> running{false};

    // Set while the UI is not draining events; logged once per episode
    bool events_overflowing = false;

    void emit(AudioEvent event) {
        if (events.try_send(std::move(event))) {
            events_overflowing = false;
            return;
        }
        if (!events_overflowing) {
            events_overflowing = true;
            std::cerr << "Engine: event queue full, dropping events (" << events.dropped() << " so far)\n";
        }
    }

    void set_state(EngineState next) {
        if (state.load() == next) {
            return;
        }
        state = next;
        emit(AudioEvent::state_changed(next));
    }

    void emit_equalizer() {
        emit(AudioEvent::equalizer_updated(equalizer.is_enabled(), equalizer.get_all_gains()));
    }

    void clear_pipeline() {
        pending.clear();
        pending_offset = 0;
        trim_until_frame = 0;
        draining = false;
        equalizer.reset_all();
        capture->clear();
    }

    double played_seconds() const {
        if (format.sample_rate <= 0 || format.channels <= 0) {
            return 0.0;
        }
        const uint64_t buffered = output ? output->buffered_samples() : 0;
        const uint64_t played = output_cursor > buffered ? output_cursor - buffered : 0;
        return static_cast<double>(played / static_cast<uint64_t>(format.channels)) / format.sample_rate;
    }

    void report_position(double seconds) {
        last_position = seconds;
        last_position_time = std::chrono::steady_clock::now();
        emit(AudioEvent::position_changed(seconds));
    }

    void maybe_emit_position() {
        const auto now = std::chrono::steady_clock::now();
        if (now - last_position_time < std::chrono::milliseconds(config.position_interval_ms)) {
            return;
        }

        const double position = played_seconds();
        if (position > last_position) {
            report_position(position);
        }

        if (output && !draining) {
            const size_t underruns = output->underrun_count();
            if (underruns > reported_underruns) {
                std::ostringstream message;
                message << "Output underrun recovered (" << underruns << " so far)";
                emit(AudioEvent::info(message.str()));
                reported_underruns = underruns;
            }
        }
    }

    // Abandons the current track and returns to IDLE
    void fail(const std::string& message) {
        std::cerr << "Engine: " << message << "\n";
        if (output && output->is_open()) {
            output->stop();
        }
        if (decoder) {
            decoder->close();
            decoder.reset();
        }
        clear_pipeline();
        output_cursor = 0;
        track = TrackMetadata{};
        set_state(EngineState::ERROR);
        emit(AudioEvent::error(message));
        set_state(EngineState::IDLE);
    }

    AudioError prepare_output() {
        if (output && output->is_open() && output->device_error() == AudioError::SUCCESS) {
            const AudioFormat current = output->get_format();
            if (current.sample_rate == format.sample_rate && current.channels == format.channels) {
                output->stop();
                return AudioError::SUCCESS;
            }
        }

        if (output) {
            output->close();
        } else {
            output = output_factory ? output_factory() : create_audio_output(false);
            if (!output) {
                return AudioError::DEVICE_UNAVAILABLE;
            }
        }

        AudioError result = output->open(format, config.output);
        if (result == AudioError::SUCCESS) {
            output->set_volume(volume);
            reported_underruns = output->underrun_count();
        }
        return result;
    }

    void load_file(const std::string& path) {
        if (output && output->is_open()) {
            output->stop();
        }
        if (decoder) {
            decoder->close();
            decoder.reset();
        }
        clear_pipeline();
        output_cursor = 0;

        set_state(EngineState::LOADING);

        TrackMetadata metadata;
        AudioError result = open_decoder(path, decoder, metadata);
        if (result != AudioError::SUCCESS) {
            fail("Failed to load " + path + ": " + describe_error(result));
            return;
        }

        format = decoder->get_format();
        result = prepare_output();
        if (result != AudioError::SUCCESS) {
            fail("Cannot open audio output for " + path + ": " + describe_error(result));
            return;
        }

        equalizer.set_format(format.sample_rate, format.channels);
        capture->set_format(format.sample_rate, format.channels);
        track = metadata;

        emit(AudioEvent::track_loaded(track));
        set_state(EngineState::READY);
        report_position(0.0);
    }

    // Puts the decoder back at the start of the track
    bool rewind() {
        double actual = 0.0;
        clear_pipeline();
        output_cursor = 0;
        if (decoder->seek(0.0, SeekMode::ACCURATE, actual) == SeekStatus::FAILED) {
            fail("Cannot rewind " + track.file_path + ": " + describe_error(decoder->last_error()));
            return false;
        }
        return true;
    }

    void play() {
        const EngineState current = state.load();
        if (current == EngineState::PAUSED) {
            output->resume();
            set_state(EngineState::PLAYING);
            return;
        }

        if (current == EngineState::STOPPED || current == EngineState::FINISHED) {
            if (!rewind()) {
                return;
            }
            report_position(0.0);
        } else if (current != EngineState::READY) {
            return;
        }

        output->start();
        set_state(EngineState::PLAYING);
        last_position_time = std::chrono::steady_clock::now();
    }

    void pause() {
        if (state.load() != EngineState::PLAYING) {
            return;
        }
        output->pause();
        set_state(EngineState::PAUSED);
        report_position(played_seconds());
    }

    void stop() {
        const EngineState current = state.load();
        if (current != EngineState::PLAYING && current != EngineState::PAUSED) {
            return;
        }
        output->stop();
        if (!rewind()) {
            return;
        }
        emit(AudioEvent::playback_stopped());
        set_state(EngineState::STOPPED);
        report_position(0.0);
    }

    void finish() {
        if (output) {
            output->stop();
        }
        clear_pipeline();
        if (track.duration > last_position) {
            report_position(track.duration);
        }
        emit(AudioEvent::playback_finished());
        set_state(EngineState::FINISHED);
    }

    void seek(double target) {
        const EngineState current = state.load();
        if (current != EngineState::PLAYING && current != EngineState::PAUSED &&
            current != EngineState::READY) {
            return;
        }
        if (!std::isfinite(target)) {
            std::cerr << "Engine: ignoring seek to non-finite position\n";
            emit(AudioEvent::info("Seek target is not a valid time, position unchanged"));
            return;
        }

        double actual = 0.0;
        const SeekStatus status = decoder->seek(target, config.seek_mode, actual);
        if (status == SeekStatus::PAST_END) {
            finish();
            return;
        }
        if (status == SeekStatus::FAILED) {
            std::ostringstream message;
            message << "Seek to " << target << "s failed, position unchanged";
            std::cerr << "Engine: " << message.str() << "\n";
            emit(AudioEvent::info(message.str()));
            return;
        }

        // Nothing decoded before the seek may reach the device after it
        output->stop();
        clear_pipeline();
        if (current == EngineState::PLAYING) {
            output->start();
        }

        uint64_t resume_frame = static_cast<uint64_t>(std::llround(actual * format.sample_rate));
        if (config.seek_mode == SeekMode::ACCURATE) {
            const uint64_t target_frame = static_cast<uint64_t>(std::max(0.0, target) * format.sample_rate);
            trim_until_frame = std::max(resume_frame, target_frame);
            resume_frame = trim_until_frame;
        }
        output_cursor = resume_frame * static_cast<uint64_t>(format.channels);
        report_position(static_cast<double>(resume_frame) / format.sample_rate);

        if (target < 0.0) {
            emit(AudioEvent::info("Seek target before start of track, clamped to 0:00"));
        }
    }

    void leave_track(AudioEvent request) {
        if (output && output->is_open()) {
            output->stop();
        }
        if (decoder) {
            decoder->close();
            decoder.reset();
        }
        clear_pipeline();
        output_cursor = 0;
        set_state(EngineState::IDLE);
        emit(std::move(request));
    }

    void handle_command(const AudioCommand& command) {
        switch (command.type) {
            case CommandType::LOAD_FILE:
                load_file(command.path);
                break;
            case CommandType::PLAY:
                play();
                break;
            case CommandType::PAUSE:
                pause();
                break;
            case CommandType::STOP:
                stop();
                break;
            case CommandType::SEEK:
                seek(command.value);
                break;
            case CommandType::NEXT:
                leave_track(AudioEvent::request_next());
                break;
            case CommandType::PREVIOUS:
                leave_track(AudioEvent::request_previous());
                break;
            case CommandType::SET_VOLUME:
                volume = std::isfinite(command.value) ? std::clamp(command.value, 0.0f, 1.0f) : volume;
                if (output) {
                    output->set_volume(volume);
                }
                break;
            case CommandType::SET_EQUALIZER_GAIN:
                if (command.band < 0 || static_cast<size_t>(command.band) >= Equalizer::BAND_COUNT) {
                    std::cerr << "Engine: ignoring gain for invalid band " << command.band << "\n";
                    break;
                }
                equalizer.set_band_gain(static_cast<size_t>(command.band), command.value);
                emit_equalizer();
                break;
            case CommandType::SET_EQUALIZER_GAINS:
                equalizer.set_all_gains(command.gains);
                emit_equalizer();
                break;
            case CommandType::SET_EQUALIZER_ENABLED:
                equalizer.set_enabled(command.enabled);
                emit_equalizer();
                break;
            case CommandType::RESET_EQUALIZER:
                equalizer.reset_bands();
                emit_equalizer();
                break;
        }
    }

    // Hands as much of `pending` to the output as it takes within one bounded wait
    void push_pending() {
        const size_t remaining = pending.size() - pending_offset;
        const size_t written = output->write(pending.data() + pending_offset, remaining, OUTPUT_WRITE_WAIT);
        pending_offset += written;
        output_cursor += written;
        if (pending_offset >= pending.size()) {
            pending.clear();
            pending_offset = 0;
        }
    }

    // Drops the part of `frame` that lies before an accurate seek target
    void apply_trim() {
        if (trim_until_frame == 0 || frame.first_frame >= trim_until_frame) {
            trim_until_frame = 0;
            return;
        }
        const uint64_t skip_frames = std::min<uint64_t>(trim_until_frame - frame.first_frame, frame.frame_count());
        const size_t skip_samples = static_cast<size_t>(skip_frames) * static_cast<size_t>(frame.channels);
        frame.samples.erase(frame.samples.begin(), frame.samples.begin() + static_cast<std::ptrdiff_t>(skip_samples));
        frame.first_frame += skip_frames;
        if (frame.first_frame >= trim_until_frame) {
            trim_until_frame = 0;
        }
    }

    void playback_step() {
        const AudioError device = output->device_error();
        if (device != AudioError::SUCCESS) {
            fail(std::string("Audio device failed: ") + describe_error(device));
            output->close();
            return;
        }

        if (!pending.empty()) {
            push_pending();
            maybe_emit_position();
            return;
        }

        if (draining) {
            // The device's own queue counts too, or the tail would be dropped
            if (output->pending_samples() == 0) {
                finish();
                return;
            }
            maybe_emit_position();
            AudioCommand command;
            if (commands.wait_receive(command, DRAIN_POLL)) {
                handle_command(command);
            }
            return;
        }

        switch (decoder->decode_next(frame)) {
            case DecodeStatus::FRAME_READY:
                apply_trim();
                if (frame.samples.empty()) {
                    break;
                }
                equalizer.process(frame.samples, frame.channels);
                capture->write(frame.samples);
                pending.swap(frame.samples);
                pending_offset = 0;
                push_pending();
                break;
            case DecodeStatus::END_OF_STREAM:
                draining = true;
                output->drain();
                break;
            case DecodeStatus::STREAM_ERROR:
                fail("Decoding " + track.file_path + " failed: " + describe_error(decoder->last_error()));
                return;
        }

        maybe_emit_position();
    }

    void run() {
        while (running) {
            try {
                tick(std::chrono::milliseconds(20));
            } catch (const std::exception& e) {
                fail(std::string("Audio thread error: ") + e.what());
            }
        }
    }

    void tick(std::chrono::milliseconds idle_wait) {
        AudioCommand command;
        while (commands.try_receive(command)) {
            handle_command(command);
        }

        if (state.load() == EngineState::PLAYING) {
            playback_step();
        } else if (commands.wait_receive(command, idle_wait)) {
            handle_command(command);
        }
    }
};

PlayerEngine::PlayerEngine(const PlayerConfig& config, OutputFactory output_factory)
    : m_impl(std::make_unique<Impl>()) {
    m_impl->config = config;
    m_impl->config.validate();
    m_impl->output_factory = std::move(output_factory);
    m_impl->volume = m_impl->config.volume;
    m_impl->equalizer.set_all_gains(m_impl->config.equalizer.gains);
    m_impl->equalizer.set_enabled(m_impl->config.equalizer.enabled);
}

PlayerEngine::~PlayerEngine() {
    shutdown();
}

bool PlayerEngine::start() {
    if (m_impl->running) {
        return false;
    }
    m_impl->running = true;
    m_impl->control_thread = std::thread(&Impl::run, m_impl.get());
    return true;
}

void PlayerEngine::shutdown() {
    m_impl->running = false;
    if (m_impl->control_thread.joinable()) {
        m_impl->control_thread.join();
    }
    if (m_impl->output) {
        m_impl->output->close();
    }
    if (m_impl->decoder) {
        m_impl->decoder->close();
        m_impl->decoder.reset();
    }
}

bool PlayerEngine::is_running() const {
    return m_impl->running;
}

bool PlayerEngine::send_command(const AudioCommand& command) {
    return m_impl->commands.try_send(command);
}

bool PlayerEngine::poll_event(AudioEvent& event) {
    return m_impl->events.try_receive(event);
}

std::shared_ptr<CaptureBuffer> PlayerEngine::capture_buffer() const {
    return m_impl->capture;
}

void PlayerEngine::tick(std::chrono::milliseconds idle_wait) {
    m_impl->tick(idle_wait);
}

EngineState PlayerEngine::state() const {
    return m_impl->state;
}

}
