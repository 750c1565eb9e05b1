#include "audio_output.hpp"
#include "sample_ring_buffer.hpp"
#include <alsa/asoundlib.h>
#include <thread>
#include <atomic>
#include <mutex>
#include <algorithm>
#include <string>
#include <vector>
#include <iostream>
#include <chrono>
#include <exception>

namespace oneamp {

struct AlsaAudioOutput::Impl {
    snd_pcm_t* pcm_handle = nullptr;

    AudioFormat format;
    OutputSettings settings;
    size_t buffer_size = 0;
    size_t period_size = 0;

    SampleRingBuffer ring;
    std::vector<float> period_buffer;

    std::atomic<bool> is_playing{false};
    std::atomic<bool> is_paused{false};
    std::atomic<bool> primed{false};
    // Set at end of stream: starved periods are no longer padded with silence
    std::atomic<bool> draining{false};
    std::atomic<float> volume{1.0f};
    std::atomic<size_t> underruns{0};
    std::atomic<AudioError> error{AudioError::SUCCESS};

    std::thread playback_thread;
    std::atomic<bool> should_stop{false};
    // Serializes every pcm call and the in-flight period against pause/stop
    mutable std::mutex device_mutex;
    // Part of period_buffer the device has not accepted yet
    size_t period_samples = 0;
    size_t period_offset = 0;
    bool period_is_silence = false;

    static constexpr int DEVICE_WAIT_MS = 100;

    bool open_pcm() {
        int err = snd_pcm_open(&pcm_handle, settings.device.c_str(), SND_PCM_STREAM_PLAYBACK, 0);
        if (err < 0) {
            std::cerr << "ALSA: Cannot open audio device " << settings.device << ": " << snd_strerror(err) << std::endl;
            pcm_handle = nullptr;
            return false;
        }
        return true;
    }

    AudioError set_hw_params() {
        snd_pcm_hw_params_t* hw_params;
        snd_pcm_hw_params_alloca(&hw_params);

        int err = snd_pcm_hw_params_any(pcm_handle, hw_params);
        if (err < 0) {
            std::cerr << "ALSA: Cannot initialize hardware parameters: " << snd_strerror(err) << std::endl;
            return AudioError::DEVICE_UNAVAILABLE;
        }

        err = snd_pcm_hw_params_set_access(pcm_handle, hw_params, SND_PCM_ACCESS_RW_INTERLEAVED);
        if (err < 0) {
            std::cerr << "ALSA: Cannot set access type: " << snd_strerror(err) << std::endl;
            return AudioError::DEVICE_UNAVAILABLE;
        }

        err = snd_pcm_hw_params_set_format(pcm_handle, hw_params, SND_PCM_FORMAT_FLOAT_LE);
        if (err < 0) {
            std::cerr << "ALSA: Cannot set sample format: " << snd_strerror(err) << std::endl;
            return AudioError::UNSUPPORTED_FORMAT;
        }

        err = snd_pcm_hw_params_set_channels(pcm_handle, hw_params, static_cast<unsigned int>(format.channels));
        if (err < 0) {
            std::cerr << "ALSA: Cannot set channel count " << format.channels << ": " << snd_strerror(err) << std::endl;
            return AudioError::UNSUPPORTED_FORMAT;
        }

        unsigned int sample_rate = static_cast<unsigned int>(format.sample_rate);
        err = snd_pcm_hw_params_set_rate_near(pcm_handle, hw_params, &sample_rate, 0);
        if (err < 0 || sample_rate != static_cast<unsigned int>(format.sample_rate)) {
            std::cerr << "ALSA: Cannot run at " << format.sample_rate << "Hz"
                      << (err < 0 ? std::string(": ") + snd_strerror(err) : std::string()) << std::endl;
            return AudioError::UNSUPPORTED_FORMAT;
        }

        // Device-side buffer holds a few periods; the ring absorbs the rest
        period_size = std::max<size_t>(64, static_cast<size_t>(format.sample_rate) * settings.period_ms / 1000);
        snd_pcm_uframes_t period_frames = period_size;
        err = snd_pcm_hw_params_set_period_size_near(pcm_handle, hw_params, &period_frames, 0);
        if (err < 0) {
            std::cerr << "ALSA: Cannot set period size: " << snd_strerror(err) << std::endl;
            return AudioError::DEVICE_UNAVAILABLE;
        }
        period_size = period_frames;

        snd_pcm_uframes_t buffer_frames = period_size * 4;
        err = snd_pcm_hw_params_set_buffer_size_near(pcm_handle, hw_params, &buffer_frames);
        if (err < 0) {
            std::cerr << "ALSA: Cannot set buffer size: " << snd_strerror(err) << std::endl;
            return AudioError::DEVICE_UNAVAILABLE;
        }
        buffer_size = buffer_frames;

        err = snd_pcm_hw_params(pcm_handle, hw_params);
        if (err < 0) {
            std::cerr << "ALSA: Cannot set hardware parameters: " << snd_strerror(err) << std::endl;
            return AudioError::DEVICE_UNAVAILABLE;
        }

        return AudioError::SUCCESS;
    }

    void playback_loop() {
        try {
            while (!should_stop) {
                if (is_playing && !is_paused && pcm_handle && error.load() == AudioError::SUCCESS) {
                    if (!update_buffer()) {
                        std::this_thread::sleep_for(std::chrono::milliseconds(5));
                    }
                } else {
                    std::this_thread::sleep_for(std::chrono::milliseconds(10));
                }
            }
        } catch (const std::exception&) {
            // Reported by the engine thread through device_error()
            error = AudioError::DEVICE_ERROR;
            is_playing = false;
        }
    }

    // Runs on the device thread: no allocation, no stream output.
    // Returns false when there was nothing to hand to the device.
    bool update_buffer() {
        // The pcm is non-blocking; only the wait happens outside the lock
        const int ready = snd_pcm_wait(pcm_handle, DEVICE_WAIT_MS);

        std::lock_guard<std::mutex> lock(device_mutex);
        if (!is_playing || is_paused) {
            return true;
        }
        if (ready < 0 && !recover(ready)) {
            return true;
        }

        if (period_offset >= period_samples && !take_period()) {
            return false;
        }

        const size_t channels = static_cast<size_t>(format.channels);
        const snd_pcm_uframes_t frames = (period_samples - period_offset) / channels;
        const snd_pcm_sframes_t frames_written =
            snd_pcm_writei(pcm_handle, period_buffer.data() + period_offset, frames);
        if (frames_written < 0) {
            if (frames_written != -EAGAIN) {
                recover(static_cast<int>(frames_written));
            }
            return true;
        }
        period_offset += static_cast<size_t>(frames_written) * channels;
        return true;
    }

    // Called with device_mutex held. Fills period_buffer from the ring, or
    // with silence when starved unless the stream is draining.
    bool take_period() {
        const size_t channels = static_cast<size_t>(format.channels);
        period_offset = 0;
        // Whole frames only; the engine may be halfway through a frame
        const size_t available = ring.size();
        period_samples = ring.read(period_buffer.data(),
                                   std::min(period_buffer.size(), available - available % channels));
        period_is_silence = false;

        if (period_samples > 0) {
            primed = true;
            const float gain = volume.load();
            for (size_t i = 0; i < period_samples; ++i) {
                period_buffer[i] *= gain;
            }
            return true;
        }

        if (draining) {
            // A short track may not have reached the start threshold
            if (snd_pcm_state(pcm_handle) == SND_PCM_STATE_PREPARED) {
                snd_pcm_start(pcm_handle);
            }
            return false;
        }

        if (primed) {
            ++underruns;
        }
        std::fill(period_buffer.begin(), period_buffer.end(), 0.0f);
        period_samples = period_buffer.size();
        period_is_silence = true;
        return true;
    }

    // Called with device_mutex held. Returns false when the device is gone.
    bool recover(int err) {
        if (err == -EPIPE) {
            // Expected once a draining stream has played its last frame
            if (!draining) {
                ++underruns;
            }
            snd_pcm_prepare(pcm_handle);
            return true;
        }
        if (err == -ESTRPIPE) {
            int resumed;
            while ((resumed = snd_pcm_resume(pcm_handle)) == -EAGAIN) {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
            if (resumed < 0) {
                snd_pcm_prepare(pcm_handle);
            }
            return true;
        }
        const snd_pcm_state_t state = snd_pcm_state(pcm_handle);
        if (err == -EBADFD && (state == SND_PCM_STATE_PREPARED || state == SND_PCM_STATE_RUNNING)) {
            // Flushed and restarted while the device thread was waiting
            return true;
        }
        // ENODEV, EBADFD, EIO: the device is gone
        error = AudioError::DEVICE_ERROR;
        is_playing = false;
        return false;
    }

    // Called with device_mutex held
    void discard_period() {
        period_samples = 0;
        period_offset = 0;
        period_is_silence = false;
    }

    void join_thread() {
        should_stop = true;
        if (playback_thread.joinable()) {
            playback_thread.join();
        }
    }
};

AlsaAudioOutput::AlsaAudioOutput() : m_impl(std::make_unique<Impl>()) {}

AlsaAudioOutput::~AlsaAudioOutput() {
    close();
}

AudioError AlsaAudioOutput::open(const AudioFormat& fmt, const OutputSettings& settings) {
    close();

    if (fmt.sample_rate <= 0 || fmt.channels <= 0) {
        return AudioError::UNSUPPORTED_FORMAT;
    }

    m_impl->format = fmt;
    m_impl->settings = settings;
    m_impl->error = AudioError::SUCCESS;
    m_impl->underruns = 0;

    if (!m_impl->open_pcm()) {
        return AudioError::DEVICE_UNAVAILABLE;
    }

    AudioError result = m_impl->set_hw_params();
    if (result != AudioError::SUCCESS) {
        snd_pcm_close(m_impl->pcm_handle);
        m_impl->pcm_handle = nullptr;
        return result;
    }

    int err = snd_pcm_nonblock(m_impl->pcm_handle, 1);
    if (err < 0) {
        std::cerr << "ALSA: Cannot set non-blocking mode: " << snd_strerror(err) << std::endl;
        snd_pcm_close(m_impl->pcm_handle);
        m_impl->pcm_handle = nullptr;
        return AudioError::DEVICE_UNAVAILABLE;
    }

    m_impl->ring.reset(ring_capacity_samples(fmt, settings.buffer_ms));
    m_impl->period_buffer.assign(m_impl->period_size * static_cast<size_t>(fmt.channels), 0.0f);
    m_impl->discard_period();
    m_impl->draining = false;

    std::cout << "ALSA: Opened " << settings.device << " at " << fmt.sample_rate << "Hz, "
              << fmt.channels << " channels, period " << m_impl->period_size << " frames\n";

    m_impl->should_stop = false;
    m_impl->playback_thread = std::thread(&Impl::playback_loop, m_impl.get());
    return AudioError::SUCCESS;
}

bool AlsaAudioOutput::start() {
    if (!m_impl->pcm_handle) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(m_impl->device_mutex);
        snd_pcm_state_t state = snd_pcm_state(m_impl->pcm_handle);
        if (state != SND_PCM_STATE_PREPARED && state != SND_PCM_STATE_RUNNING) {
            int err = snd_pcm_prepare(m_impl->pcm_handle);
            if (err < 0) {
                std::cerr << "ALSA: Cannot prepare PCM: " << snd_strerror(err) << std::endl;
                return false;
            }
        }
    }

    m_impl->draining = false;
    m_impl->is_paused = false;
    m_impl->is_playing = true;
    return true;
}

bool AlsaAudioOutput::pause() {
    if (!m_impl->pcm_handle) {
        return false;
    }

    std::lock_guard<std::mutex> lock(m_impl->device_mutex);
    // The in-flight period stays in period_buffer and is written after resume
    m_impl->is_paused = true;
    if (snd_pcm_state(m_impl->pcm_handle) == SND_PCM_STATE_RUNNING &&
        snd_pcm_pause(m_impl->pcm_handle, 1) < 0) {
        // No hardware pause: drop what the device holds, the ring keeps the rest
        snd_pcm_drop(m_impl->pcm_handle);
    }
    return true;
}

bool AlsaAudioOutput::resume() {
    if (!m_impl->pcm_handle) {
        return false;
    }

    std::lock_guard<std::mutex> lock(m_impl->device_mutex);
    if (snd_pcm_state(m_impl->pcm_handle) == SND_PCM_STATE_PAUSED) {
        snd_pcm_pause(m_impl->pcm_handle, 0);
    } else {
        snd_pcm_prepare(m_impl->pcm_handle);
    }
    m_impl->is_paused = false;
    m_impl->is_playing = true;
    return true;
}

bool AlsaAudioOutput::stop() {
    if (!m_impl->pcm_handle) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(m_impl->device_mutex);
        m_impl->is_playing = false;
        m_impl->is_paused = false;
        m_impl->draining = false;
        snd_pcm_drop(m_impl->pcm_handle);
        snd_pcm_prepare(m_impl->pcm_handle);
        m_impl->discard_period();
        m_impl->ring.clear();
    }
    m_impl->primed = false;
    return true;
}

void AlsaAudioOutput::drain() {
    m_impl->draining = true;
}

void AlsaAudioOutput::close() {
    m_impl->is_playing = false;
    m_impl->join_thread();

    if (m_impl->pcm_handle) {
        snd_pcm_drop(m_impl->pcm_handle);
        snd_pcm_close(m_impl->pcm_handle);
        m_impl->pcm_handle = nullptr;
    }
    m_impl->ring.clear();
    m_impl->discard_period();
    m_impl->draining = false;
    m_impl->primed = false;
}

size_t AlsaAudioOutput::write(const float* samples, size_t count, std::chrono::milliseconds timeout) {
    if (!m_impl->pcm_handle) {
        return 0;
    }
    return m_impl->ring.write(samples, count, timeout);
}

void AlsaAudioOutput::set_volume(float volume) {
    m_impl->volume = std::clamp(volume, 0.0f, 1.0f);
}

float AlsaAudioOutput::get_volume() const {
    return m_impl->volume;
}

size_t AlsaAudioOutput::buffered_samples() const {
    return m_impl->ring.size();
}

size_t AlsaAudioOutput::pending_samples() const {
    std::lock_guard<std::mutex> lock(m_impl->device_mutex);
    size_t pending = m_impl->ring.size();
    if (!m_impl->pcm_handle) {
        return pending;
    }
    if (!m_impl->period_is_silence) {
        pending += m_impl->period_samples - m_impl->period_offset;
    }
    // Fails once the device has run dry, which means nothing is queued
    snd_pcm_sframes_t delay = 0;
    if (snd_pcm_delay(m_impl->pcm_handle, &delay) == 0 && delay > 0) {
        pending += static_cast<size_t>(delay) * static_cast<size_t>(m_impl->format.channels);
    }
    return pending;
}

size_t AlsaAudioOutput::capacity_samples() const {
    return m_impl->ring.capacity();
}

size_t AlsaAudioOutput::underrun_count() const {
    return m_impl->underruns;
}

AudioError AlsaAudioOutput::device_error() const {
    return m_impl->error;
}

bool AlsaAudioOutput::is_open() const {
    return m_impl->pcm_handle != nullptr;
}

bool AlsaAudioOutput::is_playing() const {
    return m_impl->is_playing && !m_impl->is_paused;
}

AudioFormat AlsaAudioOutput::get_format() const {
    return m_impl->format;
}

size_t ring_capacity_samples(const AudioFormat& format, int buffer_ms) {
    const size_t frames = std::max<size_t>(1, static_cast<size_t>(format.sample_rate) *
                                                  static_cast<size_t>(std::max(buffer_ms, 1)) / 1000);
    return frames * static_cast<size_t>(std::max(format.channels, 1));
}

std::unique_ptr<IAudioOutput> create_audio_output(bool null_output) {
    if (null_output) {
        return std::make_unique<NullAudioOutput>();
    }
    return std::make_unique<AlsaAudioOutput>();
}

}
