#include "audio_output.hpp"
#include "sample_ring_buffer.hpp"
#include <thread>
#include <atomic>
#include <algorithm>
#include <vector>
#include <iostream>
#include <chrono>

namespace oneamp {

struct NullAudioOutput::Impl {
    AudioFormat format;
    OutputSettings settings;
    bool is_open = false;

    SampleRingBuffer ring;
    std::vector<float> scratch;

    std::atomic<bool> is_playing{false};
    std::atomic<bool> is_paused{false};
    std::atomic<bool> primed{false};
    std::atomic<bool> draining{false};
    std::atomic<float> volume{1.0f};
    std::atomic<size_t> underruns{0};

    std::thread drain_thread;
    std::atomic<bool> should_stop{false};

    // Consumes what a device would have played since the previous wakeup
    void drain_loop() {
        const auto tick = std::chrono::milliseconds(std::max(1, settings.period_ms / 5));
        const double samples_per_second = static_cast<double>(format.sample_rate) * format.channels;
        auto last = std::chrono::steady_clock::now();
        double owed = 0.0;

        while (!should_stop) {
            std::this_thread::sleep_for(tick);
            const auto now = std::chrono::steady_clock::now();
            const double elapsed = std::chrono::duration<double>(now - last).count();
            last = now;

            if (!is_playing || is_paused) {
                owed = 0.0;
                continue;
            }

            owed += elapsed * samples_per_second;
            size_t due = static_cast<size_t>(owed);
            due -= due % static_cast<size_t>(format.channels);
            owed -= static_cast<double>(due);

            while (due > 0) {
                const size_t chunk = std::min(due, scratch.size());
                const size_t got = ring.read(scratch.data(), chunk);
                if (got == 0) {
                    if (primed && !draining) {
                        ++underruns;
                    }
                    owed = 0.0;
                    break;
                }
                primed = true;
                due -= std::min(due, got);
            }
        }
    }
};

NullAudioOutput::NullAudioOutput() : m_impl(std::make_unique<Impl>()) {}

NullAudioOutput::~NullAudioOutput() {
    close();
}

AudioError NullAudioOutput::open(const AudioFormat& fmt, const OutputSettings& settings) {
    close();

    if (fmt.sample_rate <= 0 || fmt.channels <= 0) {
        return AudioError::UNSUPPORTED_FORMAT;
    }

    m_impl->format = fmt;
    m_impl->settings = settings;
    m_impl->underruns = 0;
    m_impl->ring.reset(ring_capacity_samples(fmt, settings.buffer_ms));
    m_impl->scratch.assign(ring_capacity_samples(fmt, std::max(settings.period_ms, 1)), 0.0f);

    m_impl->should_stop = false;
    m_impl->drain_thread = std::thread(&Impl::drain_loop, m_impl.get());
    m_impl->is_open = true;

    std::cout << "Null output: " << fmt.sample_rate << "Hz, " << fmt.channels << " channels\n";
    return AudioError::SUCCESS;
}

bool NullAudioOutput::start() {
    if (!m_impl->is_open) {
        return false;
    }
    m_impl->draining = false;
    m_impl->is_paused = false;
    m_impl->is_playing = true;
    return true;
}

bool NullAudioOutput::pause() {
    if (!m_impl->is_open) {
        return false;
    }
    m_impl->is_paused = true;
    return true;
}

bool NullAudioOutput::resume() {
    if (!m_impl->is_open) {
        return false;
    }
    m_impl->is_paused = false;
    m_impl->is_playing = true;
    return true;
}

bool NullAudioOutput::stop() {
    if (!m_impl->is_open) {
        return false;
    }
    m_impl->is_playing = false;
    m_impl->is_paused = false;
    m_impl->draining = false;
    m_impl->ring.clear();
    m_impl->primed = false;
    return true;
}

void NullAudioOutput::drain() {
    m_impl->draining = true;
}

void NullAudioOutput::close() {
    m_impl->is_playing = false;
    m_impl->should_stop = true;
    if (m_impl->drain_thread.joinable()) {
        m_impl->drain_thread.join();
    }
    m_impl->ring.clear();
    m_impl->primed = false;
    m_impl->is_open = false;
}

size_t NullAudioOutput::write(const float* samples, size_t count, std::chrono::milliseconds timeout) {
    if (!m_impl->is_open) {
        return 0;
    }
    return m_impl->ring.write(samples, count, timeout);
}

void NullAudioOutput::set_volume(float volume) {
    m_impl->volume = std::clamp(volume, 0.0f, 1.0f);
}

float NullAudioOutput::get_volume() const {
    return m_impl->volume;
}

size_t NullAudioOutput::buffered_samples() const {
    return m_impl->ring.size();
}

// No device queue behind the ring
size_t NullAudioOutput::pending_samples() const {
    return m_impl->ring.size();
}

size_t NullAudioOutput::capacity_samples() const {
    return m_impl->ring.capacity();
}

size_t NullAudioOutput::underrun_count() const {
    return m_impl->underruns;
}

AudioError NullAudioOutput::device_error() const {
    return AudioError::SUCCESS;
}

bool NullAudioOutput::is_open() const {
    return m_impl->is_open;
}

bool NullAudioOutput::is_playing() const {
    return m_impl->is_playing && !m_impl->is_paused;
}

AudioFormat NullAudioOutput::get_format() const {
    return m_impl->format;
}

}
