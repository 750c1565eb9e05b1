#include "equalizer.hpp"
#include <algorithm>
#include <cassert>
#include <iostream>

namespace oneamp {

Equalizer::Equalizer(int sample_rate, int channels)
    : m_sample_rate(sample_rate)
    , m_channels(std::max(1, channels)) {
    m_gains.fill(0.0f);
    m_filters.resize(static_cast<size_t>(m_channels) * BAND_COUNT);
    configure_all_bands();
}

const Equalizer::FrequencyArray& Equalizer::band_frequencies() {
    static const FrequencyArray frequencies = {
        31.25, 62.5, 125.0, 250.0, 500.0,
        1000.0, 2000.0, 4000.0, 8000.0, 16000.0
    };
    return frequencies;
}

float Equalizer::clamp_gain(float gain_db) {
    return std::clamp(gain_db, MIN_GAIN_DB, MAX_GAIN_DB);
}

void Equalizer::set_format(int sample_rate, int channels) {
    channels = std::max(1, channels);
    if (sample_rate == static_cast<int>(m_sample_rate) && channels == m_channels) {
        reset_all();
        return;
    }

    m_sample_rate = sample_rate;
    m_channels = channels;
    m_filters.assign(static_cast<size_t>(m_channels) * BAND_COUNT, BiquadFilter());
    configure_all_bands();
}

bool Equalizer::set_band_gain(size_t index, float gain_db) {
    assert(index < BAND_COUNT && "equalizer band index out of range");
    if (index >= BAND_COUNT) {
        std::cerr << "Equalizer: ignoring gain for invalid band " << index << "\n";
        return false;
    }

    m_gains[index] = clamp_gain(gain_db);
    configure_band(index);
    return true;
}

float Equalizer::get_band_gain(size_t index) const {
    if (index >= BAND_COUNT) {
        return 0.0f;
    }
    return m_gains[index];
}

void Equalizer::set_all_gains(const GainArray& gains) {
    for (size_t i = 0; i < BAND_COUNT; ++i) {
        m_gains[i] = clamp_gain(gains[i]);
    }
    configure_all_bands();
}

void Equalizer::reset_bands() {
    m_gains.fill(0.0f);
    configure_all_bands();
}

void Equalizer::set_enabled(bool enabled) {
    if (enabled == m_enabled) {
        return;
    }

    m_enabled = enabled;
    // Registers went stale while bypassed
    reset_all();
    configure_all_bands();
}

void Equalizer::process(float* samples, size_t sample_count, int channels) {
    if (!m_enabled || samples == nullptr || channels <= 0) {
        return;
    }

    if (channels != m_channels) {
        set_format(static_cast<int>(m_sample_rate), channels);
    }

    const size_t frames = sample_count / static_cast<size_t>(channels);
    for (size_t frame = 0; frame < frames; ++frame) {
        float* slot = samples + frame * static_cast<size_t>(channels);
        for (int ch = 0; ch < channels; ++ch) {
            BiquadFilter* chain = &m_filters[static_cast<size_t>(ch) * BAND_COUNT];
            float value = slot[ch];
            for (size_t band = 0; band < BAND_COUNT; ++band) {
                value = chain[band].process_sample(value);
            }
            slot[ch] = value;
        }
    }
}

void Equalizer::reset_all() {
    for (auto& filter : m_filters) {
        filter.reset();
    }
}

void Equalizer::configure_band(size_t band) {
    const double frequency = band_frequencies()[band];
    for (int ch = 0; ch < m_channels; ++ch) {
        filter_at(ch, band).configure(frequency, m_gains[band], m_sample_rate, Q_FACTOR);
    }
}

void Equalizer::configure_all_bands() {
    for (size_t band = 0; band < BAND_COUNT; ++band) {
        configure_band(band);
    }
}

}
