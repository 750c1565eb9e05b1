#pragma once

#include "biquad_filter.hpp"
#include "types.hpp"
#include <array>
#include <vector>
#include <cstddef>

namespace oneamp {

// 10-band graphic equalizer. Owns one BiquadFilter per (channel, band) in a
// flat array; each channel's chain is contiguous and runs in increasing
// frequency order.
class Equalizer {
public:
    static constexpr size_t BAND_COUNT = 10;
    static constexpr float MIN_GAIN_DB = -12.0f;
    static constexpr float MAX_GAIN_DB = 12.0f;
    static constexpr double Q_FACTOR = 1.0;

    using GainArray = std::array<float, BAND_COUNT>;
    using FrequencyArray = std::array<double, BAND_COUNT>;

private:
    std::vector<BiquadFilter> m_filters;
    GainArray m_gains{};
    double m_sample_rate;
    int m_channels;
    bool m_enabled = false;

    void configure_band(size_t band);
    void configure_all_bands();
    BiquadFilter& filter_at(int channel, size_t band) {
        return m_filters[static_cast<size_t>(channel) * BAND_COUNT + band];
    }

public:
    explicit Equalizer(int sample_rate = 44100, int channels = 2);

    static const FrequencyArray& band_frequencies();
    static float clamp_gain(float gain_db);

    // Rebuilds the filter bank for a new stream format. Delay state is cleared.
    void set_format(int sample_rate, int channels);
    int sample_rate() const { return static_cast<int>(m_sample_rate); }
    int channels() const { return m_channels; }

    bool set_band_gain(size_t index, float gain_db);
    float get_band_gain(size_t index) const;
    const GainArray& get_all_gains() const { return m_gains; }
    void set_all_gains(const GainArray& gains);
    void reset_bands();

    void set_enabled(bool enabled);
    bool is_enabled() const { return m_enabled; }

    void process(float* samples, size_t sample_count, int channels);
    void process(AudioBuffer& buffer, int channels) {
        process(buffer.data(), buffer.size(), channels);
    }

    void reset_all();
};

}
