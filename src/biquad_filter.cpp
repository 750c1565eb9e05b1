#include "biquad_filter.hpp"
#include <cmath>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace oneamp {

void BiquadFilter::configure(double center_freq_hz, double gain_db, double sample_rate, double q_factor) {
    if (sample_rate <= 0.0 || q_factor <= 0.0 ||
        center_freq_hz <= 0.0 || center_freq_hz >= sample_rate / 2.0) {
        set_passthrough();
        return;
    }

    const double a = std::pow(10.0, gain_db / 40.0);
    const double omega = 2.0 * M_PI * center_freq_hz / sample_rate;
    const double sin_omega = std::sin(omega);
    const double cos_omega = std::cos(omega);
    const double alpha = sin_omega / (2.0 * q_factor);

    const double b0 = 1.0 + alpha * a;
    const double b1 = -2.0 * cos_omega;
    const double b2 = 1.0 - alpha * a;
    const double a0 = 1.0 + alpha / a;
    const double a1 = -2.0 * cos_omega;
    const double a2 = 1.0 - alpha / a;

    m_b0 = b0 / a0;
    m_b1 = b1 / a0;
    m_b2 = b2 / a0;
    m_a1 = a1 / a0;
    m_a2 = a2 / a0;
}

void BiquadFilter::set_passthrough() {
    m_b0 = 1.0;
    m_b1 = 0.0;
    m_b2 = 0.0;
    m_a1 = 0.0;
    m_a2 = 0.0;
}

bool BiquadFilter::is_passthrough() const {
    return m_b0 == 1.0 && m_b1 == 0.0 && m_b2 == 0.0 && m_a1 == 0.0 && m_a2 == 0.0;
}

}
