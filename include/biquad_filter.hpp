#pragma once

namespace oneamp {

// Second-order peaking EQ section (RBJ audio EQ cookbook), evaluated in
// transposed direct form II. Coefficients and delay registers are kept in
// double precision; samples enter and leave as float.
class BiquadFilter {
private:
    double m_b0 = 1.0;
    double m_b1 = 0.0;
    double m_b2 = 0.0;
    double m_a1 = 0.0;
    double m_a2 = 0.0;

    double m_z1 = 0.0;
    double m_z2 = 0.0;

public:
    BiquadFilter() = default;

    // Recomputes the coefficients only. The delay registers are left alone so
    // audio in flight continues through the new transfer function.
    void configure(double center_freq_hz, double gain_db, double sample_rate, double q_factor);

    float process_sample(float x) {
        const double in = x;
        const double out = m_b0 * in + m_z1;
        m_z1 = m_b1 * in - m_a1 * out + m_z2;
        m_z2 = m_b2 * in - m_a2 * out;
        return static_cast<float>(out);
    }

    void reset() {
        m_z1 = 0.0;
        m_z2 = 0.0;
    }

    void set_passthrough();
    bool is_passthrough() const;

    double b0() const { return m_b0; }
    double b1() const { return m_b1; }
    double b2() const { return m_b2; }
    double a1() const { return m_a1; }
    double a2() const { return m_a2; }
};

}
