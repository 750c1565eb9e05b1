#pragma once

#include "types.hpp"
#include <mutex>
#include <vector>
#include <cstddef>

namespace oneamp {

// Bounded window over the most recent processed samples, written by the
// audio-control thread and read by visualization consumers. Readers get a
// copy taken under the lock, so a snapshot never contains a partial write.
class CaptureBuffer {
public:
    static constexpr size_t DEFAULT_CAPACITY = 2048;

private:
    mutable std::mutex m_mutex;
    std::vector<float> m_ring;
    size_t m_write_pos = 0;
    size_t m_size = 0;
    int m_sample_rate = 44100;
    int m_channels = 2;

public:
    explicit CaptureBuffer(size_t capacity = DEFAULT_CAPACITY);

    void write(const float* samples, size_t count);
    void write(const AudioBuffer& samples) { write(samples.data(), samples.size()); }
    void clear();
    void set_format(int sample_rate, int channels);

    // Oldest-first copy of the retained samples, interleaved.
    std::vector<float> snapshot() const;
    // Channel average of the retained frames, oldest first.
    std::vector<float> snapshot_mono() const;

    size_t capacity() const { return m_ring.size(); }
    size_t size() const;
    int sample_rate() const;
    int channels() const;
};

}
