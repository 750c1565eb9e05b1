#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <vector>
#include <cstddef>

namespace oneamp {

// Fixed-capacity FIFO of interleaved samples between the audio-control thread
// (writer) and the device thread (reader). Storage is allocated once; read()
// never allocates. write() blocks for at most `timeout` while the ring is full.
class SampleRingBuffer {
private:
    std::vector<float> m_data;
    size_t m_read_pos = 0;
    size_t m_count = 0;
    size_t m_high_water_mark = 0;

    mutable std::mutex m_mutex;
    std::condition_variable m_space_available;

    size_t push_locked(const float* samples, size_t count);

public:
    explicit SampleRingBuffer(size_t capacity = 0);

    void reset(size_t capacity);

    size_t write(const float* samples, size_t count, std::chrono::milliseconds timeout);
    size_t try_write(const float* samples, size_t count);
    size_t read(float* out, size_t max_samples);
    void clear();

    size_t size() const;
    size_t capacity() const;
    size_t free_space() const;
    size_t high_water_mark() const;
};

}
