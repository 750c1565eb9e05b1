#include "sample_ring_buffer.hpp"
#include <algorithm>

namespace oneamp {

SampleRingBuffer::SampleRingBuffer(size_t capacity)
    : m_data(capacity, 0.0f) {}

void SampleRingBuffer::reset(size_t capacity) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_data.assign(capacity, 0.0f);
    m_read_pos = 0;
    m_count = 0;
    m_high_water_mark = 0;
    m_space_available.notify_all();
}

size_t SampleRingBuffer::push_locked(const float* samples, size_t count) {
    const size_t capacity = m_data.size();
    const size_t to_write = std::min(count, capacity - m_count);
    if (to_write == 0) {
        return 0;
    }

    const size_t write_pos = (m_read_pos + m_count) % capacity;
    const size_t first = std::min(to_write, capacity - write_pos);
    std::copy(samples, samples + first, m_data.begin() + write_pos);
    std::copy(samples + first, samples + to_write, m_data.begin());

    m_count += to_write;
    m_high_water_mark = std::max(m_high_water_mark, m_count);
    return to_write;
}

size_t SampleRingBuffer::write(const float* samples, size_t count, std::chrono::milliseconds timeout) {
    if (samples == nullptr || count == 0) {
        return 0;
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    size_t written = 0;

    std::unique_lock<std::mutex> lock(m_mutex);
    while (written < count && !m_data.empty()) {
        written += push_locked(samples + written, count - written);
        if (written == count) {
            break;
        }

        if (!m_space_available.wait_until(lock, deadline, [this] { return m_count < m_data.size(); })) {
            break;
        }
    }
    return written;
}

size_t SampleRingBuffer::try_write(const float* samples, size_t count) {
    if (samples == nullptr || count == 0) {
        return 0;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_data.empty()) {
        return 0;
    }
    return push_locked(samples, count);
}

size_t SampleRingBuffer::read(float* out, size_t max_samples) {
    size_t to_read = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const size_t capacity = m_data.size();
        to_read = std::min(max_samples, m_count);
        if (to_read == 0) {
            return 0;
        }

        const size_t first = std::min(to_read, capacity - m_read_pos);
        std::copy(m_data.begin() + m_read_pos, m_data.begin() + m_read_pos + first, out);
        std::copy(m_data.begin(), m_data.begin() + (to_read - first), out + first);

        m_read_pos = (m_read_pos + to_read) % capacity;
        m_count -= to_read;
    }
    m_space_available.notify_one();
    return to_read;
}

void SampleRingBuffer::clear() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_read_pos = 0;
        m_count = 0;
    }
    m_space_available.notify_all();
}

size_t SampleRingBuffer::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_count;
}

size_t SampleRingBuffer::capacity() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_data.size();
}

size_t SampleRingBuffer::free_space() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_data.size() - m_count;
}

size_t SampleRingBuffer::high_water_mark() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_high_water_mark;
}

}
