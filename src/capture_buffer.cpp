#include "capture_buffer.hpp"
#include <algorithm>

namespace oneamp {

CaptureBuffer::CaptureBuffer(size_t capacity)
    : m_ring(std::max<size_t>(capacity, 1), 0.0f) {}

void CaptureBuffer::write(const float* samples, size_t count) {
    if (samples == nullptr || count == 0) {
        return;
    }

    const size_t capacity = m_ring.size();
    // Only the tail can survive
    if (count > capacity) {
        samples += count - capacity;
        count = capacity;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    const size_t first = std::min(count, capacity - m_write_pos);
    std::copy(samples, samples + first, m_ring.begin() + m_write_pos);
    std::copy(samples + first, samples + count, m_ring.begin());
    m_write_pos = (m_write_pos + count) % capacity;
    m_size = std::min(capacity, m_size + count);
}

void CaptureBuffer::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::fill(m_ring.begin(), m_ring.end(), 0.0f);
    m_write_pos = 0;
    m_size = 0;
}

void CaptureBuffer::set_format(int sample_rate, int channels) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_sample_rate = sample_rate;
    m_channels = std::max(1, channels);
}

std::vector<float> CaptureBuffer::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<float> out;
    out.reserve(m_size);

    const size_t capacity = m_ring.size();
    const size_t start = (m_write_pos + capacity - m_size) % capacity;
    for (size_t i = 0; i < m_size; ++i) {
        out.push_back(m_ring[(start + i) % capacity]);
    }
    return out;
}

std::vector<float> CaptureBuffer::snapshot_mono() const {
    int channels = 1;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        channels = m_channels;
    }

    std::vector<float> interleaved = snapshot();
    if (channels <= 1) {
        return interleaved;
    }

    const size_t frames = interleaved.size() / static_cast<size_t>(channels);
    // Drop a leading partial frame so channels stay aligned
    const size_t offset = interleaved.size() - frames * static_cast<size_t>(channels);
    std::vector<float> mono(frames, 0.0f);
    for (size_t frame = 0; frame < frames; ++frame) {
        float sum = 0.0f;
        for (int ch = 0; ch < channels; ++ch) {
            sum += interleaved[offset + frame * static_cast<size_t>(channels) + static_cast<size_t>(ch)];
        }
        mono[frame] = sum / static_cast<float>(channels);
    }
    return mono;
}

size_t CaptureBuffer::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_size;
}

int CaptureBuffer::sample_rate() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_sample_rate;
}

int CaptureBuffer::channels() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_channels;
}

}
