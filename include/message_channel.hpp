#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <cstddef>

namespace oneamp {

// Bounded FIFO used in one direction between two threads. Producers never
// block: try_send() fails when the channel is full. The consumer may poll
// with try_receive() or wait with a timeout.
template <typename T>
class MessageChannel {
private:
    std::deque<T> m_queue;
    size_t m_capacity;
    size_t m_dropped = 0;
    mutable std::mutex m_mutex;
    std::condition_variable m_available;

public:
    explicit MessageChannel(size_t capacity = 256) : m_capacity(capacity) {}

    bool try_send(T message) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_queue.size() >= m_capacity) {
                ++m_dropped;
                return false;
            }
            m_queue.push_back(std::move(message));
        }
        m_available.notify_one();
        return true;
    }

    bool try_receive(T& out) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_queue.empty()) {
            return false;
        }
        out = std::move(m_queue.front());
        m_queue.pop_front();
        return true;
    }

    bool wait_receive(T& out, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(m_mutex);
        if (!m_available.wait_for(lock, timeout, [this] { return !m_queue.empty(); })) {
            return false;
        }
        out = std::move(m_queue.front());
        m_queue.pop_front();
        return true;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_queue.size();
    }

    bool empty() const {
        return size() == 0;
    }

    size_t capacity() const { return m_capacity; }

    size_t dropped() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_dropped;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_queue.clear();
    }
};

}
