#include "playlist.hpp"
#include <algorithm>
#include <chrono>
#include <numeric>

namespace oneamp {

TrackPlaylist::TrackPlaylist()
    : TrackPlaylist(static_cast<std::mt19937::result_type>(
          std::chrono::high_resolution_clock::now().time_since_epoch().count())) {}

TrackPlaylist::TrackPlaylist(std::mt19937::result_type seed)
    : m_random_engine(seed) {}

void TrackPlaylist::rebuild_order(bool keep_current) {
    const bool had_current = keep_current && m_position < m_order.size();
    const size_t current_entry = had_current ? m_order[m_position] : 0;

    m_order.resize(m_entries.size());
    std::iota(m_order.begin(), m_order.end(), size_t{0});

    if (m_shuffled && m_order.size() > 1) {
        // Fisher-Yates
        for (size_t i = m_order.size() - 1; i > 0; --i) {
            std::uniform_int_distribution<size_t> dist(0, i);
            std::swap(m_order[i], m_order[dist(m_random_engine)]);
        }
    }

    m_position = 0;
    if (had_current && !m_shuffled) {
        m_position = current_entry;
    } else if (had_current) {
        // The playing track becomes the head of the shuffled order
        auto it = std::find(m_order.begin(), m_order.end(), current_entry);
        if (it != m_order.end()) {
            std::iter_swap(m_order.begin(), it);
        }
    }
}

void TrackPlaylist::add(const PlaylistEntry& entry) {
    m_entries.push_back(entry);
    const size_t index = m_entries.size() - 1;

    if (m_shuffled && m_order.size() > 1) {
        // Random slot after the current track
        std::uniform_int_distribution<size_t> dist(m_position + 1, m_order.size());
        m_order.insert(m_order.begin() + static_cast<std::ptrdiff_t>(dist(m_random_engine)), index);
    } else {
        m_order.push_back(index);
    }
}

void TrackPlaylist::add_all(const TrackList& entries) {
    for (const auto& entry : entries) {
        add(entry);
    }
}

void TrackPlaylist::clear() {
    m_entries.clear();
    m_order.clear();
    m_position = 0;
}

const PlaylistEntry* TrackPlaylist::current() const {
    if (m_position >= m_order.size()) {
        return nullptr;
    }
    return &m_entries[m_order[m_position]];
}

const PlaylistEntry* TrackPlaylist::next() {
    if (empty()) {
        return nullptr;
    }
    m_position = (m_position + 1) % m_order.size();
    return current();
}

const PlaylistEntry* TrackPlaylist::previous() {
    if (empty()) {
        return nullptr;
    }
    m_position = m_position == 0 ? m_order.size() - 1 : m_position - 1;
    return current();
}

const PlaylistEntry* TrackPlaylist::select(size_t index) {
    if (index >= m_order.size()) {
        return nullptr;
    }
    m_position = index;
    return current();
}

void TrackPlaylist::set_shuffle(bool enabled) {
    m_shuffled = enabled;
    rebuild_order(true);
}

std::unique_ptr<IPlaylist> create_playlist() {
    return std::make_unique<TrackPlaylist>();
}

}
