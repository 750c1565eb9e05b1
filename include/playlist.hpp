#pragma once

#include "types.hpp"
#include <memory>
#include <random>

namespace oneamp {

// Ordered track queue answering the engine's RequestNext/RequestPrevious and
// PlaybackFinished events. Navigation wraps around at both ends.
class IPlaylist {
public:
    virtual ~IPlaylist() = default;
    virtual void add(const PlaylistEntry& entry) = 0;
    virtual void add_all(const TrackList& entries) = 0;
    virtual void clear() = 0;
    virtual const PlaylistEntry* current() const = 0;
    virtual const PlaylistEntry* next() = 0;
    virtual const PlaylistEntry* previous() = 0;
    virtual const PlaylistEntry* select(size_t index) = 0;
    virtual size_t current_index() const = 0;
    virtual size_t size() const = 0;
    virtual bool empty() const = 0;
    virtual void set_shuffle(bool enabled) = 0;
    virtual bool is_shuffled() const = 0;
};

class TrackPlaylist : public IPlaylist {
private:
    TrackList m_entries;
    // Playback order as indices into m_entries
    std::vector<size_t> m_order;
    size_t m_position = 0;
    std::mt19937 m_random_engine;
    bool m_shuffled = false;

    void rebuild_order(bool keep_current);

public:
    TrackPlaylist();
    explicit TrackPlaylist(std::mt19937::result_type seed);
    ~TrackPlaylist() override = default;

    void add(const PlaylistEntry& entry) override;
    void add_all(const TrackList& entries) override;
    void clear() override;
    const PlaylistEntry* current() const override;
    const PlaylistEntry* next() override;
    const PlaylistEntry* previous() override;
    const PlaylistEntry* select(size_t index) override;
    size_t current_index() const override { return m_position; }
    size_t size() const override { return m_entries.size(); }
    bool empty() const override { return m_entries.empty(); }
    void set_shuffle(bool enabled) override;
    bool is_shuffled() const override { return m_shuffled; }
};

std::unique_ptr<IPlaylist> create_playlist();

}
