#include <gtest/gtest.h>
#include "playlist.hpp"
#include <algorithm>
#include <set>

class PlaylistTest : public ::testing::Test {
protected:
    void SetUp() override {
        playlist = std::make_unique<oneamp::TrackPlaylist>(1234u);
    }

    static oneamp::PlaylistEntry entry(int number) {
        oneamp::PlaylistEntry result;
        result.file_path = "track" + std::to_string(number) + ".mp3";
        result.display_name = "Track " + std::to_string(number);
        return result;
    }

    static oneamp::TrackList entries(int count) {
        oneamp::TrackList list;
        for (int i = 0; i < count; ++i) {
            list.push_back(entry(i));
        }
        return list;
    }

    std::unique_ptr<oneamp::TrackPlaylist> playlist;
};

TEST_F(PlaylistTest, InitialState) {
    EXPECT_TRUE(playlist->empty());
    EXPECT_EQ(playlist->size(), 0u);
    EXPECT_EQ(playlist->current(), nullptr);
    EXPECT_EQ(playlist->next(), nullptr);
    EXPECT_EQ(playlist->previous(), nullptr);
    EXPECT_FALSE(playlist->is_shuffled());
}

TEST_F(PlaylistTest, AddKeepsOrder) {
    playlist->add_all(entries(3));
    EXPECT_EQ(playlist->size(), 3u);
    ASSERT_NE(playlist->current(), nullptr);
    EXPECT_EQ(playlist->current()->file_path, "track0.mp3");
    EXPECT_EQ(playlist->current_index(), 0u);
}

TEST_F(PlaylistTest, NavigationWrapsAround) {
    playlist->add_all(entries(3));

    EXPECT_EQ(playlist->next()->file_path, "track1.mp3");
    EXPECT_EQ(playlist->next()->file_path, "track2.mp3");
    EXPECT_EQ(playlist->next()->file_path, "track0.mp3");
    EXPECT_EQ(playlist->previous()->file_path, "track2.mp3");
    EXPECT_EQ(playlist->current_index(), 2u);
}

TEST_F(PlaylistTest, SingleTrackRepeatsItself) {
    playlist->add(entry(7));
    EXPECT_EQ(playlist->next()->file_path, "track7.mp3");
    EXPECT_EQ(playlist->previous()->file_path, "track7.mp3");
}

TEST_F(PlaylistTest, SelectByIndex) {
    playlist->add_all(entries(4));
    ASSERT_NE(playlist->select(2), nullptr);
    EXPECT_EQ(playlist->current()->file_path, "track2.mp3");
    EXPECT_EQ(playlist->select(4), nullptr);
    EXPECT_EQ(playlist->current()->file_path, "track2.mp3");
}

TEST_F(PlaylistTest, ShuffleVisitsEveryTrackOnce) {
    playlist->add_all(entries(20));
    playlist->select(5);
    playlist->set_shuffle(true);
    EXPECT_TRUE(playlist->is_shuffled());

    // The playing track stays current
    EXPECT_EQ(playlist->current()->file_path, "track5.mp3");

    std::set<std::string> seen;
    std::vector<std::string> order;
    for (size_t i = 0; i < playlist->size(); ++i) {
        seen.insert(playlist->current()->file_path);
        order.push_back(playlist->current()->file_path);
        playlist->next();
    }
    EXPECT_EQ(seen.size(), 20u);
    EXPECT_EQ(playlist->current()->file_path, "track5.mp3");

    std::vector<std::string> sorted_order = order;
    std::sort(sorted_order.begin(), sorted_order.end());
    EXPECT_NE(order, sorted_order);
}

TEST_F(PlaylistTest, UnshuffleKeepsCurrentTrack) {
    playlist->add_all(entries(10));
    playlist->set_shuffle(true);
    playlist->next();
    playlist->next();
    const std::string playing = playlist->current()->file_path;

    playlist->set_shuffle(false);
    EXPECT_FALSE(playlist->is_shuffled());
    EXPECT_EQ(playlist->current()->file_path, playing);

    const std::string after = playlist->next()->file_path;
    const int playing_number = std::stoi(playing.substr(5));
    EXPECT_EQ(after, "track" + std::to_string((playing_number + 1) % 10) + ".mp3");
}

TEST_F(PlaylistTest, AddWhileShuffledKeepsCurrent) {
    playlist->add_all(entries(5));
    playlist->set_shuffle(true);
    const std::string playing = playlist->current()->file_path;

    playlist->add(entry(99));
    EXPECT_EQ(playlist->size(), 6u);
    EXPECT_EQ(playlist->current()->file_path, playing);

    bool found = false;
    for (size_t i = 0; i < playlist->size(); ++i) {
        found = found || playlist->next()->file_path == "track99.mp3";
    }
    EXPECT_TRUE(found);
}

TEST_F(PlaylistTest, ClearEmptiesPlaylist) {
    playlist->add_all(entries(3));
    playlist->next();
    playlist->clear();
    EXPECT_TRUE(playlist->empty());
    EXPECT_EQ(playlist->current(), nullptr);
    EXPECT_EQ(playlist->current_index(), 0u);
}

TEST_F(PlaylistTest, FactoryReturnsEmptyPlaylist) {
    auto created = oneamp::create_playlist();
    ASSERT_NE(created, nullptr);
    EXPECT_TRUE(created->empty());
}
