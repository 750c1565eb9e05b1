#include <gtest/gtest.h>
#include "message_channel.hpp"
#include "audio_messages.hpp"
#include <thread>

using namespace std::chrono_literals;

class MessageChannelTest : public ::testing::Test {
protected:
    oneamp::MessageChannel<oneamp::AudioCommand> commands{4};
};

TEST_F(MessageChannelTest, PreservesSendOrder) {
    EXPECT_TRUE(commands.try_send(oneamp::AudioCommand::load_file("a.mp3")));
    EXPECT_TRUE(commands.try_send(oneamp::AudioCommand::play()));
    EXPECT_TRUE(commands.try_send(oneamp::AudioCommand::seek(12.5f)));

    oneamp::AudioCommand command;
    ASSERT_TRUE(commands.try_receive(command));
    EXPECT_EQ(command.type, oneamp::CommandType::LOAD_FILE);
    EXPECT_EQ(command.path, "a.mp3");
    ASSERT_TRUE(commands.try_receive(command));
    EXPECT_EQ(command.type, oneamp::CommandType::PLAY);
    ASSERT_TRUE(commands.try_receive(command));
    EXPECT_EQ(command.type, oneamp::CommandType::SEEK);
    EXPECT_FLOAT_EQ(command.value, 12.5f);
    EXPECT_FALSE(commands.try_receive(command));
}

TEST_F(MessageChannelTest, FullChannelRejectsWithoutBlocking) {
    for (int i = 0; i < 4; ++i) {
        EXPECT_TRUE(commands.try_send(oneamp::AudioCommand::play()));
    }
    EXPECT_FALSE(commands.try_send(oneamp::AudioCommand::stop()));
    EXPECT_EQ(commands.dropped(), 1u);
    EXPECT_EQ(commands.size(), 4u);
}

TEST_F(MessageChannelTest, WaitReceiveTimesOut) {
    oneamp::AudioCommand command;
    const auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(commands.wait_receive(command, 20ms));
    EXPECT_GE(std::chrono::steady_clock::now() - start, 15ms);
}

TEST_F(MessageChannelTest, WaitReceiveWakesOnSend) {
    std::thread sender([this]() {
        std::this_thread::sleep_for(10ms);
        commands.try_send(oneamp::AudioCommand::pause());
    });

    oneamp::AudioCommand command;
    EXPECT_TRUE(commands.wait_receive(command, 2000ms));
    EXPECT_EQ(command.type, oneamp::CommandType::PAUSE);
    sender.join();
}

TEST_F(MessageChannelTest, EventsCarryPayload) {
    oneamp::MessageChannel<oneamp::AudioEvent> events;
    oneamp::TrackMetadata track;
    track.title = "Song";
    track.duration = 12.0;

    events.try_send(oneamp::AudioEvent::track_loaded(track));
    events.try_send(oneamp::AudioEvent::position_changed(3.5));
    events.try_send(oneamp::AudioEvent::error("broken"));

    oneamp::AudioEvent event;
    ASSERT_TRUE(events.try_receive(event));
    EXPECT_EQ(event.type, oneamp::EventType::TRACK_LOADED);
    EXPECT_EQ(event.track.title, "Song");
    ASSERT_TRUE(events.try_receive(event));
    EXPECT_DOUBLE_EQ(event.position, 3.5);
    ASSERT_TRUE(events.try_receive(event));
    EXPECT_EQ(event.type, oneamp::EventType::ERROR);
    EXPECT_EQ(event.message, "broken");
}
