#include <gtest/gtest.h>
#include "sample_ring_buffer.hpp"
#include <numeric>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

class SampleRingBufferTest : public ::testing::Test {
protected:
    void SetUp() override {
        ring.reset(16);
    }

    oneamp::SampleRingBuffer ring;
};

TEST_F(SampleRingBufferTest, WriteThenRead) {
    std::vector<float> in = {1.0f, 2.0f, 3.0f, 4.0f};
    EXPECT_EQ(ring.try_write(in.data(), in.size()), 4u);
    EXPECT_EQ(ring.size(), 4u);
    EXPECT_EQ(ring.free_space(), 12u);

    std::vector<float> out(8, 0.0f);
    EXPECT_EQ(ring.read(out.data(), out.size()), 4u);
    EXPECT_EQ(std::vector<float>(out.begin(), out.begin() + 4), in);
    EXPECT_EQ(ring.size(), 0u);
}

TEST_F(SampleRingBufferTest, TryWriteStopsWhenFull) {
    std::vector<float> in(20, 1.0f);
    EXPECT_EQ(ring.try_write(in.data(), in.size()), 16u);
    EXPECT_EQ(ring.try_write(in.data(), 1), 0u);
    EXPECT_EQ(ring.high_water_mark(), 16u);
}

TEST_F(SampleRingBufferTest, WrapsAround) {
    std::vector<float> in(12);
    std::iota(in.begin(), in.end(), 0.0f);
    std::vector<float> out(12);

    ring.try_write(in.data(), 12);
    ring.read(out.data(), 10);
    ring.try_write(in.data(), 12);

    EXPECT_EQ(ring.size(), 14u);
    std::vector<float> all(14);
    ASSERT_EQ(ring.read(all.data(), all.size()), 14u);
    EXPECT_FLOAT_EQ(all[0], 10.0f);
    EXPECT_FLOAT_EQ(all[1], 11.0f);
    EXPECT_FLOAT_EQ(all[2], 0.0f);
    EXPECT_FLOAT_EQ(all[13], 11.0f);
}

TEST_F(SampleRingBufferTest, BlockingWriteTimesOut) {
    std::vector<float> in(24, 0.5f);
    const auto start = std::chrono::steady_clock::now();
    const size_t written = ring.write(in.data(), in.size(), 30ms);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(written, 16u);
    EXPECT_GE(elapsed, 25ms);
}

TEST_F(SampleRingBufferTest, ClearDropsContent) {
    std::vector<float> in(8, 1.0f);
    ring.try_write(in.data(), in.size());
    ring.clear();
    EXPECT_EQ(ring.size(), 0u);
    EXPECT_EQ(ring.free_space(), 16u);
}

TEST_F(SampleRingBufferTest, FastWriterSlowReaderStaysBounded) {
    ring.reset(1024);
    const size_t total = 64 * 1024;

    std::thread reader([&]() {
        std::vector<float> out(128);
        size_t received = 0;
        float expected = 0.0f;
        while (received < total) {
            const size_t n = ring.read(out.data(), out.size());
            for (size_t i = 0; i < n; ++i) {
                ASSERT_FLOAT_EQ(out[i], expected);
                expected += 1.0f;
                if (expected >= 4096.0f) {
                    expected = 0.0f;
                }
            }
            received += n;
            std::this_thread::sleep_for(100us);
        }
    });

    std::vector<float> block(512);
    size_t sent = 0;
    float value = 0.0f;
    while (sent < total) {
        for (auto& sample : block) {
            sample = value;
            value += 1.0f;
            if (value >= 4096.0f) {
                value = 0.0f;
            }
        }
        size_t offset = 0;
        while (offset < block.size()) {
            offset += ring.write(block.data() + offset, block.size() - offset, 50ms);
        }
        sent += block.size();
    }

    reader.join();
    EXPECT_LE(ring.high_water_mark(), ring.capacity());
    EXPECT_EQ(ring.size(), 0u);
}
