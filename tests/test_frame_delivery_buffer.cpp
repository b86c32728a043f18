#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include <vector>
#include "frame_delivery_buffer.hpp"

namespace {
AnnotatedFrame annotated(uint64_t seq) {
    AnnotatedFrame f;
    f.sequence = seq;
    f.image = cv::Mat(2, 2, CV_8UC3, cv::Scalar::all(static_cast<double>(seq % 256)));
    return f;
}
}  // namespace

TEST(FrameDeliveryBufferTest, EmptyBeforeFirstPublish) {
    FrameDeliveryBuffer buffer;
    EXPECT_TRUE(buffer.empty());
    EXPECT_EQ(buffer.latest(), nullptr);
    EXPECT_EQ(buffer.latest_sequence(), 0u);
}

TEST(FrameDeliveryBufferTest, MostRecentWins) {
    FrameDeliveryBuffer buffer;
    EXPECT_TRUE(buffer.publish(annotated(1)));
    EXPECT_TRUE(buffer.publish(annotated(2)));
    EXPECT_TRUE(buffer.publish(annotated(5)));

    auto latest = buffer.latest();
    ASSERT_NE(latest, nullptr);
    EXPECT_EQ(latest->sequence, 5u);
    EXPECT_EQ(buffer.published(), 3u);
}

TEST(FrameDeliveryBufferTest, RejectsOlderAndDuplicateSequences) {
    FrameDeliveryBuffer buffer;
    buffer.publish(annotated(10));
    EXPECT_FALSE(buffer.publish(annotated(9)));
    EXPECT_FALSE(buffer.publish(annotated(10)));
    EXPECT_EQ(buffer.latest()->sequence, 10u);
    EXPECT_EQ(buffer.rejected(), 2u);
}

TEST(FrameDeliveryBufferTest, NullPublishIgnored) {
    FrameDeliveryBuffer buffer;
    EXPECT_FALSE(buffer.publish(FrameDeliveryBuffer::FramePtr{}));
    EXPECT_TRUE(buffer.empty());
}

TEST(FrameDeliveryBufferTest, ReaderKeepsFrameAfterOverwrite) {
    FrameDeliveryBuffer buffer;
    buffer.publish(annotated(1));
    auto held = buffer.latest();
    buffer.publish(annotated(2));

    ASSERT_NE(held, nullptr);
    EXPECT_EQ(held->sequence, 1u);
    EXPECT_FALSE(held->image.empty());
}

TEST(FrameDeliveryBufferTest, ConcurrentReadersObserveMonotonicSequence) {
    FrameDeliveryBuffer buffer;
    const uint64_t kFrames = 20000;
    std::atomic<bool> done{false};
    std::atomic<int> violations{0};

    std::vector<std::thread> readers;
    for (int r = 0; r < 3; ++r) {
        readers.emplace_back([&]() {
            uint64_t last = 0;
            while (!done.load()) {
                auto f = buffer.latest();
                if (!f) continue;
                if (f->sequence < last) violations++;
                last = f->sequence;
            }
        });
    }

    // Two writers racing with interleaved sequences.
    std::thread even([&]() {
        for (uint64_t s = 2; s <= kFrames; s += 2) buffer.publish(annotated(s));
    });
    std::thread odd([&]() {
        for (uint64_t s = 1; s <= kFrames; s += 2) buffer.publish(annotated(s));
    });
    even.join();
    odd.join();
    done = true;
    for (auto& t : readers) t.join();

    EXPECT_EQ(violations.load(), 0);
    EXPECT_EQ(buffer.latest()->sequence, kFrames);
    EXPECT_EQ(buffer.published() + buffer.rejected(), kFrames);
}

TEST(FrameDeliveryBufferTest, ResetClearsSlotButKeepsSequence) {
    FrameDeliveryBuffer buffer;
    buffer.publish(annotated(7));
    buffer.reset();

    EXPECT_TRUE(buffer.empty());
    EXPECT_EQ(buffer.latest(), nullptr);
    EXPECT_EQ(buffer.latest_sequence(), 7u);

    EXPECT_TRUE(buffer.publish(annotated(8)));
    EXPECT_EQ(buffer.latest()->sequence, 8u);
}

TEST(FrameDeliveryBufferTest, LatestSequenceNeverRegressesUnderRacingWriters) {
    FrameDeliveryBuffer buffer;
    const uint64_t kFrames = 20000;
    std::atomic<bool> done{false};
    std::atomic<int> regressions{0};

    std::thread watcher([&]() {
        uint64_t last = 0;
        while (!done.load()) {
            uint64_t seq = buffer.latest_sequence();
            if (seq < last) regressions++;
            last = seq;
        }
    });

    std::thread even([&]() {
        for (uint64_t s = 2; s <= kFrames; s += 2) buffer.publish(annotated(s));
    });
    std::thread odd([&]() {
        for (uint64_t s = 1; s <= kFrames; s += 2) buffer.publish(annotated(s));
    });
    even.join();
    odd.join();
    done = true;
    watcher.join();

    EXPECT_EQ(regressions.load(), 0);
    EXPECT_EQ(buffer.latest_sequence(), kFrames);
}
