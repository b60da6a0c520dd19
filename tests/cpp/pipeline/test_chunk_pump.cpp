#include "../fakes/fake_session.h"
#include "pipeline/chunk_pump.h"

#include <atomic>
#include <gtest/gtest.h>
#include <random>
#include <thread>

using namespace live_asr;
using namespace live_asr::pipeline;
using namespace std::chrono_literals;

namespace {

constexpr std::size_t kChunkBytes = 6400;
constexpr auto kChunkDuration = 200ms;

template <typename Pred>
bool waitUntil(Pred pred, std::chrono::milliseconds timeout = 2s) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() > deadline) {
            return false;
        }
        std::this_thread::sleep_for(1ms);
    }
    return true;
}

}  // namespace

class ChunkPumpTest : public ::testing::Test {
   protected:
    void SetUp() override {
        log_ = std::make_shared<fakes::EventLog>();
        session_ = std::make_unique<fakes::FakeSession>(log_);
        base_ = ChunkPump::Clock::now();
    }

    void TearDown() override {
        stopPump();
    }

    ChunkPump::ClockFn manualClock() {
        return [this] { return base_ + std::chrono::milliseconds(offsetMs_.load()); };
    }

    void startPump(ChunkPump::ClockFn clock) {
        pump_ = std::make_unique<ChunkPump>(channel_, *session_, flags_, kChunkBytes,
                                            kChunkDuration, std::move(clock));
        thread_ = std::thread([this] {
            try {
                pump_->run();
            } catch (const TransportError& e) {
                transportFailure_ = true;
                failureCode_ = e.code();
            }
        });
    }

    void stopPump() {
        flags_.cancelled = true;
        channel_.wakeAll();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    std::shared_ptr<fakes::EventLog> log_;
    std::unique_ptr<fakes::FakeSession> session_;
    BoundedChannel channel_{1000};
    PipelineFlags flags_;
    std::unique_ptr<ChunkPump> pump_;
    std::thread thread_;
    ChunkPump::Clock::time_point base_;
    std::atomic<long long> offsetMs_{0};
    std::atomic<bool> transportFailure_{false};
    ErrorCode failureCode_ = ErrorCode::OK;
};

TEST_F(ChunkPumpTest, ExactChunkFromSmallFramesSendsOnceBySize) {
    for (int i = 0; i < 4; ++i) {
        channel_.push(Frame(kChunkBytes / 4, static_cast<std::uint8_t>(i)));
    }
    startPump(manualClock());

    ASSERT_TRUE(session_->waitForSends(1, 2s));
    ASSERT_TRUE(waitUntil([&] { return channel_.size() == 0; }));
    std::this_thread::sleep_for(20ms);
    stopPump();

    auto sends = session_->sends();
    ASSERT_EQ(sends.size(), 1u);
    EXPECT_EQ(sends[0].size(), kChunkBytes);
    EXPECT_EQ(sends[0].front(), 0);
    EXPECT_EQ(sends[0].back(), 3);

    auto stats = pump_->stats();
    EXPECT_EQ(stats.sizeFlushes, 1u);
    EXPECT_EQ(stats.timeFlushes, 0u);
    EXPECT_EQ(stats.finalFlushes, 0u);
    EXPECT_EQ(pump_->bufferedBytes(), 0u);
}

TEST_F(ChunkPumpTest, PartialBufferIsSentWholeAfterDeadline) {
    channel_.push(Frame(1600, 0xAB));
    startPump(manualClock());

    ASSERT_TRUE(waitUntil([&] { return pump_->bufferedBytes() == 1600; }));
    EXPECT_TRUE(session_->sends().empty());

    offsetMs_ = 250;
    ASSERT_TRUE(session_->waitForSends(1, 2s));
    // Buffer is emptied by the time flush, not left for the final flush
    EXPECT_TRUE(waitUntil([&] { return pump_->bufferedBytes() == 0; }));
    stopPump();

    auto sends = session_->sends();
    ASSERT_EQ(sends.size(), 1u);
    EXPECT_EQ(sends[0].size(), 1600u);
    EXPECT_EQ(pump_->bufferedBytes(), 0u);

    auto stats = pump_->stats();
    EXPECT_EQ(stats.timeFlushes, 1u);
    EXPECT_EQ(stats.sizeFlushes, 0u);
    EXPECT_EQ(stats.finalFlushes, 0u);
}

TEST_F(ChunkPumpTest, OversizedFrameIsSplitIntoExactChunks) {
    channel_.push(Frame(kChunkBytes * 2 + 100, 1));
    startPump(manualClock());

    ASSERT_TRUE(session_->waitForSends(2, 2s));
    stopPump();

    auto sends = session_->sends();
    ASSERT_EQ(sends.size(), 3u);
    EXPECT_EQ(sends[0].size(), kChunkBytes);
    EXPECT_EQ(sends[1].size(), kChunkBytes);
    EXPECT_EQ(sends[2].size(), 100u);
    EXPECT_EQ(pump_->stats().finalFlushes, 1u);
}

TEST_F(ChunkPumpTest, CancellationFlushesRemainderExactlyOnce) {
    for (int i = 0; i < 3; ++i) {
        channel_.push(Frame(1000, static_cast<std::uint8_t>(i)));
    }
    startPump(manualClock());
    ASSERT_TRUE(waitUntil([&] { return pump_->bufferedBytes() == 3000; }));

    stopPump();

    auto sends = session_->sends();
    ASSERT_EQ(sends.size(), 1u);
    EXPECT_EQ(sends[0].size(), 3000u);
    EXPECT_EQ(pump_->stats().finalFlushes, 1u);
    EXPECT_EQ(pump_->bufferedBytes(), 0u);
}

TEST_F(ChunkPumpTest, NoFlushOnceSessionIsClosed) {
    for (int i = 0; i < 3; ++i) {
        channel_.push(Frame(1000, 0));
    }
    startPump(manualClock());
    ASSERT_TRUE(waitUntil([&] { return pump_->bufferedBytes() == 3000; }));

    flags_.sessionClosed = true;
    stopPump();

    EXPECT_TRUE(session_->sends().empty());
    EXPECT_EQ(pump_->stats().finalFlushes, 0u);
}

TEST_F(ChunkPumpTest, BytesSentEqualBytesPushedInOrder) {
    std::mt19937 rng(42);
    std::uniform_int_distribution<int> sizes(200, 9000);
    std::vector<std::uint8_t> expected;
    std::uint8_t counter = 0;

    startPump(&ChunkPump::Clock::now);
    constexpr int kFrames = 60;
    for (int i = 0; i < kFrames; ++i) {
        Frame frame(static_cast<std::size_t>(sizes(rng)));
        for (auto& b : frame) {
            b = counter++;
        }
        expected.insert(expected.end(), frame.begin(), frame.end());
        channel_.push(std::move(frame));
        if (i % 7 == 0) {
            std::this_thread::sleep_for(3ms);
        }
    }
    ASSERT_TRUE(waitUntil([&] { return pump_->stats().framesReceived == kFrames; }));
    stopPump();

    std::vector<std::uint8_t> actual;
    for (const auto& chunk : session_->sends()) {
        EXPECT_LE(chunk.size(), kChunkBytes);
        actual.insert(actual.end(), chunk.begin(), chunk.end());
    }
    EXPECT_EQ(channel_.dropCount(), 0u);
    EXPECT_EQ(actual.size(), expected.size());
    EXPECT_EQ(actual, expected);
    EXPECT_EQ(pump_->stats().bytesSent, expected.size());
}

TEST_F(ChunkPumpTest, SendFailurePropagatesAsTransportError) {
    session_->failSendsAfter = 0;
    channel_.push(Frame(kChunkBytes, 0));
    startPump(manualClock());

    ASSERT_TRUE(waitUntil([&] { return transportFailure_.load(); }));
    stopPump();
    EXPECT_EQ(failureCode_, ErrorCode::TRANSPORT_SEND_FAILED);
}
