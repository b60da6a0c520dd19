#include "../fakes/fake_session.h"
#include "pipeline/bounded_channel.h"
#include "pipeline/chunk_pump.h"
#include "pipeline/shutdown_coordinator.h"

#include <atomic>
#include <condition_variable>
#include <gtest/gtest.h>
#include <mutex>
#include <stdexcept>
#include <thread>

using namespace live_asr;
using namespace live_asr::pipeline;
using namespace std::chrono_literals;

class ShutdownCoordinatorTest : public ::testing::Test {
   protected:
    ShutdownCoordinator::Steps recordingSteps() {
        ShutdownCoordinator::Steps steps;
        steps.wakeWaiters = [this] { record("wake"); };
        steps.awaitSender = [this](std::chrono::milliseconds grace) {
            grantedGrace_ = grace;
            record("awaitSender");
            return true;
        };
        steps.stopSession = [this] {
            closedDuringStop_ = flags_.isSessionClosed();
            record("stopSession");
        };
        steps.awaitTasks = [this] { record("awaitTasks"); };
        steps.releaseSignals = [this] { record("releaseSignals"); };
        steps.closeRemoteSession = [this] { record("closeRemote"); };
        return steps;
    }

    void record(const std::string& step) {
        std::lock_guard<std::mutex> lock(mutex_);
        steps_.push_back(step);
    }

    std::vector<std::string> recorded() {
        std::lock_guard<std::mutex> lock(mutex_);
        return steps_;
    }

    PipelineFlags flags_;
    std::mutex mutex_;
    std::vector<std::string> steps_;
    std::chrono::milliseconds grantedGrace_{0};
    bool closedDuringStop_ = true;
};

TEST_F(ShutdownCoordinatorTest, InitialState) {
    ShutdownCoordinator coordinator(flags_, recordingSteps(), 400ms);
    EXPECT_EQ(coordinator.state(), ShutdownCoordinator::State::Running);
    EXPECT_FALSE(coordinator.reason().has_value());
    EXPECT_FALSE(flags_.isCancelled());
    EXPECT_FALSE(flags_.isSessionClosed());
}

TEST_F(ShutdownCoordinatorTest, RequestStopIsIdempotent) {
    ShutdownCoordinator coordinator(flags_, recordingSteps(), 400ms);

    EXPECT_TRUE(coordinator.requestStop(StopReason::Interrupt, "received signal 2"));
    EXPECT_FALSE(coordinator.requestStop(StopReason::TaskFailure, "late"));

    EXPECT_EQ(coordinator.state(), ShutdownCoordinator::State::Stopping);
    EXPECT_EQ(coordinator.reason(), StopReason::Interrupt);
    EXPECT_EQ(coordinator.reasonDetail(), "received signal 2");
    EXPECT_TRUE(flags_.isCancelled());
    EXPECT_TRUE(recorded().empty());
}

TEST_F(ShutdownCoordinatorTest, SequenceRunsStepsInOrderExactlyOnce) {
    ShutdownCoordinator coordinator(flags_, recordingSteps(), 400ms);
    coordinator.requestStop(StopReason::StreamEnded);

    EXPECT_TRUE(coordinator.runStopSequence());
    EXPECT_FALSE(coordinator.runStopSequence());

    const std::vector<std::string> expected = {"wake",       "awaitSender",    "stopSession",
                                               "awaitTasks", "releaseSignals", "closeRemote"};
    EXPECT_EQ(recorded(), expected);
    EXPECT_EQ(coordinator.state(), ShutdownCoordinator::State::Stopped);
    EXPECT_EQ(grantedGrace_, 400ms);
    EXPECT_FALSE(closedDuringStop_);
    EXPECT_TRUE(flags_.isSessionClosed());
    EXPECT_EQ(coordinator.failedSteps(), 0);
}

TEST_F(ShutdownCoordinatorTest, SequenceWithoutRequestRecordsRequestedReason) {
    ShutdownCoordinator coordinator(flags_, recordingSteps(), 10ms);
    EXPECT_TRUE(coordinator.runStopSequence());
    EXPECT_EQ(coordinator.reason(), StopReason::Requested);
    EXPECT_TRUE(flags_.isCancelled());
}

TEST_F(ShutdownCoordinatorTest, ConcurrentTriggersExecuteSequenceOnce) {
    std::atomic<int> stopCalls{0};
    std::atomic<int> closeCalls{0};
    ShutdownCoordinator::Steps steps = recordingSteps();
    steps.stopSession = [&] {
        stopCalls++;
        std::this_thread::sleep_for(5ms);
    };
    steps.closeRemoteSession = [&] { closeCalls++; };
    ShutdownCoordinator coordinator(flags_, std::move(steps), 1ms);

    std::atomic<int> requestWins{0};
    std::atomic<int> sequenceWins{0};
    std::vector<std::thread> triggers;
    for (int i = 0; i < 8; ++i) {
        triggers.emplace_back([&, i] {
            if (coordinator.requestStop(i % 2 ? StopReason::Interrupt : StopReason::TaskExited)) {
                requestWins++;
            }
            if (coordinator.runStopSequence()) {
                sequenceWins++;
            }
        });
    }
    for (auto& t : triggers) {
        t.join();
    }

    EXPECT_EQ(requestWins.load(), 1);
    EXPECT_EQ(sequenceWins.load(), 1);
    EXPECT_EQ(stopCalls.load(), 1);
    EXPECT_EQ(closeCalls.load(), 1);
    EXPECT_EQ(coordinator.state(), ShutdownCoordinator::State::Stopped);
}

TEST_F(ShutdownCoordinatorTest, ThrowingStopStillClosesAndRunsLaterSteps) {
    ShutdownCoordinator::Steps steps = recordingSteps();
    steps.stopSession = [this] {
        record("stopSession");
        throw TransportError(ErrorCode::TRANSPORT_SEND_FAILED, "socket gone");
    };
    ShutdownCoordinator coordinator(flags_, std::move(steps), 1ms);
    coordinator.requestStop(StopReason::Interrupt);
    coordinator.runStopSequence();

    EXPECT_TRUE(flags_.isSessionClosed());
    const std::vector<std::string> expected = {"wake",       "awaitSender",    "stopSession",
                                               "awaitTasks", "releaseSignals", "closeRemote"};
    EXPECT_EQ(recorded(), expected);
    EXPECT_EQ(coordinator.failedSteps(), 1);
    EXPECT_EQ(coordinator.state(), ShutdownCoordinator::State::Stopped);
}

TEST_F(ShutdownCoordinatorTest, EveryStepFailingStillReachesStopped) {
    ShutdownCoordinator::Steps steps;
    steps.wakeWaiters = [] { throw std::runtime_error("wake"); };
    steps.stopSession = [] { throw std::runtime_error("stop"); };
    steps.awaitTasks = [] { throw std::runtime_error("join"); };
    steps.releaseSignals = [] { throw std::runtime_error("signals"); };
    steps.closeRemoteSession = [] { throw std::runtime_error("close"); };
    ShutdownCoordinator coordinator(flags_, std::move(steps), 1ms);

    EXPECT_TRUE(coordinator.runStopSequence());
    EXPECT_EQ(coordinator.failedSteps(), 5);
    EXPECT_TRUE(flags_.isCancelled());
    EXPECT_TRUE(flags_.isSessionClosed());
    EXPECT_EQ(coordinator.state(), ShutdownCoordinator::State::Stopped);
}

TEST_F(ShutdownCoordinatorTest, WaitForStopRequestTimesOutThenWakes) {
    ShutdownCoordinator coordinator(flags_, recordingSteps(), 1ms);
    EXPECT_FALSE(coordinator.waitForStopRequest(10ms));

    std::thread requester([&] {
        std::this_thread::sleep_for(20ms);
        coordinator.requestStop(StopReason::TaskExited);
    });
    EXPECT_TRUE(coordinator.waitForStopRequest(5s));
    requester.join();
}

TEST(StopReasonTest, ToString) {
    EXPECT_STREQ(stopReasonToString(StopReason::Interrupt), "interrupt");
    EXPECT_STREQ(stopReasonToString(StopReason::StreamEnded), "stream_ended");
    EXPECT_STREQ(stopReasonToString(StopReason::TaskExited), "task_exited");
    EXPECT_STREQ(stopReasonToString(StopReason::TaskFailure), "task_failure");
    EXPECT_STREQ(stopReasonToString(StopReason::Requested), "requested");
}

// Three sub-chunk frames buffered when the stop arrives: the pump's pre-stop flush
// must reach the session before stop(), and sessionClosed follows stop().
TEST(ShutdownFinalFlushTest, BufferedBytesAreSentBeforeSessionStop) {
    auto log = std::make_shared<fakes::EventLog>();
    fakes::FakeSession session(log);
    BoundedChannel channel(50);
    PipelineFlags flags;
    const auto frozen = ChunkPump::Clock::now();
    ChunkPump pump(channel, session, flags, 6400, 200ms, [frozen] { return frozen; });

    std::mutex doneMutex;
    std::condition_variable doneCv;
    bool pumpDone = false;
    std::thread pumpThread([&] {
        pump.run();
        {
            std::lock_guard<std::mutex> lock(doneMutex);
            pumpDone = true;
        }
        doneCv.notify_all();
    });

    for (int i = 0; i < 3; ++i) {
        channel.push(Frame(1000, static_cast<std::uint8_t>(i)));
    }
    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (pump.bufferedBytes() < 3000 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }
    ASSERT_EQ(pump.bufferedBytes(), 3000u);
    ASSERT_TRUE(session.sends().empty());

    bool closedAtStop = true;
    ShutdownCoordinator::Steps steps;
    steps.wakeWaiters = [&] { channel.wakeAll(); };
    steps.awaitSender = [&](std::chrono::milliseconds grace) {
        std::unique_lock<std::mutex> lock(doneMutex);
        return doneCv.wait_for(lock, grace, [&] { return pumpDone; });
    };
    steps.stopSession = [&] {
        closedAtStop = flags.isSessionClosed();
        session.stop();
    };
    steps.awaitTasks = [&] { pumpThread.join(); };
    steps.closeRemoteSession = [&] { log->add("close"); };

    ShutdownCoordinator coordinator(flags, std::move(steps), 400ms);
    coordinator.requestStop(StopReason::Interrupt);
    coordinator.runStopSequence();

    const auto sends = session.sends();
    ASSERT_EQ(sends.size(), 1u);
    EXPECT_EQ(sends[0].size(), 3000u);
    EXPECT_EQ(pump.stats().finalFlushes, 1u);
    EXPECT_FALSE(closedAtStop);
    EXPECT_TRUE(flags.isSessionClosed());
    EXPECT_EQ(session.sendsAfterStop(), 0);

    const int sendIndex = log->indexOf("send:3000");
    const int stopIndex = log->indexOf("stop");
    const int closeIndex = log->indexOf("close");
    ASSERT_GE(sendIndex, 0);
    EXPECT_LT(sendIndex, stopIndex);
    EXPECT_LT(stopIndex, closeIndex);
}
