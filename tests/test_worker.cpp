#include <gtest/gtest.h>
#include <traitforge/worker.hpp>
#include <thread>
#include "test_helpers.hpp"

using namespace traitforge;
using namespace test_utils;

namespace {

// Slows every decode so a run lasts long enough to interrupt
class SlowCodec : public FakeCodec {
public:
    Surface decode(const std::vector<std::uint8_t>& payload, std::uint32_t width, std::uint32_t height) override {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
        return FakeCodec::decode(payload, width, height);
    }
};

DeviceProfile small_device() {
    DeviceProfile device;
    device.cores = 2;
    device.memory_gb = 4.0;
    return device;
}

} // namespace

class ThreadWorkerTest : public ::testing::Test {
protected:
    void start(bool slow = false) {
        CodecFactory codecs = [slow]() -> std::unique_ptr<ImageCodec> {
            if (slow) return std::make_unique<SlowCodec>();
            return std::make_unique<FakeCodec>();
        };
        ControllerConfig config;
        config.solver.seed = 5;
        worker = std::make_unique<ThreadWorker>(log.sink(), codecs, config, small_device(), nullptr);
    }

    void TearDown() override {
        worker.reset();
    }

    static std::shared_ptr<const GenerationRequest> request(GenerationRequest r) {
        return std::make_shared<const GenerationRequest>(std::move(r));
    }

    MessageLog log;
    std::unique_ptr<ThreadWorker> worker;
};

TEST_F(ThreadWorkerTest, AnswersInitializeAndPing) {
    start();
    worker->post(InitializeMessage{});
    worker->post(PingMessage{42});

    ASSERT_TRUE(log.wait_until([](const auto& messages) {
        for (const auto& m : messages) {
            if (std::holds_alternative<PongMessage>(m)) return true;
        }
        return false;
    }));
    EXPECT_EQ(log.all<ReadyMessage>().size(), 1u);
    EXPECT_EQ(log.all<PongMessage>()[0].ping_id, 42u);
}

TEST_F(ThreadWorkerTest, RunsTaskToCompletion) {
    start();
    worker->post(StartMessage{11, request(two_by_two_request(4))});

    ASSERT_TRUE(log.wait_for_terminal());
    auto complete = log.all<CompleteMessage>();
    ASSERT_EQ(complete.size(), 1u);
    EXPECT_EQ(complete[0].task, 11u);
    EXPECT_EQ(complete[0].generated, 4u);
    EXPECT_EQ(log.artifacts().size(), 4u);

    for (const auto& m : log.snapshot()) {
        EXPECT_EQ(task_of(m), 11u) << message_name(m);
    }
}

// Starts posted back to back run one after another
TEST_F(ThreadWorkerTest, QueuedStartsRunInOrder) {
    start();
    worker->post(StartMessage{1, request(two_by_two_request(2))});
    worker->post(StartMessage{2, request(wide_request(3))});

    ASSERT_TRUE(log.wait_for_terminal(2));
    auto complete = log.all<CompleteMessage>();
    ASSERT_EQ(complete.size(), 2u);
    EXPECT_EQ(complete[0].task, 1u);
    EXPECT_EQ(complete[1].task, 2u);
}

// Pings are answered and cancels observed while a run is in progress
TEST_F(ThreadWorkerTest, CancelAndPingDuringRun) {
    start(true);
    worker->post(StartMessage{3, request(wide_request(1000))});
    ASSERT_TRUE(log.wait_until([](const auto& messages) {
        for (const auto& m : messages) {
            if (std::holds_alternative<ArtifactBatchMessage>(m)) return true;
        }
        return false;
    }));

    worker->post(PingMessage{9});
    worker->post(CancelMessage{3});

    ASSERT_TRUE(log.wait_for_terminal());
    auto cancelled = log.all<CancelledMessage>();
    ASSERT_EQ(cancelled.size(), 1u);
    EXPECT_EQ(cancelled[0].task, 3u);
    EXPECT_LT(cancelled[0].generated, 1000u);
    EXPECT_EQ(log.all<PongMessage>().size(), 1u);
}

// A start still waiting behind a run is dropped on cancel
TEST_F(ThreadWorkerTest, CancelHeldStart) {
    start(true);
    worker->post(StartMessage{4, request(wide_request(1000))});
    worker->post(StartMessage{5, request(wide_request(10))});
    worker->post(CancelMessage{5});

    ASSERT_TRUE(log.wait_for_terminal());
    auto first = log.all<CancelledMessage>();
    ASSERT_EQ(first.size(), 1u);
    EXPECT_EQ(first[0].task, 5u);
    EXPECT_EQ(first[0].generated, 0u);
    EXPECT_EQ(first[0].total, 10u);

    worker->post(CancelMessage{4});
    ASSERT_TRUE(log.wait_for_terminal(2));
    EXPECT_TRUE(log.all<CompleteMessage>().empty());
}

// After terminate nothing more reaches the sink
TEST_F(ThreadWorkerTest, TerminateSilencesWorker) {
    start(true);
    worker->post(StartMessage{6, request(wide_request(1000))});
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    worker->terminate();

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    auto seen = log.snapshot().size();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(log.snapshot().size(), seen);
    EXPECT_EQ(log.terminal_count(), 0u);
}

TEST_F(ThreadWorkerTest, MissingCodecFaults) {
    worker = std::make_unique<ThreadWorker>(log.sink(), [] { return std::unique_ptr<ImageCodec>(); },
                                            ControllerConfig{}, small_device(), nullptr);
    ASSERT_TRUE(log.wait_until([](const auto& messages) { return !messages.empty(); }));
    EXPECT_EQ(log.all<WorkerFaultMessage>().size(), 1u);
}

TEST(ThreadWorkerFactoryTest, CreatesWorkers) {
    MessageLog log;
    auto factory = thread_worker_factory([] { return std::make_unique<FakeCodec>(); },
                                         ControllerConfig{}, small_device(), nullptr);
    auto worker = factory(0, log.sink());
    ASSERT_NE(worker, nullptr);
    worker->post(InitializeMessage{});
    EXPECT_TRUE(log.wait_until([](const auto& messages) { return !messages.empty(); }));
}
