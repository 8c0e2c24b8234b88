#include "runtime/CommandQueue.h"
#include <atomic>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <memory>
#include <set>
#include <thread>

#include "common/TestUtils.h"
#include "mocks/RecordingCommandProcessor.h"

namespace SPC {

using SPC::Test::RecordingCommandProcessor;
using ::testing::Field;
using ::testing::InSequence;

class MockCommandProcessor : public ICommandProcessor {
public:
    MOCK_METHOD(void, process, (ControllerCommand & command), (override));
};

class CommandQueueTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_ = std::make_shared<RecordingCommandProcessor::Log>();
    }

    std::unique_ptr<CommandQueue> makeQueue(std::function<void(ControllerCommand &)> action = {}) {
        return std::make_unique<CommandQueue>("test_queue",
                                              std::make_unique<RecordingCommandProcessor>(log_, std::move(action)));
    }

    std::shared_ptr<RecordingCommandProcessor::Log> log_;
};

TEST_F(CommandQueueTest, ProcessesCommandsInSubmissionOrderOnOneThread) {
    auto queue = makeQueue();

    for (int i = 0; i < 20; ++i) {
        ASSERT_TRUE(queue->trySubmit(ControllerCommand::createRecomputeAndNotify("s" + std::to_string(i))));
    }
    ASSERT_TRUE(queue->waitForIdle(SPC::Test::Utils::scaledWait()));

    auto records = log_->snapshot();
    ASSERT_EQ(records.size(), 20u);
    std::set<std::thread::id> threads;
    for (size_t i = 0; i < records.size(); ++i) {
        EXPECT_EQ(records[i].sessionId, "s" + std::to_string(i));
        EXPECT_EQ(records[i].sequenceNumber, i + 1);
        threads.insert(records[i].threadId);
    }
    EXPECT_EQ(threads.size(), 1u);
    EXPECT_NE(*threads.begin(), std::this_thread::get_id());
    EXPECT_EQ(queue->getLastAssignedSequence(), 20u);
}

TEST_F(CommandQueueTest, SubmissionDoesNotWaitForProcessing) {
    std::atomic<bool> release{false};
    auto queue = makeQueue([&release](ControllerCommand &) {
        while (!release.load()) {
            std::this_thread::sleep_for(SPC::Test::Utils::POLL_INTERVAL_MS);
        }
    });

    EXPECT_TRUE(queue->trySubmit(ControllerCommand::createRecomputeAndNotify("s")));
    EXPECT_TRUE(queue->trySubmit(ControllerCommand::createRecomputeAndNotify("s")));
    EXPECT_FALSE(queue->waitForIdle(SPC::Test::Utils::SHORT_WAIT_MS));
    EXPECT_GE(queue->getPendingCount(), 1u);

    release = true;
    EXPECT_TRUE(queue->waitForIdle(SPC::Test::Utils::scaledWait()));
    EXPECT_EQ(queue->getPendingCount(), 0u);
}

TEST_F(CommandQueueTest, ClosedQueueRejectsButDrainsBacklog) {
    std::atomic<bool> release{false};
    auto queue = makeQueue([&release](ControllerCommand &) {
        while (!release.load()) {
            std::this_thread::sleep_for(SPC::Test::Utils::POLL_INTERVAL_MS);
        }
    });

    ASSERT_TRUE(queue->trySubmit(ControllerCommand::createRecomputeAndNotify("s")));
    ASSERT_TRUE(queue->trySubmit(ControllerCommand::createRecomputeAndNotify("s")));
    queue->close();

    EXPECT_TRUE(queue->isClosed());
    EXPECT_FALSE(queue->trySubmit(ControllerCommand::createRecomputeAndNotify("s")));

    release = true;
    queue.reset();

    EXPECT_EQ(log_->snapshot().size(), 2u);
}

TEST_F(CommandQueueTest, RejectsNullCommand) {
    auto queue = makeQueue();
    EXPECT_FALSE(queue->trySubmit(nullptr));
}

TEST_F(CommandQueueTest, RequiresProcessor) {
    EXPECT_THROW(CommandQueue("no_processor", nullptr), std::invalid_argument);
}

TEST_F(CommandQueueTest, WorkerSurvivesThrowingProcessor) {
    auto queue = makeQueue([](ControllerCommand &command) {
        if (command.sessionId == "bad") {
            throw std::runtime_error("processor failure");
        }
    });

    ASSERT_TRUE(queue->trySubmit(ControllerCommand::createRecomputeAndNotify("bad")));
    ASSERT_TRUE(queue->trySubmit(ControllerCommand::createRecomputeAndNotify("good")));
    ASSERT_TRUE(queue->waitForIdle(SPC::Test::Utils::scaledWait()));

    auto records = log_->snapshot();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[1].sessionId, "good");
}

TEST_F(CommandQueueTest, DrainedAfterCloseAndIdle) {
    auto queue = makeQueue();
    EXPECT_FALSE(queue->isDrained());

    ASSERT_TRUE(queue->trySubmit(ControllerCommand::createRecomputeAndNotify("s")));
    queue->close();
    ASSERT_TRUE(queue->waitForIdle(SPC::Test::Utils::scaledWait()));
    EXPECT_TRUE(queue->isDrained());
}

TEST_F(CommandQueueTest, DispatchesEveryCommandToProcessor) {
    auto processor = std::make_unique<::testing::StrictMock<MockCommandProcessor>>();
    {
        InSequence sequence;
        EXPECT_CALL(*processor, process(Field(&ControllerCommand::type, ControllerCommand::Type::INITIALIZE)));
        EXPECT_CALL(*processor,
                    process(Field(&ControllerCommand::type, ControllerCommand::Type::RECEIVE_QUESTION_LIST)));
        EXPECT_CALL(*processor, process(Field(&ControllerCommand::type, ControllerCommand::Type::FINISH_SESSION)));
    }

    CommandQueue queue("mocked_queue", std::move(processor));
    ASSERT_TRUE(queue.trySubmit(ControllerCommand::createInitialize("s", nullptr, nullptr)));
    ASSERT_TRUE(queue.trySubmit(ControllerCommand::createReceiveQuestionList("s", {})));
    ASSERT_TRUE(queue.trySubmit(ControllerCommand::create(ControllerCommand::Type::FINISH_SESSION, "s")));
    EXPECT_TRUE(queue.waitForIdle(SPC::Test::Utils::scaledWait()));
}

TEST_F(CommandQueueTest, DestroyedFromOwnWorkerThreadDetaches) {
    std::atomic<bool> destroyed{false};
    auto holder = std::make_shared<std::shared_ptr<CommandQueue>>();

    auto releaseLastReference = [holder, &destroyed](ControllerCommand &) {
        holder->reset();
        destroyed = true;
    };
    auto queue = std::make_shared<CommandQueue>(
        "self_destroying_queue", std::make_unique<RecordingCommandProcessor>(log_, releaseLastReference));
    *holder = queue;

    ASSERT_TRUE(queue->trySubmit(ControllerCommand::createRecomputeAndNotify("s")));
    queue.reset();

    for (int i = 0; i < 200 && !destroyed.load(); ++i) {
        std::this_thread::sleep_for(SPC::Test::Utils::POLL_INTERVAL_MS);
    }
    EXPECT_TRUE(destroyed.load());
}

}  // namespace SPC
