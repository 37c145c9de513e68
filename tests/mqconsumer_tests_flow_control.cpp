#include <mqconsumer_tests_utils.h>
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <atomic>
#include <mutex>
#include <vector>
#include <thread>

namespace Rocket {
namespace mqconsumer {
namespace tests {

using ::testing::_;
using ::testing::AnyNumber;
using ::testing::HasSubstr;

using LogMock = ::testing::MockFunction<void(cppkafka::LogLevel, const std::string&, const std::string&)>;
using FlowControlMock = ::testing::MockFunction<void(const MessageQueue&, FlowControlStatus, std::chrono::milliseconds)>;
using ThresholdMock = ::testing::MockFunction<void(const std::string&, size_t, const QueueThresholds&)>;

const int64_t MiB = 1024 * 1024;
const std::string topic = "topic";

class FlowControlFixture : public ::testing::Test
{
public:
    FlowControlFixture() :
        _options(makeValidOptions({withPullThresholdForTopic(Threshold::limited(1000)),
                                   withConsumeConcurrentlyMaxSpan(100),
                                   withLogCallback(_log.AsStdFunction()),
                                   withFlowControlCallback(_flowControl.AsStdFunction()),
                                   withThresholdCallback(_threshold.AsStdFunction())})),
        _control(_options)
    {
        EXPECT_CALL(_log, Call(_, _, _)).Times(AnyNumber());
        EXPECT_CALL(_flowControl, Call(_, _, _)).Times(AnyNumber());
    }
protected:
    LogMock             _log;
    FlowControlMock     _flowControl;
    ThresholdMock       _threshold;
    ConsumerOptions     _options;
    FlowControl         _control;
};

//=========================================================================
//                          THRESHOLDS
//=========================================================================
TEST_F(FlowControlFixture, UnknownTopicUsesConfigured)
{
    ASSERT_EQ((QueueThresholds{1000, 100 * MiB}), _control.getQueueThresholds(topic));
}

TEST_F(FlowControlFixture, UpdateAssignmentDerivesThresholds)
{
    EXPECT_CALL(_threshold, Call(topic, 4u, QueueThresholds{250, 100 * MiB})).Times(1);
    ASSERT_EQ((QueueThresholds{250, 100 * MiB}), _control.updateAssignment(topic, 4));
    ASSERT_EQ((QueueThresholds{250, 100 * MiB}), _control.getQueueThresholds(topic));
    // other topics are not affected
    ASSERT_EQ((QueueThresholds{1000, 100 * MiB}), _control.getQueueThresholds("other"));
}

TEST_F(FlowControlFixture, UpdateAssignmentIsIdempotent)
{
    EXPECT_CALL(_threshold, Call(topic, 4u, _)).Times(1);
    _control.updateAssignment(topic, 4);
    _control.updateAssignment(topic, 4);
    ASSERT_EQ(250, _control.getQueueThresholds(topic)._count);
}

TEST_F(FlowControlFixture, RebalanceRecomputes)
{
    {
        ::testing::InSequence seq;
        EXPECT_CALL(_threshold, Call(topic, 4u, QueueThresholds{250, 100 * MiB}));
        EXPECT_CALL(_threshold, Call(topic, 2u, QueueThresholds{500, 100 * MiB}));
    }
    _control.updateAssignment(topic, 4);
    _control.updateAssignment(topic, 2);
    ASSERT_EQ(500, _control.getQueueThresholds(topic)._count);
}

TEST_F(FlowControlFixture, NoQueuesKeepsPreviousThresholds)
{
    EXPECT_CALL(_threshold, Call(topic, 4u, _)).Times(1);
    _control.updateAssignment(topic, 4);
    ASSERT_EQ((QueueThresholds{250, 100 * MiB}), _control.updateAssignment(topic, 0));
}

TEST_F(FlowControlFixture, RemoveTopic)
{
    EXPECT_CALL(_threshold, Call(_, _, _)).Times(AnyNumber());
    _control.updateAssignment(topic, 4);
    _control.updateAssignment("other", 10);
    ASSERT_EQ(2u, _control.snapshot()->size());
    ASSERT_TRUE(_control.removeTopic(topic));
    ASSERT_FALSE(_control.removeTopic(topic));
    ASSERT_EQ(1u, _control.snapshot()->size());
    ASSERT_EQ(1000, _control.getQueueThresholds(topic)._count);
    ASSERT_EQ(100, _control.getQueueThresholds("other")._count);
}

TEST(FlowControl, UnlimitedTopicThresholds)
{
    ThresholdMock threshold;
    EXPECT_CALL(threshold, Call(_, _, _)).Times(0);
    ConsumerOptions options = makeValidOptions({withPullThresholdForQueue(300),
                                                withThresholdCallback(threshold.AsStdFunction())});
    FlowControl control(options);
    ASSERT_EQ((QueueThresholds{300, 100 * MiB}), control.updateAssignment(topic, 4));
    ASSERT_EQ((QueueThresholds{300, 100 * MiB}), control.getQueueThresholds(topic));
}

TEST(FlowControl, ThresholdChangeIsLoggedAtDebugLevel)
{
    LogMock log;
    EXPECT_CALL(log, Call(_, _, _)).Times(AnyNumber());
    EXPECT_CALL(log, Call(cppkafka::LogLevel::LogDebug, "mqconsumer", HasSubstr("\"thresholdUpdate\""))).Times(1);
    ConsumerOptions options = makeValidOptions({withPullThresholdSizeForTopic(Threshold::limited(10 * MiB)),
                                                withLogLevel(cppkafka::LogLevel::LogDebug),
                                                withLogCallback(log.AsStdFunction())});
    FlowControl control(options);
    ASSERT_EQ((QueueThresholds{1000, 2 * MiB}), control.updateAssignment(topic, 5));
}

//=========================================================================
//                          EVALUATE
//=========================================================================
TEST_F(FlowControlFixture, Proceed)
{
    EXPECT_CALL(_flowControl, Call(_, _, _)).Times(0);
    FlowControlDecision decision = _control.evaluate(makeQueue(topic, 0), {1000, 100 * MiB, 100});
    ASSERT_FALSE(decision.isThrottled());
    ASSERT_EQ(FlowControlStatus::Proceed, decision._status);
    ASSERT_EQ(0u, _control.getFlowControlTimes(FlowControlStatus::CountExceeded));
}

TEST_F(FlowControlFixture, CountExceeded)
{
    MessageQueue queue = makeQueue(topic, 1);
    EXPECT_CALL(_flowControl, Call(queue, FlowControlStatus::CountExceeded, std::chrono::milliseconds(1000))).Times(1);
    FlowControlDecision decision = _control.evaluate(queue, {1001, 0, 0});
    ASSERT_TRUE(decision.isThrottled());
    ASSERT_EQ(FlowControlStatus::CountExceeded, decision._status);
    ASSERT_EQ(std::chrono::milliseconds(1000), decision._suspendTime);
    ASSERT_EQ(1u, _control.getFlowControlTimes(FlowControlStatus::CountExceeded));
}

TEST_F(FlowControlFixture, DerivedThresholdIsEnforced)
{
    EXPECT_CALL(_threshold, Call(_, _, _)).Times(AnyNumber());
    _control.updateAssignment(topic, 4);
    ASSERT_EQ(FlowControlStatus::CountExceeded, _control.evaluate(makeQueue(topic, 0), {251, 0, 0})._status);
    ASSERT_EQ(FlowControlStatus::Proceed, _control.evaluate(makeQueue(topic, 0), {250, 0, 0})._status);
}

TEST_F(FlowControlFixture, SizeExceeded)
{
    FlowControlDecision decision = _control.evaluate(makeQueue(topic, 0), {10, 100 * MiB + 1, 0});
    ASSERT_EQ(FlowControlStatus::SizeExceeded, decision._status);
    ASSERT_EQ(1u, _control.getFlowControlTimes(FlowControlStatus::SizeExceeded));
}

TEST_F(FlowControlFixture, SpanExceeded)
{
    FlowControlDecision decision = _control.evaluate(makeQueue(topic, 0), {10, 10, 101});
    ASSERT_EQ(FlowControlStatus::SpanExceeded, decision._status);
    ASSERT_EQ(1u, _control.getFlowControlTimes(FlowControlStatus::SpanExceeded));
}

TEST(FlowControl, SpanIgnoredWhenOrderly)
{
    ConsumerOptions options = makeValidOptions({withConsumeOrderly(true), withConsumeConcurrentlyMaxSpan(100)});
    FlowControl control(options);
    ASSERT_EQ(FlowControlStatus::Proceed, control.evaluate(makeQueue(topic, 0), {10, 10, 5000})._status);
}

TEST(FlowControl, WarningLoggedEveryThousandThrottles)
{
    LogMock log;
    EXPECT_CALL(log, Call(_, _, _)).Times(AnyNumber());
    EXPECT_CALL(log, Call(cppkafka::LogLevel::LogWarning, "mqconsumer", HasSubstr("\"flowControl\""))).Times(2);
    ConsumerOptions options = makeValidOptions({withLogCallback(log.AsStdFunction())});
    FlowControl control(options);
    for (size_t i = 0; i < FlowControl::LogEveryNThrottles + 1; ++i) {
        control.evaluate(makeQueue(topic, 0), {5000, 0, 0});
    }
    ASSERT_EQ(FlowControl::LogEveryNThrottles + 1, control.getFlowControlTimes(FlowControlStatus::CountExceeded));
    ASSERT_EQ(0u, control.getFlowControlTimes(FlowControlStatus::SizeExceeded));
}

TEST(FlowControl, ConcurrentRebalanceAndPull)
{
    ConsumerOptions options = makeValidOptions({withPullThresholdForTopic(Threshold::limited(1200))});
    FlowControl control(options);
    std::atomic_bool done{false};
    std::atomic_bool invalid{false};
    std::thread reader([&] {
        while (!done) {
            int64_t count = control.getQueueThresholds(topic)._count;
            // only values derived for 1..6 queues or the configured value may be observed
            if ((count != 1000) && ((1200 % count) != 0 || (1200 / count) > 6)) {
                invalid = true;
            }
        }
    });
    for (int i = 0; i < 1000; ++i) {
        control.updateAssignment(topic, (i % 6) + 1);
    }
    done = true;
    reader.join();
    ASSERT_FALSE(invalid);
}

TEST(FlowControl, ConcurrentRebalanceReportsInPublishOrder)
{
    std::mutex reportedMutex;
    std::vector<QueueThresholds> reported;
    ConsumerOptions options = makeValidOptions({withPullThresholdForTopic(Threshold::limited(1200)),
        withThresholdCallback([&](const std::string&, size_t, const QueueThresholds& thresholds) {
            std::lock_guard<std::mutex> lock(reportedMutex);
            reported.push_back(thresholds);
        })});
    FlowControl control(options);
    auto rebalance = [&](size_t numQueues) {
        for (int i = 0; i < 500; ++i) {
            control.updateAssignment(topic, (i % 2) ? numQueues : numQueues + 1);
        }
    };
    std::thread first(rebalance, 2);
    std::thread second(rebalance, 5);
    first.join();
    second.join();
    ASSERT_FALSE(reported.empty());
    // every report describes a change from the one before
    for (size_t i = 1; i < reported.size(); ++i) {
        ASSERT_NE(reported[i - 1], reported[i]);
    }
    ASSERT_EQ(reported.back(), control.getQueueThresholds(topic));
}

}}}
