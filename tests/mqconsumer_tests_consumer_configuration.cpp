#include <mqconsumer_tests_utils.h>
#include <gtest/gtest.h>
#include <gmock/gmock.h>

namespace Rocket {
namespace mqconsumer {
namespace tests {

using Options = ConsumerConfiguration::Options;

TEST(ConsumerConfiguration, UnknownOption)
{
    ASSERT_THROW(ConsumerConfiguration config({{"consumer.unknown.option", "bad"}}), InvalidOptionException);
}

TEST(ConsumerConfiguration, EmptyValue)
{
    ASSERT_THROW(ConsumerConfiguration config({{Options::groupName, "  "}}), InvalidOptionException);
}

TEST(ConsumerConfiguration, KeysAreCaseInsensitiveAndTrimmed)
{
    ConsumerConfiguration config({{" Client.Group.Name ", " my-group "}});
    ASSERT_TRUE(config.getOption(Options::groupName));
    ASSERT_EQ("my-group", config.getOption(Options::groupName)->get_value());
}

TEST(ConsumerConfiguration, DuplicateKeysAreRejected)
{
    ASSERT_THROW(ConsumerConfiguration config({{Options::groupName, "first"},
                                               {" client.group.NAME", "second"}}), InvalidOptionException);
    try {
        ConsumerConfiguration config({{Options::retryTimes, "1"}, {Options::retryTimes, "2"}});
        FAIL();
    }
    catch (const InvalidOptionException& ex) {
        ASSERT_STREQ(Options::retryTimes, ex.option());
    }
}

TEST(ConsumerConfiguration, ErrorDescriptionEscapesControlCharacters)
{
    try {
        ConsumerConfiguration config({{"consumer.bad\r\x01", "value"}});
        FAIL();
    }
    catch (const InvalidOptionException& ex) {
        std::string what = ex.what();
        ASSERT_THAT(what, ::testing::HasSubstr("\"option\":\"consumer.bad\\r\\u0001\""));
        for (char c : what) {
            ASSERT_GE(static_cast<unsigned char>(c), 0x20);
        }
    }
}

TEST(ConsumerConfiguration, NameServerAddrs)
{
    testConsumerOption(Options::nameServerAddrs, {{";,", true}, {"127.0.0.1:9876", false}, {"a:1;b:2,c:3", false}});
}

TEST(ConsumerConfiguration, Booleans)
{
    for (const char* option : {Options::aclEnabled, Options::vipChannelEnabled,
                               Options::postSubscriptionWhenPull, Options::consumeOrderly}) {
        testConsumerOption(option, {{"bad", true}, {"1", true}, {"true", false}, {"FALSE", false}});
    }
}

TEST(ConsumerConfiguration, RetryTimes)
{
    testConsumerOption(Options::retryTimes, {{"-1", true}, {"abc", true}, {"0", false}, {"5", false}});
}

TEST(ConsumerConfiguration, ConsumeTimestamp)
{
    testConsumerOption(Options::consumeTimestamp, {{"2024", true}, {"20241301000000", true}, {"20230229120000", true},
                                                   {"20240229120000", false}, {"20241019235959", false}});
}

TEST(ConsumerConfiguration, Timeouts)
{
    for (const char* option : {Options::pullTimeoutMs, Options::consumeTimeoutMs}) {
        testConsumerOption(option, {{"0", true}, {"10ms", true}, {"1", false}, {"60000", false}});
    }
    testConsumerOption(Options::suspendCurrentQueueTimeMs, {{"-1", true}, {"0", false}, {"1000", false}});
    testConsumerOption(Options::pullIntervalMs, {{"-1", true}, {"65536", true}, {"0", false}, {"65535", false}});
}

TEST(ConsumerConfiguration, QueueThresholds)
{
    testConsumerOption(Options::consumeConcurrentlyMaxSpan, {{"0", true}, {"65536", true}, {"1", false}, {"65535", false}});
    testConsumerOption(Options::pullThresholdForQueue, {{"0", true}, {"65536", true}, {"1", false}, {"1000", false}});
    testConsumerOption(Options::pullThresholdSizeForQueue, {{"0", true}, {"1073741825", true},
                                                            {"1", false}, {"1073741824", false}});
}

TEST(ConsumerConfiguration, TopicThresholds)
{
    testConsumerOption(Options::pullThresholdForTopic, {{"-2", true}, {"0", true}, {"6553501", true},
                                                        {"-1", false}, {"1", false}, {"6553500", false}});
    testConsumerOption(Options::pullThresholdSizeForTopic, {{"-2", true}, {"0", true}, {"107374182401", true},
                                                            {"-1", false}, {"107374182400", false}});
}

TEST(ConsumerConfiguration, BatchSizes)
{
    for (const char* option : {Options::consumeMessageBatchMaxSize, Options::pullBatchSize}) {
        testConsumerOption(option, {{"0", true}, {"1025", true}, {"1", false}, {"1024", false}});
    }
}

TEST(ConsumerConfiguration, MaxReconsumeTimes)
{
    testConsumerOption(Options::maxReconsumeTimes, {{"-2", true}, {"-1", false}, {"0", false}, {"16", false}});
}

TEST(ConsumerConfiguration, Enumerations)
{
    testConsumerOption(Options::consumerModel, {{"bad", true}, {"unset", true},
                                                {"clustering", false}, {"BROADCASTING", false}});
    testConsumerOption(Options::consumeFromWhere, {{"bad", true}, {"last", false}, {"first", false}, {"timestamp", false}});
    testConsumerOption(Options::allocateStrategy, {{"config", true}, {"averagely", false}, {"averagely.circle", false}});
    testConsumerOption(Options::logLevel, {{"bad", true}, {"emergency", false}, {"warning", false}, {"debug", false}});
}

TEST(ConsumerConfiguration, AppliedThroughOptionFunctions)
{
    ConsumerConfiguration config({{Options::groupName, "string-group"},
                                  {Options::nameServerAddrs, "10.0.0.1:9876; 10.0.0.2:9876"},
                                  {Options::consumerModel, "broadcasting"},
                                  {Options::consumeFromWhere, "timestamp"},
                                  {Options::consumeTimestamp, "20240101000000"},
                                  {Options::pullThresholdForTopic, "5000"},
                                  {Options::pullThresholdSizeForTopic, "-1"},
                                  {Options::pullBatchSize, "64"},
                                  {Options::maxReconsumeTimes, "-1"},
                                  {Options::consumeTimeoutMs, "30000"},
                                  {Options::allocateStrategy, "averagely.circle"},
                                  {Options::logLevel, "error"}});
    ConsumerOptions options = makeConsumerOptions({withConfiguration(config)});
    ASSERT_EQ("string-group", options.getGroupName());
    ASSERT_EQ(std::vector<std::string>({"10.0.0.1:9876", "10.0.0.2:9876"}), options.getNameServerAddrs());
    ASSERT_EQ(ConsumerModel::Broadcasting, options.getConsumerModel());
    ASSERT_EQ(ConsumeFromWhere::Timestamp, options.getConsumeFromWhere());
    ASSERT_EQ("20240101000000", options.getConsumeTimestamp());
    ASSERT_EQ(5000, options.getPullThresholdForTopic().value());
    ASSERT_TRUE(options.getPullThresholdSizeForTopic().isUnlimited());
    ASSERT_EQ(64, options.getPullBatchSize());
    ASSERT_EQ(16, options.getMaxReconsumeTimes());
    ASSERT_EQ(std::chrono::seconds(30), options.getConsumeTimeout());
    ASSERT_STREQ("averagely.circle", options.getAllocateStrategy()->name());
    ASSERT_EQ(cppkafka::LogLevel::LogErr, options.getLogLevel());
    // untouched options keep their defaults
    ASSERT_EQ(1000, options.getPullThresholdForQueue());
}

TEST(ConsumerConfiguration, LaterOptionsOverrideConfiguration)
{
    ConsumerConfiguration config({{Options::groupName, "string-group"},
                                  {Options::pullBatchSize, "64"}});
    ConsumerOptions options = makeValidOptions({withConfiguration(config), withPullBatchSize(8)});
    ASSERT_EQ("string-group", options.getGroupName());
    ASSERT_EQ(8, options.getPullBatchSize());
}

}}}
