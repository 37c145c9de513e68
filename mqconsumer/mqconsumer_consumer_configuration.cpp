/*
** Copyright 2026 The mqconsumer Authors
**
** Licensed under the Apache License, Version 2.0 (the "License");
** you may not use this file except in compliance with the License.
** You may obtain a copy of the License at
**
**     http://www.apache.org/licenses/LICENSE-2.0
**
** Unless required by applicable law or agreed to in writing, software
** distributed under the License is distributed on an "AS IS" BASIS,
** WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
** See the License for the specific language governing permissions and
** limitations under the License.
*/
#include <mqconsumer/mqconsumer_consumer_configuration.h>
#include <mqconsumer/mqconsumer_consumer_options_builder.h>
#include <mqconsumer/mqconsumer_exception.h>
#include <mqconsumer/mqconsumer_option.h>
#include <chrono>

namespace Rocket {
namespace mqconsumer {

//========================================================================
//                       CONSUMER CONFIGURATION
//========================================================================
const Configuration::OptionMap ConsumerConfiguration::s_options = {
    {Options::groupName,
     [](const cppkafka::ConfigurationOption* option, void* value)->bool{
        if (!option) return false;
        if (value) *reinterpret_cast<std::string*>(value) = option->get_value();
        return true;
     }},
    {Options::nameServerAddrs,
     [](const cppkafka::ConfigurationOption* option, void* value)->bool{
        if (!option) return false;
        std::vector<std::string> temp = Configuration::extractListValue(Options::nameServerAddrs, *option);
        if (value) *reinterpret_cast<std::vector<std::string>*>(value) = std::move(temp);
        return true;
     }},
    {Options::instanceName,
     [](const cppkafka::ConfigurationOption* option, void* value)->bool{
        if (!option) return false;
        if (value) *reinterpret_cast<std::string*>(value) = option->get_value();
        return true;
     }},
    {Options::nameSpace,
     [](const cppkafka::ConfigurationOption* option, void* value)->bool{
        if (!option) return false;
        if (value) *reinterpret_cast<std::string*>(value) = option->get_value();
        return true;
     }},
    {Options::aclEnabled,
     [](const cppkafka::ConfigurationOption* option, void* value)->bool{
        if (!option) return false;
        bool temp = Configuration::extractBooleanValue(Options::aclEnabled, *option);
        if (value) *reinterpret_cast<bool*>(value) = temp;
        return true;
     }},
    {Options::vipChannelEnabled,
     [](const cppkafka::ConfigurationOption* option, void* value)->bool{
        if (!option) return false;
        bool temp = Configuration::extractBooleanValue(Options::vipChannelEnabled, *option);
        if (value) *reinterpret_cast<bool*>(value) = temp;
        return true;
     }},
    {Options::retryTimes,
     [](const cppkafka::ConfigurationOption* option, void* value)->bool{
        if (!option) return false;
        int64_t temp = Configuration::extractCounterValue(Options::retryTimes, *option, 0,
                                                          std::numeric_limits<int>::max());
        if (value) *reinterpret_cast<int*>(value) = temp;
        return true;
     }},
    {Options::consumeTimestamp,
     [](const cppkafka::ConfigurationOption* option, void* value)->bool{
        if (!option) return false;
        if (!isValidConsumeTimestamp(option->get_value())) {
            throw InvalidOptionException(Options::consumeTimestamp, "Expected format is 'YYYYMMDDHHmmss'");
        }
        if (value) *reinterpret_cast<std::string*>(value) = option->get_value();
        return true;
     }},
    {Options::pullTimeoutMs,
     [](const cppkafka::ConfigurationOption* option, void* value)->bool{
        if (!option) return false;
        std::chrono::milliseconds temp{Configuration::extractCounterValue(Options::pullTimeoutMs, *option, 1)};
        if (value) *reinterpret_cast<std::chrono::milliseconds*>(value) = temp;
        return true;
     }},
    {Options::consumeConcurrentlyMaxSpan,
     [](const cppkafka::ConfigurationOption* option, void* value)->bool{
        if (!option) return false;
        int64_t temp = Configuration::extractCounterValue(Options::consumeConcurrentlyMaxSpan, *option, 1,
                                                          Limits::maxConsumeConcurrentlyMaxSpan);
        if (value) *reinterpret_cast<int*>(value) = temp;
        return true;
     }},
    {Options::pullThresholdForQueue,
     [](const cppkafka::ConfigurationOption* option, void* value)->bool{
        if (!option) return false;
        int64_t temp = Configuration::extractCounterValue(Options::pullThresholdForQueue, *option, 1,
                                                          Limits::maxPullThresholdForQueue);
        if (value) *reinterpret_cast<int64_t*>(value) = temp;
        return true;
     }},
    {Options::pullThresholdSizeForQueue,
     [](const cppkafka::ConfigurationOption* option, void* value)->bool{
        if (!option) return false;
        int64_t temp = Configuration::extractCounterValue(Options::pullThresholdSizeForQueue, *option, 1,
                                                          Limits::maxPullThresholdSizeForQueue);
        if (value) *reinterpret_cast<int64_t*>(value) = temp;
        return true;
     }},
    {Options::pullThresholdForTopic,
     [](const cppkafka::ConfigurationOption* option, void* value)->bool{
        if (!option) return false;
        int64_t temp = Configuration::extractCounterValue(Options::pullThresholdForTopic, *option,
                                                          EnumValue(SizeLimits::Unlimited),
                                                          Limits::maxPullThresholdForTopic);
        if (temp == 0) {
            throw InvalidOptionException(Options::pullThresholdForTopic, "Use -1 for unlimited");
        }
        if (value) *reinterpret_cast<Threshold*>(value) = Threshold::fromLegacy(temp);
        return true;
     }},
    {Options::pullThresholdSizeForTopic,
     [](const cppkafka::ConfigurationOption* option, void* value)->bool{
        if (!option) return false;
        int64_t temp = Configuration::extractCounterValue(Options::pullThresholdSizeForTopic, *option,
                                                          EnumValue(SizeLimits::Unlimited),
                                                          Limits::maxPullThresholdSizeForTopic);
        if (temp == 0) {
            throw InvalidOptionException(Options::pullThresholdSizeForTopic, "Use -1 for unlimited");
        }
        if (value) *reinterpret_cast<Threshold*>(value) = Threshold::fromLegacy(temp);
        return true;
     }},
    {Options::pullIntervalMs,
     [](const cppkafka::ConfigurationOption* option, void* value)->bool{
        if (!option) return false;
        std::chrono::milliseconds temp{Configuration::extractCounterValue(Options::pullIntervalMs, *option, 0,
                                                                          Limits::maxPullIntervalMs)};
        if (value) *reinterpret_cast<std::chrono::milliseconds*>(value) = temp;
        return true;
     }},
    {Options::consumeMessageBatchMaxSize,
     [](const cppkafka::ConfigurationOption* option, void* value)->bool{
        if (!option) return false;
        int64_t temp = Configuration::extractCounterValue(Options::consumeMessageBatchMaxSize, *option, 1,
                                                          Limits::maxConsumeMessageBatchMaxSize);
        if (value) *reinterpret_cast<int*>(value) = temp;
        return true;
     }},
    {Options::pullBatchSize,
     [](const cppkafka::ConfigurationOption* option, void* value)->bool{
        if (!option) return false;
        int64_t temp = Configuration::extractCounterValue(Options::pullBatchSize, *option, 1,
                                                          Limits::maxPullBatchSize);
        if (value) *reinterpret_cast<int32_t*>(value) = temp;
        return true;
     }},
    {Options::postSubscriptionWhenPull,
     [](const cppkafka::ConfigurationOption* option, void* value)->bool{
        if (!option) return false;
        bool temp = Configuration::extractBooleanValue(Options::postSubscriptionWhenPull, *option);
        if (value) *reinterpret_cast<bool*>(value) = temp;
        return true;
     }},
    {Options::maxReconsumeTimes,
     [](const cppkafka::ConfigurationOption* option, void* value)->bool{
        if (!option) return false;
        int64_t temp = Configuration::extractCounterValue(Options::maxReconsumeTimes, *option,
                                                          EnumValue(ReconsumeLimits::Default),
                                                          std::numeric_limits<int>::max());
        if (value) *reinterpret_cast<int*>(value) = temp;
        return true;
     }},
    {Options::suspendCurrentQueueTimeMs,
     [](const cppkafka::ConfigurationOption* option, void* value)->bool{
        if (!option) return false;
        std::chrono::milliseconds temp{Configuration::extractCounterValue(Options::suspendCurrentQueueTimeMs, *option)};
        if (value) *reinterpret_cast<std::chrono::milliseconds*>(value) = temp;
        return true;
     }},
    {Options::consumeTimeoutMs,
     [](const cppkafka::ConfigurationOption* option, void* value)->bool{
        if (!option) return false;
        std::chrono::milliseconds temp{Configuration::extractCounterValue(Options::consumeTimeoutMs, *option, 1)};
        if (value) *reinterpret_cast<std::chrono::milliseconds*>(value) = temp;
        return true;
     }},
    {Options::consumerModel,
     [](const cppkafka::ConfigurationOption* option, void* value)->bool{
        if (!option) return false;
        ConsumerModel temp;
        if (StringEqualCompare()(option->get_value(), "clustering")) {
            temp = ConsumerModel::Clustering;
        }
        else if (StringEqualCompare()(option->get_value(), "broadcasting")) {
            temp = ConsumerModel::Broadcasting;
        }
        else {
            throw InvalidOptionException(Options::consumerModel, option->get_value());
        }
        if (value) *reinterpret_cast<ConsumerModel*>(value) = temp;
        return true;
     }},
    {Options::consumeFromWhere,
     [](const cppkafka::ConfigurationOption* option, void* value)->bool{
        if (!option) return false;
        ConsumeFromWhere temp;
        if (StringEqualCompare()(option->get_value(), "last")) {
            temp = ConsumeFromWhere::LastOffset;
        }
        else if (StringEqualCompare()(option->get_value(), "first")) {
            temp = ConsumeFromWhere::FirstOffset;
        }
        else if (StringEqualCompare()(option->get_value(), "timestamp")) {
            temp = ConsumeFromWhere::Timestamp;
        }
        else {
            throw InvalidOptionException(Options::consumeFromWhere, option->get_value());
        }
        if (value) *reinterpret_cast<ConsumeFromWhere*>(value) = temp;
        return true;
     }},
    {Options::consumeOrderly,
     [](const cppkafka::ConfigurationOption* option, void* value)->bool{
        if (!option) return false;
        bool temp = Configuration::extractBooleanValue(Options::consumeOrderly, *option);
        if (value) *reinterpret_cast<bool*>(value) = temp;
        return true;
     }},
    {Options::allocateStrategy,
     [](const cppkafka::ConfigurationOption* option, void* value)->bool{
        if (!option) return false;
        AllocateStrategy::Ptr temp;
        if (StringEqualCompare()(option->get_value(), "averagely")) {
            temp = allocateByAveragely();
        }
        else if (StringEqualCompare()(option->get_value(), "averagely.circle")) {
            temp = allocateByAveragelyCircle();
        }
        else {
            throw InvalidOptionException(Options::allocateStrategy, option->get_value());
        }
        if (value) *reinterpret_cast<AllocateStrategy::Ptr*>(value) = std::move(temp);
        return true;
     }},
    {Options::logLevel,
     [](const cppkafka::ConfigurationOption* option, void* value)->bool{
        if (!option) return false;
        cppkafka::LogLevel temp = Configuration::extractLogLevel(Options::logLevel, option->get_value());
        if (value) *reinterpret_cast<cppkafka::LogLevel*>(value) = temp;
        return true;
     }},
};

ConsumerConfiguration::ConsumerConfiguration(OptionList options) :
    Configuration(std::move(options))
{
    parseOptions(s_options, _options);
}

ConsumerConfiguration::ConsumerConfiguration(OptionInitList options) :
    Configuration(options)
{
    parseOptions(s_options, _options);
}

template <typename T>
bool ConsumerConfiguration::extract(const char* name, T& value) const
{
    return s_options.at(name)(getOption(name), &value);
}

void ConsumerConfiguration::applyTo(ConsumerOptionsBuilder& builder) const
{
    std::string text;
    bool flag{false};
    int number{0};
    int64_t count{0};
    std::chrono::milliseconds duration{0};
    Threshold threshold;
    
    if (extract(Options::groupName, text)) {
        builder(withGroupName(text));
    }
    std::vector<std::string> addresses;
    if (extract(Options::nameServerAddrs, addresses)) {
        builder(withNameServer(std::move(addresses)));
    }
    if (extract(Options::instanceName, text)) {
        builder(withInstance(text));
    }
    if (extract(Options::nameSpace, text)) {
        builder(withNamespace(text));
    }
    if (extract(Options::aclEnabled, flag)) {
        builder(withACL(flag));
    }
    if (extract(Options::vipChannelEnabled, flag)) {
        builder(withVIPChannel(flag));
    }
    if (extract(Options::retryTimes, number)) {
        builder(withRetry(number));
    }
    if (extract(Options::consumeTimestamp, text)) {
        builder(withConsumeTimestamp(text));
    }
    if (extract(Options::pullTimeoutMs, duration)) {
        builder(withPullTimeout(duration));
    }
    if (extract(Options::consumeConcurrentlyMaxSpan, number)) {
        builder(withConsumeConcurrentlyMaxSpan(number));
    }
    if (extract(Options::pullThresholdForQueue, count)) {
        builder(withPullThresholdForQueue(count));
    }
    if (extract(Options::pullThresholdSizeForQueue, count)) {
        builder(withPullThresholdSizeForQueue(count));
    }
    if (extract(Options::pullThresholdForTopic, threshold)) {
        builder(withPullThresholdForTopic(threshold));
    }
    if (extract(Options::pullThresholdSizeForTopic, threshold)) {
        builder(withPullThresholdSizeForTopic(threshold));
    }
    if (extract(Options::pullIntervalMs, duration)) {
        builder(withPullInterval(duration));
    }
    if (extract(Options::consumeMessageBatchMaxSize, number)) {
        builder(withConsumeMessageBatchMaxSize(number));
    }
    int32_t batchSize{0};
    if (extract(Options::pullBatchSize, batchSize)) {
        builder(withPullBatchSize(batchSize));
    }
    if (extract(Options::postSubscriptionWhenPull, flag)) {
        builder(withPostSubscriptionWhenPull(flag));
    }
    if (extract(Options::maxReconsumeTimes, number)) {
        builder(withMaxReconsumeTimes(number));
    }
    if (extract(Options::suspendCurrentQueueTimeMs, duration)) {
        builder(withSuspendCurrentQueueTime(duration));
    }
    if (extract(Options::consumeTimeoutMs, duration)) {
        builder(withConsumeTimeout(duration));
    }
    ConsumerModel model{ConsumerModel::Unset};
    if (extract(Options::consumerModel, model)) {
        builder(withConsumerModel(model));
    }
    ConsumeFromWhere fromWhere{ConsumeFromWhere::LastOffset};
    if (extract(Options::consumeFromWhere, fromWhere)) {
        builder(withConsumeFromWhere(fromWhere));
    }
    if (extract(Options::consumeOrderly, flag)) {
        builder(withConsumeOrderly(flag));
    }
    AllocateStrategy::Ptr strategy;
    if (extract(Options::allocateStrategy, strategy)) {
        builder(withStrategy(std::move(strategy)));
    }
    cppkafka::LogLevel level{cppkafka::LogLevel::LogInfo};
    if (extract(Options::logLevel, level)) {
        builder(withLogLevel(level));
    }
}

}
}
