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
#include <mqconsumer/mqconsumer_consumer_options_builder.h>
#include <mqconsumer/mqconsumer_consumer_configuration.h>
#include <limits>
#include <sstream>

namespace Rocket {
namespace mqconsumer {

namespace {

void checkRange(InvalidCombinationException::ViolationList& violations,
                const char* option,
                int64_t value,
                int64_t minAllowed,
                int64_t maxAllowed = std::numeric_limits<int64_t>::max())
{
    if ((value < minAllowed) || (value > maxAllowed)) {
        std::ostringstream reason;
        reason << "Value " << value << " is not in the range: [" << minAllowed << ", " << maxAllowed << "]";
        violations.push_back({option, reason.str()});
    }
}

}

//========================================================================
//                       CONSUMER OPTIONS BUILDER
//========================================================================
ConsumerOptionsBuilder::ConsumerOptionsBuilder() :
    _options(ConsumerOptions::defaults())
{
}

ConsumerOptionsBuilder::ConsumerOptionsBuilder(ConsumerOptions base) :
    _options(std::move(base))
{
}

ConsumerOptionsBuilder& ConsumerOptionsBuilder::operator()(const Option& option)
{
    if (option) {
        option(*this);
    }
    return *this;
}

ConsumerOptionsBuilder& ConsumerOptionsBuilder::operator()(const OptionList& options)
{
    for (const auto& option : options) {
        (*this)(option);
    }
    return *this;
}

ConsumerOptionsBuilder& ConsumerOptionsBuilder::operator()(std::initializer_list<Option> options)
{
    for (const auto& option : options) {
        (*this)(option);
    }
    return *this;
}

ConsumerOptionsBuilder& ConsumerOptionsBuilder::setGroupName(std::string groupName)
{
    _options._groupName = std::move(groupName);
    return *this;
}

ConsumerOptionsBuilder& ConsumerOptionsBuilder::setNameServerAddrs(std::vector<std::string> addresses)
{
    _options._nameServerAddrs = std::move(addresses);
    return *this;
}

ConsumerOptionsBuilder& ConsumerOptionsBuilder::setInstanceName(std::string instanceName)
{
    _options._instanceName = std::move(instanceName);
    return *this;
}

ConsumerOptionsBuilder& ConsumerOptionsBuilder::setNamespace(std::string ns)
{
    _options._namespace = std::move(ns);
    return *this;
}

ConsumerOptionsBuilder& ConsumerOptionsBuilder::setCredentials(Credentials credentials)
{
    _options._credentials = std::move(credentials);
    return *this;
}

ConsumerOptionsBuilder& ConsumerOptionsBuilder::setAclEnabled(bool enable)
{
    _options._aclEnabled = enable;
    return *this;
}

ConsumerOptionsBuilder& ConsumerOptionsBuilder::setVipChannelEnabled(bool enable)
{
    _options._vipChannelEnabled = enable;
    return *this;
}

ConsumerOptionsBuilder& ConsumerOptionsBuilder::setRetryTimes(int retries)
{
    _options._retryTimes = retries;
    return *this;
}

ConsumerOptionsBuilder& ConsumerOptionsBuilder::setConsumeTimestamp(std::string timestamp)
{
    _options._consumeTimestamp = std::move(timestamp);
    return *this;
}

ConsumerOptionsBuilder& ConsumerOptionsBuilder::setPullTimeout(std::chrono::milliseconds timeout)
{
    _options._pullTimeout = timeout;
    return *this;
}

ConsumerOptionsBuilder& ConsumerOptionsBuilder::setConsumeConcurrentlyMaxSpan(int span)
{
    _options._consumeConcurrentlyMaxSpan = span;
    return *this;
}

ConsumerOptionsBuilder& ConsumerOptionsBuilder::setPullThresholdForQueue(int64_t count)
{
    _options._pullThresholdForQueue = count;
    return *this;
}

ConsumerOptionsBuilder& ConsumerOptionsBuilder::setPullThresholdSizeForQueue(int64_t bytes)
{
    _options._pullThresholdSizeForQueue = bytes;
    return *this;
}

ConsumerOptionsBuilder& ConsumerOptionsBuilder::setPullThresholdForTopic(Threshold count)
{
    _options._pullThresholdForTopic = count;
    return *this;
}

ConsumerOptionsBuilder& ConsumerOptionsBuilder::setPullThresholdSizeForTopic(Threshold bytes)
{
    _options._pullThresholdSizeForTopic = bytes;
    return *this;
}

ConsumerOptionsBuilder& ConsumerOptionsBuilder::setPullInterval(std::chrono::milliseconds interval)
{
    _options._pullInterval = interval;
    return *this;
}

ConsumerOptionsBuilder& ConsumerOptionsBuilder::setConsumeMessageBatchMaxSize(int size)
{
    _options._consumeMessageBatchMaxSize = size;
    return *this;
}

ConsumerOptionsBuilder& ConsumerOptionsBuilder::setPullBatchSize(int32_t size)
{
    _options._pullBatchSize = size;
    return *this;
}

ConsumerOptionsBuilder& ConsumerOptionsBuilder::setPostSubscriptionWhenPull(bool enable)
{
    _options._postSubscriptionWhenPull = enable;
    return *this;
}

ConsumerOptionsBuilder& ConsumerOptionsBuilder::setMaxReconsumeTimes(int times)
{
    _options._maxReconsumeTimes = times;
    return *this;
}

ConsumerOptionsBuilder& ConsumerOptionsBuilder::setSuspendCurrentQueueTime(std::chrono::milliseconds time)
{
    _options._suspendCurrentQueueTime = time;
    return *this;
}

ConsumerOptionsBuilder& ConsumerOptionsBuilder::setConsumeTimeout(std::chrono::milliseconds timeout)
{
    _options._consumeTimeout = timeout;
    return *this;
}

ConsumerOptionsBuilder& ConsumerOptionsBuilder::setConsumerModel(ConsumerModel model)
{
    _options._consumerModel = model;
    return *this;
}

ConsumerOptionsBuilder& ConsumerOptionsBuilder::setAllocateStrategy(AllocateStrategy::Ptr strategy)
{
    _options._allocateStrategy = std::move(strategy);
    return *this;
}

ConsumerOptionsBuilder& ConsumerOptionsBuilder::setConsumeOrderly(bool orderly)
{
    _options._consumeOrderly = orderly;
    return *this;
}

ConsumerOptionsBuilder& ConsumerOptionsBuilder::setConsumeFromWhere(ConsumeFromWhere fromWhere)
{
    _options._consumeFromWhere = fromWhere;
    return *this;
}

ConsumerOptionsBuilder& ConsumerOptionsBuilder::appendInterceptor(Interceptor interceptor)
{
    _options._interceptors.append(std::move(interceptor));
    return *this;
}

ConsumerOptionsBuilder& ConsumerOptionsBuilder::setLogCallback(Callbacks::LogCallback callback)
{
    _options._logCallback = std::move(callback);
    return *this;
}

ConsumerOptionsBuilder& ConsumerOptionsBuilder::setLogLevel(cppkafka::LogLevel level)
{
    _options._logLevel = level;
    return *this;
}

ConsumerOptionsBuilder& ConsumerOptionsBuilder::setFlowControlCallback(Callbacks::FlowControlCallback callback)
{
    _options._flowControlCallback = std::move(callback);
    return *this;
}

ConsumerOptionsBuilder& ConsumerOptionsBuilder::setThresholdCallback(Callbacks::ThresholdCallback callback)
{
    _options._thresholdCallback = std::move(callback);
    return *this;
}

const ConsumerOptions& ConsumerOptionsBuilder::options() const
{
    return _options;
}

ConsumerOptions ConsumerOptionsBuilder::build() const
{
    ConsumerOptions options(_options);
    if ((options._consumeFromWhere == ConsumeFromWhere::Timestamp) && options._consumeTimestamp.empty()) {
        options._consumeTimestamp = formatConsumeTimestamp(std::chrono::system_clock::now() -
                                                           std::chrono::minutes(30));
    }
    
    InvalidCombinationException::ViolationList violations = validate(options);
    if (!violations.empty()) {
        InvalidCombinationException ex(std::move(violations));
        report(options, cppkafka::LogLevel::LogErr, ex.what());
        throw ex;
    }
    
    if (options._groupName == ConsumerOptions::DefaultConsumerGroup) {
        std::ostringstream oss;
        oss << "Consumer group '" << options._groupName << "' is reserved, please use a unique group name";
        report(options, cppkafka::LogLevel::LogWarning, oss.str());
    }
    if (options._pullThresholdForTopic.isLimited() || options._pullThresholdSizeForTopic.isLimited()) {
        report(options, cppkafka::LogLevel::LogInfo,
               "Per-queue thresholds will be derived from the topic thresholds on each rebalance");
    }
    if (options.getLogLevel() >= cppkafka::LogLevel::LogDebug) {
        std::ostringstream oss;
        oss << options;
        report(options, cppkafka::LogLevel::LogDebug, oss.str());
    }
    return options;
}

InvalidCombinationException::ViolationList
ConsumerOptionsBuilder::validate(const ConsumerOptions& options)
{
    using Options = ConsumerConfiguration::Options;
    using Limits = ConsumerConfiguration::Limits;
    InvalidCombinationException::ViolationList violations;
    
    if (options._groupName.empty()) {
        violations.push_back({Options::groupName, "Group name is missing"});
    }
    if (options._nameServerAddrs.empty()) {
        violations.push_back({Options::nameServerAddrs, "Name server addresses are missing"});
    }
    if (options._consumerModel == ConsumerModel::Unset) {
        violations.push_back({Options::consumerModel, "Consumer model is not set"});
    }
    if (options._consumeOrderly && (options._consumerModel == ConsumerModel::Broadcasting)) {
        violations.push_back({Options::consumeOrderly, "Orderly consumption is not supported in broadcasting mode"});
    }
    if (options._aclEnabled && options._credentials.empty()) {
        violations.push_back({Options::aclEnabled, "ACL is enabled but the access or secret key is missing"});
    }
    if ((options._consumeFromWhere == ConsumeFromWhere::Timestamp) &&
        !isValidConsumeTimestamp(options._consumeTimestamp)) {
        std::ostringstream reason;
        reason << "Invalid timestamp '" << options._consumeTimestamp << "'. Expected format is 'YYYYMMDDHHmmss'";
        violations.push_back({Options::consumeTimestamp, reason.str()});
    }
    if (!options._allocateStrategy) {
        violations.push_back({Options::allocateStrategy, "Allocate strategy is missing"});
    }
    checkRange(violations, Options::retryTimes, options._retryTimes, 0, std::numeric_limits<int>::max());
    checkRange(violations, Options::pullTimeoutMs, options._pullTimeout.count(), 1);
    checkRange(violations, Options::consumeConcurrentlyMaxSpan, options._consumeConcurrentlyMaxSpan,
               1, Limits::maxConsumeConcurrentlyMaxSpan);
    checkRange(violations, Options::pullThresholdForQueue, options._pullThresholdForQueue,
               1, Limits::maxPullThresholdForQueue);
    checkRange(violations, Options::pullThresholdSizeForQueue, options._pullThresholdSizeForQueue,
               1, Limits::maxPullThresholdSizeForQueue);
    if (options._pullThresholdForTopic.isLimited()) {
        checkRange(violations, Options::pullThresholdForTopic, options._pullThresholdForTopic.value(),
                   1, Limits::maxPullThresholdForTopic);
    }
    if (options._pullThresholdSizeForTopic.isLimited()) {
        checkRange(violations, Options::pullThresholdSizeForTopic, options._pullThresholdSizeForTopic.value(),
                   1, Limits::maxPullThresholdSizeForTopic);
    }
    checkRange(violations, Options::pullIntervalMs, options._pullInterval.count(), 0, Limits::maxPullIntervalMs);
    checkRange(violations, Options::consumeMessageBatchMaxSize, options._consumeMessageBatchMaxSize,
               1, Limits::maxConsumeMessageBatchMaxSize);
    checkRange(violations, Options::pullBatchSize, options._pullBatchSize, 1, Limits::maxPullBatchSize);
    checkRange(violations, Options::maxReconsumeTimes, options._maxReconsumeTimes,
               EnumValue(ReconsumeLimits::Default), std::numeric_limits<int>::max());
    checkRange(violations, Options::suspendCurrentQueueTimeMs, options._suspendCurrentQueueTime.count(), 0);
    checkRange(violations, Options::consumeTimeoutMs, options._consumeTimeout.count(), 1);
    return violations;
}

ConsumerOptions makeConsumerOptions(const OptionList& options)
{
    ConsumerOptionsBuilder builder;
    builder(options);
    return builder.build();
}

ConsumerOptions makeConsumerOptions(std::initializer_list<Option> options)
{
    ConsumerOptionsBuilder builder;
    builder(options);
    return builder.build();
}

}
}
