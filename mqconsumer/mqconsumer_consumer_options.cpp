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
#include <mqconsumer/mqconsumer_consumer_options.h>
#include <cppkafka/detail/callback_invoker.h>

namespace Rocket {
namespace mqconsumer {

//========================================================================
//                           CONSUMER OPTIONS
//========================================================================
ConsumerOptions ConsumerOptions::defaults()
{
    ConsumerOptions options;
    static_cast<ClientOptions&>(options) = ClientOptions::defaults();
    options._groupName = DefaultConsumerGroup;
    options._pullTimeout = std::chrono::seconds(10);
    options._consumeConcurrentlyMaxSpan = 2000;
    options._pullThresholdForQueue = 1000;
    options._pullThresholdSizeForQueue = 100 * MiB;
    options._pullThresholdForTopic = Threshold::unlimited();
    options._pullThresholdSizeForTopic = Threshold::unlimited();
    options._pullInterval = std::chrono::milliseconds::zero();
    options._consumeMessageBatchMaxSize = 1;
    options._pullBatchSize = 32;
    options._maxReconsumeTimes = EnumValue(ReconsumeLimits::Default);
    options._suspendCurrentQueueTime = std::chrono::milliseconds(1000);
    options._consumeTimeout = std::chrono::minutes(15);
    options._allocateStrategy = allocateByAveragely();
    return options;
}

const std::string& ConsumerOptions::getConsumeTimestamp() const
{
    return _consumeTimestamp;
}

std::chrono::milliseconds ConsumerOptions::getPullTimeout() const
{
    return _pullTimeout;
}

int ConsumerOptions::getConsumeConcurrentlyMaxSpan() const
{
    return _consumeConcurrentlyMaxSpan;
}

int64_t ConsumerOptions::getPullThresholdForQueue() const
{
    return _pullThresholdForQueue;
}

int64_t ConsumerOptions::getPullThresholdSizeForQueue() const
{
    return _pullThresholdSizeForQueue;
}

QueueThresholds ConsumerOptions::getQueueThresholds() const
{
    return {_pullThresholdForQueue, _pullThresholdSizeForQueue};
}

const Threshold& ConsumerOptions::getPullThresholdForTopic() const
{
    return _pullThresholdForTopic;
}

const Threshold& ConsumerOptions::getPullThresholdSizeForTopic() const
{
    return _pullThresholdSizeForTopic;
}

std::chrono::milliseconds ConsumerOptions::getPullInterval() const
{
    return _pullInterval;
}

int ConsumerOptions::getConsumeMessageBatchMaxSize() const
{
    return _consumeMessageBatchMaxSize;
}

int32_t ConsumerOptions::getPullBatchSize() const
{
    return _pullBatchSize;
}

bool ConsumerOptions::getPostSubscriptionWhenPull() const
{
    return _postSubscriptionWhenPull;
}

int ConsumerOptions::getMaxReconsumeTimes() const
{
    return isMaxReconsumeTimesDefault() ? DefaultMaxReconsumeTimes : _maxReconsumeTimes;
}

bool ConsumerOptions::isMaxReconsumeTimesDefault() const
{
    return _maxReconsumeTimes == EnumValue(ReconsumeLimits::Default);
}

std::chrono::milliseconds ConsumerOptions::getSuspendCurrentQueueTime() const
{
    return _suspendCurrentQueueTime;
}

std::chrono::milliseconds ConsumerOptions::getConsumeTimeout() const
{
    return _consumeTimeout;
}

ConsumerModel ConsumerOptions::getConsumerModel() const
{
    return _consumerModel;
}

const AllocateStrategy::Ptr& ConsumerOptions::getAllocateStrategy() const
{
    return _allocateStrategy;
}

bool ConsumerOptions::isConsumeOrderly() const
{
    return _consumeOrderly;
}

ConsumeFromWhere ConsumerOptions::getConsumeFromWhere() const
{
    return _consumeFromWhere;
}

const InterceptorChain& ConsumerOptions::getInterceptors() const
{
    return _interceptors;
}

const Callbacks::LogCallback& ConsumerOptions::getLogCallback() const
{
    return _logCallback;
}

cppkafka::LogLevel ConsumerOptions::getLogLevel() const
{
    return _logLevel;
}

const Callbacks::FlowControlCallback& ConsumerOptions::getFlowControlCallback() const
{
    return _flowControlCallback;
}

const Callbacks::ThresholdCallback& ConsumerOptions::getThresholdCallback() const
{
    return _thresholdCallback;
}

std::ostream& operator<<(std::ostream& stream, const ConsumerOptions& options)
{
    JsonBuilder json(stream);
    json.startMember("consumerOptions");
    options.dump(json);
    json.tag("consumeTimestamp", options._consumeTimestamp).
        tag("pullTimeoutMs", options._pullTimeout).
        tag("consumeConcurrentlyMaxSpan", options._consumeConcurrentlyMaxSpan).
        tag("pullThresholdForQueue", options._pullThresholdForQueue).
        tag("pullThresholdSizeForQueue", options._pullThresholdSizeForQueue).
        tag("pullThresholdForTopic", options._pullThresholdForTopic.toLegacy()).
        tag("pullThresholdSizeForTopic", options._pullThresholdSizeForTopic.toLegacy()).
        tag("pullIntervalMs", options._pullInterval).
        tag("consumeMessageBatchMaxSize", options._consumeMessageBatchMaxSize).
        tag("pullBatchSize", options._pullBatchSize).
        tag("postSubscriptionWhenPull", options._postSubscriptionWhenPull).
        tag("maxReconsumeTimes", options.getMaxReconsumeTimes()).
        tag("suspendCurrentQueueTimeMs", options._suspendCurrentQueueTime).
        tag("consumeTimeoutMs", options._consumeTimeout).
        tag("consumerModel", toString(options._consumerModel)).
        tag("allocateStrategy", options._allocateStrategy ? options._allocateStrategy->name() : "none").
        tag("consumeOrderly", options._consumeOrderly).
        tag("consumeFromWhere", toString(options._consumeFromWhere)).
        tag("interceptors", options._interceptors.size()).
        tag("logLevel", toString(options._logLevel)).
        endMember().end();
    return stream;
}

void report(const ConsumerOptions& options,
            cppkafka::LogLevel level,
            const std::string& message)
{
    if (options.getLogLevel() >= level) {
        cppkafka::CallbackInvoker<Callbacks::LogCallback>("log", options.getLogCallback(), nullptr)
            (level, "mqconsumer", message);
    }
}

}
}
