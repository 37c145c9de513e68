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
#ifndef ROCKET_MQCONSUMER_CONSUMER_OPTIONS_H
#define ROCKET_MQCONSUMER_CONSUMER_OPTIONS_H

#include <mqconsumer/mqconsumer_allocate_strategy.h>
#include <mqconsumer/mqconsumer_callbacks.h>
#include <mqconsumer/mqconsumer_client_options.h>
#include <mqconsumer/mqconsumer_interceptor.h>
#include <mqconsumer/mqconsumer_queue_thresholds.h>
#include <mqconsumer/mqconsumer_threshold.h>
#include <mqconsumer/mqconsumer_utils.h>
#include <chrono>
#include <ostream>
#include <string>

namespace Rocket {
namespace mqconsumer {

//========================================================================
//                           CONSUMER OPTIONS
//========================================================================
/**
 * @brief The finalized configuration of a single consumer. Instances are produced by
 *        ConsumerOptionsBuilder::build() and are read-only thereafter, which makes them safe
 *        to share among the pulling and consuming threads.
 */
class ConsumerOptions : public ClientOptions
{
public:
    static constexpr const char* DefaultConsumerGroup = "DEFAULT_CONSUMER";
    static constexpr int DefaultMaxReconsumeTimes = 16;
    static constexpr int64_t MiB = 1024 * 1024;
    
    /**
     * @brief Creates an empty set of options. No defaults are applied and the group name is empty.
     */
    ConsumerOptions() = default;
    
    /**
     * @brief Creates the default consumer options.
     * @return The options.
     * @remark The group is set to 'DEFAULT_CONSUMER', the model is left unset and queues are allocated averagely.
     */
    static ConsumerOptions defaults();
    
    /**
     * @brief Backtracking consumption time with second precision ('YYYYMMDDHHmmss').
     *        Only used when consuming from ConsumeFromWhere::Timestamp.
     */
    const std::string& getConsumeTimestamp() const;
    
    /**
     * @brief Socket timeout of a single pull request.
     */
    std::chrono::milliseconds getPullTimeout() const;
    
    /**
     * @brief Maximum distance between the lowest and highest cached offsets of a queue.
     *        It has no effect on orderly consumption.
     */
    int getConsumeConcurrentlyMaxSpan() const;
    
    /**
     * @brief Configured per-queue flow control thresholds.
     * @remark When a topic threshold is limited, the thresholds in effect are derived by FlowControl.
     */
    int64_t getPullThresholdForQueue() const;
    int64_t getPullThresholdSizeForQueue() const;
    QueueThresholds getQueueThresholds() const;
    
    /**
     * @brief Topic-level flow control thresholds (unlimited by default).
     */
    const Threshold& getPullThresholdForTopic() const;
    const Threshold& getPullThresholdSizeForTopic() const;
    
    std::chrono::milliseconds getPullInterval() const;
    int getConsumeMessageBatchMaxSize() const;
    int32_t getPullBatchSize() const;
    bool getPostSubscriptionWhenPull() const;
    
    /**
     * @brief Maximum number of times a message is re-delivered before being sent to the dead-letter queue.
     * @return The configured value, or DefaultMaxReconsumeTimes if left at the default.
     */
    int getMaxReconsumeTimes() const;
    
    /**
     * @brief Check if the reconsume limit was left at its default.
     */
    bool isMaxReconsumeTimesDefault() const;
    
    std::chrono::milliseconds getSuspendCurrentQueueTime() const;
    std::chrono::milliseconds getConsumeTimeout() const;
    ConsumerModel getConsumerModel() const;
    const AllocateStrategy::Ptr& getAllocateStrategy() const;
    bool isConsumeOrderly() const;
    ConsumeFromWhere getConsumeFromWhere() const;
    const InterceptorChain& getInterceptors() const;
    
    const Callbacks::LogCallback& getLogCallback() const;
    cppkafka::LogLevel getLogLevel() const;
    const Callbacks::FlowControlCallback& getFlowControlCallback() const;
    const Callbacks::ThresholdCallback& getThresholdCallback() const;
    
private:
    friend class ConsumerOptionsBuilder;
    friend std::ostream& operator<<(std::ostream& stream, const ConsumerOptions& options);
    
    std::string                     _consumeTimestamp;
    std::chrono::milliseconds       _pullTimeout{0};
    int                             _consumeConcurrentlyMaxSpan{0};
    int64_t                         _pullThresholdForQueue{0};
    int64_t                         _pullThresholdSizeForQueue{0};
    Threshold                       _pullThresholdForTopic;
    Threshold                       _pullThresholdSizeForTopic;
    std::chrono::milliseconds       _pullInterval{0};
    int                             _consumeMessageBatchMaxSize{0};
    int32_t                         _pullBatchSize{0};
    bool                            _postSubscriptionWhenPull{false};
    int                             _maxReconsumeTimes{EnumValue(ReconsumeLimits::Default)};
    std::chrono::milliseconds       _suspendCurrentQueueTime{0};
    std::chrono::milliseconds       _consumeTimeout{0};
    ConsumerModel                   _consumerModel{ConsumerModel::Unset};
    AllocateStrategy::Ptr           _allocateStrategy;
    bool                            _consumeOrderly{false};
    ConsumeFromWhere                _consumeFromWhere{ConsumeFromWhere::LastOffset};
    InterceptorChain                _interceptors;
    Callbacks::LogCallback          _logCallback;
    cppkafka::LogLevel              _logLevel{cppkafka::LogLevel::LogInfo};
    Callbacks::FlowControlCallback  _flowControlCallback;
    Callbacks::ThresholdCallback    _thresholdCallback;
};

std::ostream& operator<<(std::ostream& stream, const ConsumerOptions& options);

/**
 * @brief Send a message to the log callback of the consumer if 'level' passes the configured log level.
 */
void report(const ConsumerOptions& options,
            cppkafka::LogLevel level,
            const std::string& message);

}
}

#endif //ROCKET_MQCONSUMER_CONSUMER_OPTIONS_H
