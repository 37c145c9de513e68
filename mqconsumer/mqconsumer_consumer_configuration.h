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
#ifndef ROCKET_MQCONSUMER_CONSUMER_CONFIGURATION_H
#define ROCKET_MQCONSUMER_CONSUMER_CONFIGURATION_H

#include <mqconsumer/mqconsumer_configuration.h>

namespace Rocket {
namespace mqconsumer {

class ConsumerOptionsBuilder;

//========================================================================
//                       CONSUMER CONFIGURATION
//========================================================================
/**
 * @brief String based consumer configuration. Options are validated on construction and
 *        can then be applied to a builder via 'withConfiguration()'.
 */
class ConsumerConfiguration : public Configuration
{
public:
    /**
     * @brief Client and consumer options recognized by this library.
     */
    struct Options
    {
        static constexpr const char* groupName =                        "client.group.name";
        static constexpr const char* nameServerAddrs =                  "client.name.server.addrs";
        static constexpr const char* instanceName =                     "client.instance.name";
        static constexpr const char* nameSpace =                        "client.namespace";
        static constexpr const char* aclEnabled =                       "client.acl.enabled";
        static constexpr const char* vipChannelEnabled =                "client.vip.channel.enabled";
        static constexpr const char* retryTimes =                       "client.retry.times";
        static constexpr const char* consumeTimestamp =                 "consumer.consume.timestamp";
        static constexpr const char* pullTimeoutMs =                    "consumer.pull.timeout.ms";
        static constexpr const char* consumeConcurrentlyMaxSpan =       "consumer.concurrently.max.span";
        static constexpr const char* pullThresholdForQueue =            "consumer.pull.threshold.for.queue";
        static constexpr const char* pullThresholdSizeForQueue =        "consumer.pull.threshold.size.for.queue";
        static constexpr const char* pullThresholdForTopic =            "consumer.pull.threshold.for.topic";
        static constexpr const char* pullThresholdSizeForTopic =        "consumer.pull.threshold.size.for.topic";
        static constexpr const char* pullIntervalMs =                   "consumer.pull.interval.ms";
        static constexpr const char* consumeMessageBatchMaxSize =       "consumer.consume.message.batch.max.size";
        static constexpr const char* pullBatchSize =                    "consumer.pull.batch.size";
        static constexpr const char* postSubscriptionWhenPull =         "consumer.post.subscription.when.pull";
        static constexpr const char* maxReconsumeTimes =                "consumer.max.reconsume.times";
        static constexpr const char* suspendCurrentQueueTimeMs =        "consumer.suspend.current.queue.time.ms";
        static constexpr const char* consumeTimeoutMs =                 "consumer.consume.timeout.ms";
        static constexpr const char* consumerModel =                    "consumer.model";
        static constexpr const char* consumeFromWhere =                 "consumer.consume.from.where";
        static constexpr const char* consumeOrderly =                   "consumer.consume.orderly";
        static constexpr const char* allocateStrategy =                 "consumer.allocate.strategy";
        static constexpr const char* logLevel =                         "consumer.log.level";
    };
    
    /**
     * @brief Allowed ranges for the numeric options.
     */
    struct Limits
    {
        static constexpr int64_t maxConsumeConcurrentlyMaxSpan =    65535;
        static constexpr int64_t maxPullThresholdForQueue =         65535;
        static constexpr int64_t maxPullThresholdSizeForQueue =     1024LL * 1024 * 1024;          // 1 GiB
        static constexpr int64_t maxPullThresholdForTopic =         6553500;
        static constexpr int64_t maxPullThresholdSizeForTopic =     100LL * 1024 * 1024 * 1024;    // 100 GiB
        static constexpr int64_t maxPullIntervalMs =                65535;
        static constexpr int64_t maxConsumeMessageBatchMaxSize =    1024;
        static constexpr int64_t maxPullBatchSize =                 1024;
    };
    
    /**
     * @brief Constructor
     * @param options The consumer options.
     * @throws InvalidOptionException if any option is unknown or has an invalid value.
     */
    ConsumerConfiguration(OptionList options);
    ConsumerConfiguration(OptionInitList options);
    
    /**
     * @brief Apply every option present in this configuration.
     * @param builder The builder receiving the values.
     * @remark Values go through the option functions so the same no-op rules apply.
     */
    void applyTo(ConsumerOptionsBuilder& builder) const;
    
private:
    template <typename T>
    bool extract(const char* name, T& value) const;
    
    static const OptionMap s_options;
};

} // mqconsumer
} // Rocket

#endif //ROCKET_MQCONSUMER_CONSUMER_CONFIGURATION_H
