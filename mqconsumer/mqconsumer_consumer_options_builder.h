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
#ifndef ROCKET_MQCONSUMER_CONSUMER_OPTIONS_BUILDER_H
#define ROCKET_MQCONSUMER_CONSUMER_OPTIONS_BUILDER_H

#include <mqconsumer/mqconsumer_consumer_options.h>
#include <mqconsumer/mqconsumer_exception.h>
#include <functional>
#include <initializer_list>
#include <vector>

namespace Rocket {
namespace mqconsumer {

/**
 * @brief The ConsumerOptionsBuilder assembles a ConsumerOptions object by applying option
 *        functions in order over a baseline (the library defaults unless specified otherwise).
 *        Setters overwrite the current value of a field (last write wins) and never fail.
 *        All validation is deferred to build().
 */
class ConsumerOptionsBuilder
{
public:
    using Option = std::function<void(ConsumerOptionsBuilder&)>;
    using OptionList = std::vector<Option>;
    
    /**
     * @brief Start from ConsumerOptions::defaults().
     */
    ConsumerOptionsBuilder();
    
    /**
     * @brief Start from a given baseline.
     * @param base The initial options. Use 'ConsumerOptions{}' to start without any defaults.
     */
    explicit ConsumerOptionsBuilder(ConsumerOptions base);
    
    /**
     * @brief Apply one or more option functions.
     * @return A reference to self for chaining purposes.
     * @remark Empty option functions are ignored.
     */
    ConsumerOptionsBuilder& operator()(const Option& option);
    ConsumerOptionsBuilder& operator()(const OptionList& options);
    ConsumerOptionsBuilder& operator()(std::initializer_list<Option> options);
    
    // Client options
    ConsumerOptionsBuilder& setGroupName(std::string groupName);
    ConsumerOptionsBuilder& setNameServerAddrs(std::vector<std::string> addresses);
    ConsumerOptionsBuilder& setInstanceName(std::string instanceName);
    ConsumerOptionsBuilder& setNamespace(std::string ns);
    ConsumerOptionsBuilder& setCredentials(Credentials credentials);
    ConsumerOptionsBuilder& setAclEnabled(bool enable);
    ConsumerOptionsBuilder& setVipChannelEnabled(bool enable);
    ConsumerOptionsBuilder& setRetryTimes(int retries);
    
    // Consumer options
    ConsumerOptionsBuilder& setConsumeTimestamp(std::string timestamp);
    ConsumerOptionsBuilder& setPullTimeout(std::chrono::milliseconds timeout);
    ConsumerOptionsBuilder& setConsumeConcurrentlyMaxSpan(int span);
    ConsumerOptionsBuilder& setPullThresholdForQueue(int64_t count);
    ConsumerOptionsBuilder& setPullThresholdSizeForQueue(int64_t bytes);
    ConsumerOptionsBuilder& setPullThresholdForTopic(Threshold count);
    ConsumerOptionsBuilder& setPullThresholdSizeForTopic(Threshold bytes);
    ConsumerOptionsBuilder& setPullInterval(std::chrono::milliseconds interval);
    ConsumerOptionsBuilder& setConsumeMessageBatchMaxSize(int size);
    ConsumerOptionsBuilder& setPullBatchSize(int32_t size);
    ConsumerOptionsBuilder& setPostSubscriptionWhenPull(bool enable);
    ConsumerOptionsBuilder& setMaxReconsumeTimes(int times);
    ConsumerOptionsBuilder& setSuspendCurrentQueueTime(std::chrono::milliseconds time);
    ConsumerOptionsBuilder& setConsumeTimeout(std::chrono::milliseconds timeout);
    ConsumerOptionsBuilder& setConsumerModel(ConsumerModel model);
    ConsumerOptionsBuilder& setAllocateStrategy(AllocateStrategy::Ptr strategy);
    ConsumerOptionsBuilder& setConsumeOrderly(bool orderly);
    ConsumerOptionsBuilder& setConsumeFromWhere(ConsumeFromWhere fromWhere);
    ConsumerOptionsBuilder& appendInterceptor(Interceptor interceptor);
    ConsumerOptionsBuilder& setLogCallback(Callbacks::LogCallback callback);
    ConsumerOptionsBuilder& setLogLevel(cppkafka::LogLevel level);
    ConsumerOptionsBuilder& setFlowControlCallback(Callbacks::FlowControlCallback callback);
    ConsumerOptionsBuilder& setThresholdCallback(Callbacks::ThresholdCallback callback);
    
    /**
     * @brief Get the options assembled so far. These have not been validated.
     */
    const ConsumerOptions& options() const;
    
    /**
     * @brief Validate the assembled options and produce the final configuration.
     * @return The finalized options.
     * @throws InvalidCombinationException listing every problem found.
     * @remark When consuming from a timestamp and none was set, the timestamp defaults to 30 minutes ago.
     */
    ConsumerOptions build() const;
    
private:
    static InvalidCombinationException::ViolationList validate(const ConsumerOptions& options);
    
    ConsumerOptions     _options;
};

using Option = ConsumerOptionsBuilder::Option;
using OptionList = ConsumerOptionsBuilder::OptionList;

/**
 * @brief Build consumer options from the defaults and a list of option functions.
 * @throws InvalidCombinationException.
 */
ConsumerOptions makeConsumerOptions(const OptionList& options);
ConsumerOptions makeConsumerOptions(std::initializer_list<Option> options);

}
}

#endif //ROCKET_MQCONSUMER_CONSUMER_OPTIONS_BUILDER_H
