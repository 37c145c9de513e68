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
#ifndef ROCKET_MQCONSUMER_OPTION_H
#define ROCKET_MQCONSUMER_OPTION_H

#include <mqconsumer/mqconsumer_consumer_options_builder.h>
#include <mqconsumer/mqconsumer_consumer_configuration.h>
#include <utility>

namespace Rocket {
namespace mqconsumer {

//========================================================================
//                           OPTION FUNCTIONS
//========================================================================
// Each option function sets a single field when applied to a ConsumerOptionsBuilder.
// Semantically empty values (empty strings or lists, null callbacks, out-of-domain numbers)
// leave the field untouched so that optional settings can be forwarded unconditionally.

/**
 * @brief Set the consumer model. 'ConsumerModel::Unset' is ignored.
 */
Option withConsumerModel(ConsumerModel model);

/**
 * @brief Set the position from which a new consumer group starts consuming.
 */
Option withConsumeFromWhere(ConsumeFromWhere fromWhere);

/**
 * @brief Set the consumer group name. An empty name is ignored.
 */
Option withGroupName(std::string groupName);

/**
 * @brief Set the name server addresses. Blank entries are dropped and an empty list is ignored.
 */
Option withNameServer(std::vector<std::string> addresses);

Option withVIPChannel(bool enable);
Option withACL(bool enable);

/**
 * @brief Set the number of times a failed request is retried. Negative values are ignored.
 */
Option withRetry(int retries);

/**
 * @brief Append interceptors to the consumer pipeline in the order given.
 *        Empty handles are skipped.
 */
Option withInterceptor(std::vector<Interceptor> interceptors);

template <typename ... INTERCEPTORS>
Option withInterceptor(Interceptor interceptor, INTERCEPTORS&&... interceptors)
{
    return withInterceptor(std::vector<Interceptor>{std::move(interceptor),
                                                    Interceptor(std::forward<INTERCEPTORS>(interceptors))...});
}

/**
 * @brief Set the consume timestamp ('YYYYMMDDHHmmss'). An empty string is ignored.
 * @remark Only used with 'ConsumeFromWhere::Timestamp'. The format is checked by build().
 */
Option withConsumeTimestamp(std::string timestamp);

Option withPullTimeout(std::chrono::milliseconds timeout);
Option withConsumeConcurrentlyMaxSpan(int span);
Option withPullThresholdForQueue(int64_t count);

/**
 * @brief Set the per-queue cache limit in bytes.
 */
Option withPullThresholdSizeForQueue(int64_t bytes);

/**
 * @brief Set the topic-level cache limits. Per-queue limits are then derived from these
 *        by dividing them among the queues assigned to the consumer.
 */
Option withPullThresholdForTopic(Threshold count);
Option withPullThresholdSizeForTopic(Threshold bytes);

Option withPullInterval(std::chrono::milliseconds interval);
Option withConsumeMessageBatchMaxSize(int size);
Option withPullBatchSize(int32_t size);
Option withPostSubscriptionWhenPull(bool enable);

/**
 * @brief Set the maximum number of re-deliveries. Use -1 for the library default (16).
 *        Values below -1 are ignored.
 */
Option withMaxReconsumeTimes(int times);

Option withSuspendCurrentQueueTime(std::chrono::milliseconds time);
Option withConsumeTimeout(std::chrono::milliseconds timeout);

/**
 * @brief Set the queue allocation strategy. A null strategy is ignored.
 */
Option withStrategy(AllocateStrategy::Ptr strategy);

Option withConsumeOrderly(bool orderly);
Option withInstance(std::string instanceName);
Option withNamespace(std::string ns);

/**
 * @brief Set the ACL credentials. Credentials missing either key are ignored.
 */
Option withCredentials(Credentials credentials);

Option withLogCallback(Callbacks::LogCallback callback);
Option withLogLevel(cppkafka::LogLevel level);
Option withFlowControlCallback(Callbacks::FlowControlCallback callback);
Option withThresholdCallback(Callbacks::ThresholdCallback callback);

/**
 * @brief Apply all the options present in a string configuration.
 */
Option withConfiguration(ConsumerConfiguration config);

}
}

#endif //ROCKET_MQCONSUMER_OPTION_H
