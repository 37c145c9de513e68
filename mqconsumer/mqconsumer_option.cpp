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
#include <mqconsumer/mqconsumer_option.h>
#include <algorithm>

namespace Rocket {
namespace mqconsumer {

Option withConsumerModel(ConsumerModel model)
{
    return [model](ConsumerOptionsBuilder& builder) {
        if (model != ConsumerModel::Unset) {
            builder.setConsumerModel(model);
        }
    };
}

Option withConsumeFromWhere(ConsumeFromWhere fromWhere)
{
    return [fromWhere](ConsumerOptionsBuilder& builder) {
        builder.setConsumeFromWhere(fromWhere);
    };
}

Option withGroupName(std::string groupName)
{
    return [groupName = std::move(groupName)](ConsumerOptionsBuilder& builder) {
        if (!groupName.empty()) {
            builder.setGroupName(groupName);
        }
    };
}

Option withNameServer(std::vector<std::string> addresses)
{
    for (auto& address : addresses) {
        trim(address);
    }
    addresses.erase(std::remove_if(addresses.begin(), addresses.end(),
                                   [](const std::string& address)->bool { return address.empty(); }),
                    addresses.end());
    return [addresses = std::move(addresses)](ConsumerOptionsBuilder& builder) {
        if (!addresses.empty()) {
            builder.setNameServerAddrs(addresses);
        }
    };
}

Option withVIPChannel(bool enable)
{
    return [enable](ConsumerOptionsBuilder& builder) {
        builder.setVipChannelEnabled(enable);
    };
}

Option withACL(bool enable)
{
    return [enable](ConsumerOptionsBuilder& builder) {
        builder.setAclEnabled(enable);
    };
}

Option withRetry(int retries)
{
    return [retries](ConsumerOptionsBuilder& builder) {
        if (retries >= 0) {
            builder.setRetryTimes(retries);
        }
    };
}

Option withInterceptor(std::vector<Interceptor> interceptors)
{
    return [interceptors = std::move(interceptors)](ConsumerOptionsBuilder& builder) {
        for (const auto& interceptor : interceptors) {
            if (interceptor) {
                builder.appendInterceptor(interceptor);
            }
        }
    };
}

Option withConsumeTimestamp(std::string timestamp)
{
    return [timestamp = std::move(timestamp)](ConsumerOptionsBuilder& builder) {
        if (!timestamp.empty()) {
            builder.setConsumeTimestamp(timestamp);
        }
    };
}

Option withPullTimeout(std::chrono::milliseconds timeout)
{
    return [timeout](ConsumerOptionsBuilder& builder) {
        if (timeout.count() > 0) {
            builder.setPullTimeout(timeout);
        }
    };
}

Option withConsumeConcurrentlyMaxSpan(int span)
{
    return [span](ConsumerOptionsBuilder& builder) {
        if (span > 0) {
            builder.setConsumeConcurrentlyMaxSpan(span);
        }
    };
}

Option withPullThresholdForQueue(int64_t count)
{
    return [count](ConsumerOptionsBuilder& builder) {
        if (count > 0) {
            builder.setPullThresholdForQueue(count);
        }
    };
}

Option withPullThresholdSizeForQueue(int64_t bytes)
{
    return [bytes](ConsumerOptionsBuilder& builder) {
        if (bytes > 0) {
            builder.setPullThresholdSizeForQueue(bytes);
        }
    };
}

Option withPullThresholdForTopic(Threshold count)
{
    return [count](ConsumerOptionsBuilder& builder) {
        builder.setPullThresholdForTopic(count);
    };
}

Option withPullThresholdSizeForTopic(Threshold bytes)
{
    return [bytes](ConsumerOptionsBuilder& builder) {
        builder.setPullThresholdSizeForTopic(bytes);
    };
}

Option withPullInterval(std::chrono::milliseconds interval)
{
    return [interval](ConsumerOptionsBuilder& builder) {
        if (interval.count() >= 0) {
            builder.setPullInterval(interval);
        }
    };
}

Option withConsumeMessageBatchMaxSize(int size)
{
    return [size](ConsumerOptionsBuilder& builder) {
        if (size > 0) {
            builder.setConsumeMessageBatchMaxSize(size);
        }
    };
}

Option withPullBatchSize(int32_t size)
{
    return [size](ConsumerOptionsBuilder& builder) {
        if (size > 0) {
            builder.setPullBatchSize(size);
        }
    };
}

Option withPostSubscriptionWhenPull(bool enable)
{
    return [enable](ConsumerOptionsBuilder& builder) {
        builder.setPostSubscriptionWhenPull(enable);
    };
}

Option withMaxReconsumeTimes(int times)
{
    return [times](ConsumerOptionsBuilder& builder) {
        if (times >= EnumValue(ReconsumeLimits::Default)) {
            builder.setMaxReconsumeTimes(times);
        }
    };
}

Option withSuspendCurrentQueueTime(std::chrono::milliseconds time)
{
    return [time](ConsumerOptionsBuilder& builder) {
        if (time.count() >= 0) {
            builder.setSuspendCurrentQueueTime(time);
        }
    };
}

Option withConsumeTimeout(std::chrono::milliseconds timeout)
{
    return [timeout](ConsumerOptionsBuilder& builder) {
        if (timeout.count() > 0) {
            builder.setConsumeTimeout(timeout);
        }
    };
}

Option withStrategy(AllocateStrategy::Ptr strategy)
{
    return [strategy = std::move(strategy)](ConsumerOptionsBuilder& builder) {
        if (strategy) {
            builder.setAllocateStrategy(strategy);
        }
    };
}

Option withConsumeOrderly(bool orderly)
{
    return [orderly](ConsumerOptionsBuilder& builder) {
        builder.setConsumeOrderly(orderly);
    };
}

Option withInstance(std::string instanceName)
{
    return [instanceName = std::move(instanceName)](ConsumerOptionsBuilder& builder) {
        if (!instanceName.empty()) {
            builder.setInstanceName(instanceName);
        }
    };
}

Option withNamespace(std::string ns)
{
    return [ns = std::move(ns)](ConsumerOptionsBuilder& builder) {
        if (!ns.empty()) {
            builder.setNamespace(ns);
        }
    };
}

Option withCredentials(Credentials credentials)
{
    return [credentials = std::move(credentials)](ConsumerOptionsBuilder& builder) {
        if (!credentials.empty()) {
            builder.setCredentials(credentials);
        }
    };
}

Option withLogCallback(Callbacks::LogCallback callback)
{
    return [callback = std::move(callback)](ConsumerOptionsBuilder& builder) {
        if (callback) {
            builder.setLogCallback(callback);
        }
    };
}

Option withLogLevel(cppkafka::LogLevel level)
{
    return [level](ConsumerOptionsBuilder& builder) {
        builder.setLogLevel(level);
    };
}

Option withFlowControlCallback(Callbacks::FlowControlCallback callback)
{
    return [callback = std::move(callback)](ConsumerOptionsBuilder& builder) {
        if (callback) {
            builder.setFlowControlCallback(callback);
        }
    };
}

Option withThresholdCallback(Callbacks::ThresholdCallback callback)
{
    return [callback = std::move(callback)](ConsumerOptionsBuilder& builder) {
        if (callback) {
            builder.setThresholdCallback(callback);
        }
    };
}

Option withConfiguration(ConsumerConfiguration config)
{
    return [config = std::move(config)](ConsumerOptionsBuilder& builder) {
        config.applyTo(builder);
    };
}

}
}
