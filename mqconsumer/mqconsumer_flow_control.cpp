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
#include <mqconsumer/mqconsumer_flow_control.h>
#include <cppkafka/detail/callback_invoker.h>
#include <sstream>

namespace Rocket {
namespace mqconsumer {

//========================================================================
//                             FLOW CONTROL
//========================================================================
FlowControl::FlowControl(const ConsumerOptions& options) :
    _options(options)
{
}

QueueThresholds FlowControl::updateAssignment(const std::string& topic, size_t numQueues)
{
    quantum::Mutex::Guard guard(quantum::local::context(), _assignmentMutex);
    const QueueThresholds configured = _options.getQueueThresholds();
    QueueThresholds previous = configured;
    QueueThresholds derived = configured;
    _thresholds.update([&](const ThresholdMap& current)->ThresholdMap {
        auto it = current.find(topic);
        if (it != current.end()) {
            previous = it->second;
        }
        derived = deriveQueueThresholds(configured,
                                        previous,
                                        _options.getPullThresholdForTopic(),
                                        _options.getPullThresholdSizeForTopic(),
                                        numQueues);
        ThresholdMap next(current);
        next[topic] = derived;
        return next;
    });
    if (derived != previous) {
        if (_options.getLogLevel() >= cppkafka::LogLevel::LogDebug) {
            std::ostringstream oss;
            {
                JsonBuilder json(oss);
                json.startMember("thresholdUpdate").
                    tag("topic", topic).
                    tag("numQueues", numQueues).
                    tag("count", derived._count).
                    tag("size", derived._size).
                    endMember();
            }
            report(_options, cppkafka::LogLevel::LogDebug, oss.str());
        }
        cppkafka::CallbackInvoker<Callbacks::ThresholdCallback>
            ("threshold", _options.getThresholdCallback(), nullptr)
                (topic, numQueues, derived);
    }
    return derived;
}

QueueThresholds FlowControl::getQueueThresholds(const std::string& topic) const
{
    Snapshot<ThresholdMap>::Ptr thresholds = _thresholds.get();
    auto it = thresholds->find(topic);
    if (it == thresholds->end()) {
        return _options.getQueueThresholds();
    }
    return it->second;
}

Snapshot<FlowControl::ThresholdMap>::Ptr FlowControl::snapshot() const
{
    return _thresholds.get();
}

bool FlowControl::removeTopic(const std::string& topic)
{
    bool found = false;
    _thresholds.update([&](const ThresholdMap& current)->ThresholdMap {
        ThresholdMap next(current);
        found = (next.erase(topic) > 0);
        return next;
    });
    return found;
}

FlowControlDecision FlowControl::evaluate(const MessageQueue& queue, const ProcessQueueStats& stats)
{
    const QueueThresholds thresholds = getQueueThresholds(queue._topic);
    FlowControlDecision decision;
    if (stats._cachedMessageCount > thresholds._count) {
        decision._status = FlowControlStatus::CountExceeded;
    }
    else if (stats._cachedMessageSize > thresholds._size) {
        decision._status = FlowControlStatus::SizeExceeded;
    }
    else if (!_options.isConsumeOrderly() && (stats._maxSpan > _options.getConsumeConcurrentlyMaxSpan())) {
        decision._status = FlowControlStatus::SpanExceeded;
    }
    if (!decision.isThrottled()) {
        return decision;
    }
    decision._suspendTime = _options.getSuspendCurrentQueueTime();
    
    size_t times = getCounter(decision._status)++;
    if ((times % LogEveryNThrottles) == 0) {
        std::ostringstream oss;
        {
            JsonBuilder json(oss);
            json.startMember("flowControl").
                tag("status", toString(decision._status)).
                rawTag("queue", queue).
                tag("cachedMessageCount", stats._cachedMessageCount).
                tag("cachedMessageSize", stats._cachedMessageSize).
                tag("maxSpan", stats._maxSpan).
                tag("countThreshold", thresholds._count).
                tag("sizeThreshold", thresholds._size).
                tag("spanThreshold", _options.getConsumeConcurrentlyMaxSpan()).
                tag("flowControlTimes", times + 1).
                endMember();
        }
        report(_options, cppkafka::LogLevel::LogWarning, oss.str());
    }
    cppkafka::CallbackInvoker<Callbacks::FlowControlCallback>
        ("flow control", _options.getFlowControlCallback(), nullptr)
            (queue, decision._status, decision._suspendTime);
    return decision;
}

size_t FlowControl::getFlowControlTimes(FlowControlStatus status) const
{
    switch (status) {
        case FlowControlStatus::CountExceeded: return _countFlowControlTimes;
        case FlowControlStatus::SizeExceeded: return _sizeFlowControlTimes;
        case FlowControlStatus::SpanExceeded: return _spanFlowControlTimes;
        default: return 0;
    }
}

std::atomic<size_t>& FlowControl::getCounter(FlowControlStatus status)
{
    switch (status) {
        case FlowControlStatus::SizeExceeded: return _sizeFlowControlTimes;
        case FlowControlStatus::SpanExceeded: return _spanFlowControlTimes;
        default: return _countFlowControlTimes;
    }
}

}
}
