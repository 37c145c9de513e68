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
#ifndef ROCKET_MQCONSUMER_FLOW_CONTROL_H
#define ROCKET_MQCONSUMER_FLOW_CONTROL_H

#include <mqconsumer/mqconsumer_consumer_options.h>
#include <mqconsumer/mqconsumer_message_queue.h>
#include <mqconsumer/mqconsumer_queue_thresholds.h>
#include <mqconsumer/utils/mqconsumer_snapshot.h>
#include <atomic>
#include <chrono>
#include <string>
#include <unordered_map>

namespace Rocket {
namespace mqconsumer {

/**
 * @brief Cache statistics of a single queue as seen by the pull loop.
 */
struct ProcessQueueStats
{
    int64_t     _cachedMessageCount{0};
    int64_t     _cachedMessageSize{0};  ///< In bytes
    int64_t     _maxSpan{0};            ///< Highest minus lowest cached offset
};

/**
 * @brief Outcome of a flow control evaluation.
 */
struct FlowControlDecision
{
    FlowControlStatus           _status{FlowControlStatus::Proceed};
    std::chrono::milliseconds   _suspendTime{0};    ///< How long pulling on the queue should be delayed
    
    bool isThrottled() const { return _status != FlowControlStatus::Proceed; }
};

//========================================================================
//                             FLOW CONTROL
//========================================================================
/**
 * @brief Tracks the per-queue thresholds in effect for each subscribed topic and decides whether
 *        the next pull on a queue should be suspended.
 * @remark Thresholds are recomputed on rebalance and published as an immutable snapshot, which
 *         lets pulling threads read them without observing a partial update.
 * @warning The options must outlive this object.
 */
class FlowControl
{
public:
    using ThresholdMap = std::unordered_map<std::string, QueueThresholds>;
    static constexpr size_t LogEveryNThrottles = 1000;
    
    explicit FlowControl(const ConsumerOptions& options);
    FlowControl(const FlowControl&) = delete;
    FlowControl& operator=(const FlowControl&) = delete;
    
    /**
     * @brief Recompute the per-queue thresholds of a topic following a rebalance.
     * @param topic The topic name.
     * @param numQueues The number of queues of this topic now assigned to the consumer.
     * @return The thresholds in effect for this topic.
     * @remark Calling this repeatedly with the same number of queues has no further effect.
     *         When no queue is assigned the previous thresholds are kept.
     * @remark Concurrent updates are serialized so the threshold callback is invoked in the
     *         order in which the values were published.
     */
    QueueThresholds updateAssignment(const std::string& topic, size_t numQueues);
    
    /**
     * @brief Get the per-queue thresholds in effect for a topic.
     * @return The derived thresholds, or the configured ones if the topic was never assigned.
     */
    QueueThresholds getQueueThresholds(const std::string& topic) const;
    
    /**
     * @brief Get the thresholds of all topics at once.
     */
    Snapshot<ThresholdMap>::Ptr snapshot() const;
    
    /**
     * @brief Drop the thresholds derived for a topic which is no longer subscribed.
     * @return True if the topic was known.
     */
    bool removeTopic(const std::string& topic);
    
    /**
     * @brief Decide if pulling on a queue may continue.
     * @param queue The queue about to be pulled.
     * @param stats The current cache statistics of this queue.
     * @return The decision. Throttled decisions carry the configured suspend time.
     */
    FlowControlDecision evaluate(const MessageQueue& queue, const ProcessQueueStats& stats);
    
    /**
     * @brief Number of times pulling was suspended for a specific reason.
     */
    size_t getFlowControlTimes(FlowControlStatus status) const;
    
private:
    std::atomic<size_t>& getCounter(FlowControlStatus status);
    
    const ConsumerOptions&      _options;
    Snapshot<ThresholdMap>      _thresholds;
    quantum::Mutex              _assignmentMutex;
    std::atomic<size_t>         _countFlowControlTimes{0};
    std::atomic<size_t>         _sizeFlowControlTimes{0};
    std::atomic<size_t>         _spanFlowControlTimes{0};
};

}
}

#endif //ROCKET_MQCONSUMER_FLOW_CONTROL_H
