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
#ifndef ROCKET_MQCONSUMER_QUEUE_THRESHOLDS_H
#define ROCKET_MQCONSUMER_QUEUE_THRESHOLDS_H

#include <mqconsumer/mqconsumer_threshold.h>
#include <cstddef>
#include <cstdint>
#include <ostream>

namespace Rocket {
namespace mqconsumer {

/**
 * @brief Per-queue cache limits enforced by the pull loop.
 */
struct QueueThresholds
{
    int64_t     _count{0};  ///< Max number of cached messages
    int64_t     _size{0};   ///< Max number of cached message bytes
    
    bool operator==(const QueueThresholds& other) const
    {
        return (_count == other._count) && (_size == other._size);
    }
    bool operator!=(const QueueThresholds& other) const
    {
        return !(*this == other);
    }
};

std::ostream& operator<<(std::ostream& stream, const QueueThresholds& thresholds);

/**
 * @brief Derive the per-queue thresholds from the topic thresholds.
 * @param configured The per-queue thresholds set in the consumer options.
 * @param current The last derived thresholds for this topic.
 * @param topicCount The topic-level message count threshold.
 * @param topicSize The topic-level byte size threshold.
 * @param numQueues The number of queues of this topic currently assigned to the consumer.
 * @return 'configured' if both topic thresholds are unlimited, 'current' if no queue is assigned,
 *         otherwise the topic limit divided evenly among the queues (with a minimum of 1). A topic
 *         threshold which is unlimited keeps the corresponding configured value.
 */
QueueThresholds deriveQueueThresholds(const QueueThresholds& configured,
                                      const QueueThresholds& current,
                                      const Threshold& topicCount,
                                      const Threshold& topicSize,
                                      size_t numQueues);

}
}

#endif //ROCKET_MQCONSUMER_QUEUE_THRESHOLDS_H
