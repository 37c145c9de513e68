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
#include <mqconsumer/mqconsumer_queue_thresholds.h>
#include <algorithm>

namespace Rocket {
namespace mqconsumer {

namespace {

int64_t divide(const Threshold& topicThreshold, size_t numQueues, int64_t configured)
{
    if (topicThreshold.isUnlimited()) {
        return configured;
    }
    return std::max<int64_t>(1, topicThreshold.value() / static_cast<int64_t>(numQueues));
}

}

std::ostream& operator<<(std::ostream& stream, const QueueThresholds& thresholds)
{
    JsonBuilder json(stream);
    json.startMember("queueThresholds").
        tag("count", thresholds._count).
        tag("size", thresholds._size).
        endMember().end();
    return stream;
}

QueueThresholds deriveQueueThresholds(const QueueThresholds& configured,
                                      const QueueThresholds& current,
                                      const Threshold& topicCount,
                                      const Threshold& topicSize,
                                      size_t numQueues)
{
    if (topicCount.isUnlimited() && topicSize.isUnlimited()) {
        return configured;
    }
    if (numQueues == 0) {
        //nothing to divide among, keep what the pull loop currently uses
        return current;
    }
    return {divide(topicCount, numQueues, configured._count),
            divide(topicSize, numQueues, configured._size)};
}

}
}
