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
#ifndef ROCKET_MQCONSUMER_MESSAGE_QUEUE_H
#define ROCKET_MQCONSUMER_MESSAGE_QUEUE_H

#include <mqconsumer/mqconsumer_utils.h>
#include <ostream>
#include <string>
#include <tuple>
#include <vector>

namespace Rocket {
namespace mqconsumer {

/**
 * @brief Identifies a single queue (partition) of a topic hosted on a broker.
 */
struct MessageQueue
{
    std::string     _topic;
    std::string     _brokerName;
    int             _queueId{0};
    
    bool operator==(const MessageQueue& other) const
    {
        return std::tie(_topic, _brokerName, _queueId) ==
               std::tie(other._topic, other._brokerName, other._queueId);
    }
    bool operator!=(const MessageQueue& other) const
    {
        return !(*this == other);
    }
    bool operator<(const MessageQueue& other) const
    {
        return std::tie(_topic, _brokerName, _queueId) <
               std::tie(other._topic, other._brokerName, other._queueId);
    }
};

using MessageQueueList = std::vector<MessageQueue>;

std::ostream& operator<<(std::ostream& stream, const MessageQueue& queue);

}
}

#endif //ROCKET_MQCONSUMER_MESSAGE_QUEUE_H
