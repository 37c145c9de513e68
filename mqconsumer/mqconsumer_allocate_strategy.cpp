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
#include <mqconsumer/mqconsumer_allocate_strategy.h>
#include <algorithm>

namespace Rocket {
namespace mqconsumer {

namespace {

// Returns the position of the client in the group or -1 if not found or if the inputs are empty
long findClient(const std::string& currentClientId,
                const MessageQueueList& allQueues,
                const std::vector<std::string>& allClientIds)
{
    if (currentClientId.empty() || allQueues.empty() || allClientIds.empty()) {
        return -1;
    }
    auto it = std::find(allClientIds.begin(), allClientIds.end(), currentClientId);
    if (it == allClientIds.end()) {
        return -1;
    }
    return std::distance(allClientIds.begin(), it);
}

}

MessageQueueList AllocateByAveragely::allocate(const std::string&,
                                               const std::string& currentClientId,
                                               const MessageQueueList& allQueues,
                                               const std::vector<std::string>& allClientIds) const
{
    MessageQueueList result;
    long index = findClient(currentClientId, allQueues, allClientIds);
    if (index < 0) {
        return result;
    }
    long numQueues = allQueues.size();
    long numClients = allClientIds.size();
    long mod = numQueues % numClients;
    long averageSize = 1;
    if (numQueues > numClients) {
        averageSize = ((mod > 0) && (index < mod)) ? (numQueues / numClients + 1) : (numQueues / numClients);
    }
    long startIndex = ((mod > 0) && (index < mod)) ? (index * averageSize) : (index * averageSize + mod);
    long count = std::min(averageSize, numQueues - startIndex);
    for (long i = 0; i < count; ++i) {
        result.push_back(allQueues[(startIndex + i) % numQueues]);
    }
    return result;
}

MessageQueueList AllocateByAveragelyCircle::allocate(const std::string&,
                                                     const std::string& currentClientId,
                                                     const MessageQueueList& allQueues,
                                                     const std::vector<std::string>& allClientIds) const
{
    MessageQueueList result;
    long index = findClient(currentClientId, allQueues, allClientIds);
    if (index < 0) {
        return result;
    }
    long numClients = allClientIds.size();
    for (size_t i = index; i < allQueues.size(); i += numClients) {
        result.push_back(allQueues[i]);
    }
    return result;
}

AllocateByConfig::AllocateByConfig(MessageQueueList queues) :
    _queues(std::move(queues))
{
}

MessageQueueList AllocateByConfig::allocate(const std::string&,
                                            const std::string&,
                                            const MessageQueueList&,
                                            const std::vector<std::string>&) const
{
    return _queues;
}

AllocateStrategy::Ptr allocateByAveragely()
{
    static const AllocateStrategy::Ptr strategy = std::make_shared<AllocateByAveragely>();
    return strategy;
}

AllocateStrategy::Ptr allocateByAveragelyCircle()
{
    static const AllocateStrategy::Ptr strategy = std::make_shared<AllocateByAveragelyCircle>();
    return strategy;
}

AllocateStrategy::Ptr allocateByConfig(MessageQueueList queues)
{
    return std::make_shared<AllocateByConfig>(std::move(queues));
}

}
}
