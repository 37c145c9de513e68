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
#ifndef ROCKET_MQCONSUMER_ALLOCATE_STRATEGY_H
#define ROCKET_MQCONSUMER_ALLOCATE_STRATEGY_H

#include <mqconsumer/mqconsumer_message_queue.h>
#include <memory>
#include <string>
#include <vector>

namespace Rocket {
namespace mqconsumer {

/**
 * @brief Distributes the queues of a topic among the consumers of a group. Invoked by the rebalance
 *        component, which is expected to pass 'allQueues' and 'allClientIds' in the same (sorted) order
 *        on every consumer of the group.
 */
struct AllocateStrategy
{
    using Ptr = std::shared_ptr<const AllocateStrategy>;
    virtual ~AllocateStrategy() = default;
    
    /**
     * @brief Name of this strategy.
     */
    virtual const char* name() const noexcept = 0;
    
    /**
     * @brief Compute the queues owned by a consumer.
     * @param consumerGroup The consumer group.
     * @param currentClientId The id of the consumer doing the allocation.
     * @param allQueues All the queues of the topic.
     * @param allClientIds All the consumers in the group.
     * @return The queues assigned to 'currentClientId'. Empty if any input is empty or if the
     *         client is not part of the group.
     */
    virtual MessageQueueList allocate(const std::string& consumerGroup,
                                      const std::string& currentClientId,
                                      const MessageQueueList& allQueues,
                                      const std::vector<std::string>& allClientIds) const = 0;
};

/**
 * @brief Assigns contiguous blocks of queues. The first 'numQueues % numClients' clients receive one extra queue.
 */
class AllocateByAveragely : public AllocateStrategy
{
public:
    const char* name() const noexcept final { return "averagely"; }
    MessageQueueList allocate(const std::string& consumerGroup,
                              const std::string& currentClientId,
                              const MessageQueueList& allQueues,
                              const std::vector<std::string>& allClientIds) const final;
};

/**
 * @brief Assigns queues in round-robin fashion.
 */
class AllocateByAveragelyCircle : public AllocateStrategy
{
public:
    const char* name() const noexcept final { return "averagely.circle"; }
    MessageQueueList allocate(const std::string& consumerGroup,
                              const std::string& currentClientId,
                              const MessageQueueList& allQueues,
                              const std::vector<std::string>& allClientIds) const final;
};

/**
 * @brief Always returns a fixed list of queues, regardless of the group membership.
 */
class AllocateByConfig : public AllocateStrategy
{
public:
    explicit AllocateByConfig(MessageQueueList queues);
    const char* name() const noexcept final { return "config"; }
    MessageQueueList allocate(const std::string& consumerGroup,
                              const std::string& currentClientId,
                              const MessageQueueList& allQueues,
                              const std::vector<std::string>& allClientIds) const final;
private:
    MessageQueueList _queues;
};

AllocateStrategy::Ptr allocateByAveragely();
AllocateStrategy::Ptr allocateByAveragelyCircle();
AllocateStrategy::Ptr allocateByConfig(MessageQueueList queues);

}
}

#endif //ROCKET_MQCONSUMER_ALLOCATE_STRATEGY_H
