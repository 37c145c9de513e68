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
#ifndef ROCKET_MQCONSUMER_CALLBACKS_H
#define ROCKET_MQCONSUMER_CALLBACKS_H

#include <mqconsumer/mqconsumer_utils.h>
#include <mqconsumer/mqconsumer_message_queue.h>
#include <mqconsumer/mqconsumer_queue_thresholds.h>
#include <chrono>
#include <functional>
#include <string>

namespace Rocket {
namespace mqconsumer {

struct Callbacks {
    /**
     * @brief Callback for logging events internal to this library. Messages are filtered
     *        by the log level configured in the consumer options.
     */
    using LogCallback = std::function<void(cppkafka::LogLevel level,
                                           const std::string& facility,
                                           const std::string& message)>;
    
    /**
     * @brief Callback which notifies the application each time pulling on a queue is suspended
     *        because its cache exceeds one of the per-queue thresholds. This is purely informational.
     */
    using FlowControlCallback = std::function<void(const MessageQueue& queue,
                                                   FlowControlStatus status,
                                                   std::chrono::milliseconds suspendTime)>;
    
    /**
     * @brief Callback invoked when the per-queue thresholds of a topic change following
     *        a change in the number of assigned queues.
     */
    using ThresholdCallback = std::function<void(const std::string& topic,
                                                 size_t numQueues,
                                                 const QueueThresholds& thresholds)>;
};

}}

#endif //ROCKET_MQCONSUMER_CALLBACKS_H
