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
#include <mqconsumer/mqconsumer_message_queue.h>

namespace Rocket {
namespace mqconsumer {

std::ostream& operator<<(std::ostream& stream, const MessageQueue& queue)
{
    JsonBuilder json(stream);
    json.startMember("messageQueue").
        tag("topic", queue._topic).
        tag("brokerName", queue._brokerName).
        tag("queueId", queue._queueId).
        endMember().end();
    return stream;
}

}
}
