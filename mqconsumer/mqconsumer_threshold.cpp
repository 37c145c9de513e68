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
#include <mqconsumer/mqconsumer_threshold.h>
#include <mqconsumer/mqconsumer_exception.h>

namespace Rocket {
namespace mqconsumer {

int64_t Threshold::value() const
{
    if (isUnlimited()) {
        throw InvalidArgumentException(0, "Threshold is unlimited");
    }
    return _value;
}

std::ostream& operator<<(std::ostream& stream, const Threshold& threshold)
{
    if (threshold.isUnlimited()) {
        return stream << "unlimited";
    }
    return stream << threshold.value();
}

}
}
