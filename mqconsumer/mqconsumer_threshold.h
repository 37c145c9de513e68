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
#ifndef ROCKET_MQCONSUMER_THRESHOLD_H
#define ROCKET_MQCONSUMER_THRESHOLD_H

#include <mqconsumer/mqconsumer_utils.h>
#include <cstdint>
#include <ostream>

namespace Rocket {
namespace mqconsumer {

/**
 * @brief A cache limit which is either unlimited or limited to a strictly positive value.
 * @remark Legacy configuration encodes 'unlimited' as any value <= 0. Use fromLegacy() and toLegacy()
 *         to convert at the boundary.
 */
class Threshold
{
public:
    /**
     * @brief Creates an unlimited threshold.
     */
    Threshold() = default;
    
    static Threshold unlimited() { return Threshold(); }
    
    /**
     * @brief Creates a limited threshold.
     * @param value The limit. Non-positive values produce an unlimited threshold.
     */
    static Threshold limited(int64_t value) { return Threshold(value); }
    
    static Threshold fromLegacy(int64_t value) { return Threshold(value); }
    
    /**
     * @brief Legacy encoding of this threshold.
     * @return The limit or -1 if unlimited.
     */
    int64_t toLegacy() const { return isLimited() ? _value : EnumValue(SizeLimits::Unlimited); }
    
    bool isLimited() const { return _value > 0; }
    bool isUnlimited() const { return !isLimited(); }
    
    /**
     * @brief Get the limit.
     * @return The limit.
     * @throws InvalidArgumentException if the threshold is unlimited.
     */
    int64_t value() const;
    
    bool operator==(const Threshold& other) const { return toLegacy() == other.toLegacy(); }
    bool operator!=(const Threshold& other) const { return !(*this == other); }
    
private:
    explicit Threshold(int64_t value) : _value(value > 0 ? value : EnumValue(SizeLimits::Unlimited)) {}
    
    int64_t _value{EnumValue(SizeLimits::Unlimited)};
};

std::ostream& operator<<(std::ostream& stream, const Threshold& threshold);

}
}

#endif //ROCKET_MQCONSUMER_THRESHOLD_H
