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
#ifndef ROCKET_MQCONSUMER_SNAPSHOT_H
#define ROCKET_MQCONSUMER_SNAPSHOT_H

#include <quantum/quantum.h>
#include <memory>
#include <utility>

namespace Rocket {
namespace mqconsumer {

/**
 * @brief Copy-on-write cell holding an immutable value. Readers obtain a shared pointer to the
 *        current value and keep it for as long as they need, while writers publish a new value
 *        by replacing the pointer. A reader therefore never observes a partially updated value.
 * @remark Writers are serialized among themselves. Readers only contend for the pointer copy.
 */
template <typename T>
class Snapshot
{
public:
    using ValueType = T;
    using Ptr = std::shared_ptr<const T>;
    
    Snapshot() :
        _value(std::make_shared<const T>())
    {}
    explicit Snapshot(T value) :
        _value(std::make_shared<const T>(std::move(value)))
    {}
    Snapshot(const Snapshot&) = delete;
    Snapshot& operator=(const Snapshot&) = delete;
    
    /**
     * @brief Get the current value.
     * @return A pointer to the current value which remains valid after subsequent updates.
     */
    Ptr get() const
    {
        quantum::Mutex::Guard guard(quantum::local::context(), _valueMutex);
        return _value;
    }
    
    /**
     * @brief Replace the current value.
     * @param value The new value.
     * @return The previous value.
     */
    Ptr set(T value)
    {
        quantum::Mutex::Guard writeGuard(quantum::local::context(), _writeMutex);
        return publish(std::make_shared<const T>(std::move(value)));
    }
    
    /**
     * @brief Atomically compute a new value from the current one and publish it.
     * @param func Callable with signature 'T(const T& current)'.
     * @return The newly published value.
     */
    template <typename FUNC>
    Ptr update(FUNC&& func)
    {
        quantum::Mutex::Guard writeGuard(quantum::local::context(), _writeMutex);
        Ptr next = std::make_shared<const T>(std::forward<FUNC>(func)(*get()));
        publish(next);
        return next;
    }
    
private:
    Ptr publish(Ptr value)
    {
        quantum::Mutex::Guard guard(quantum::local::context(), _valueMutex);
        _value.swap(value);
        return value;
    }
    
    mutable quantum::Mutex  _valueMutex;
    quantum::Mutex          _writeMutex;
    Ptr                     _value;
};

}
}

#endif //ROCKET_MQCONSUMER_SNAPSHOT_H
