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
#ifndef ROCKET_MQCONSUMER_INTERCEPTOR_H
#define ROCKET_MQCONSUMER_INTERCEPTOR_H

#include <mqconsumer/mqconsumer_message_queue.h>
#include <boost/any.hpp>
#include <functional>
#include <initializer_list>
#include <map>
#include <string>
#include <vector>

namespace Rocket {
namespace mqconsumer {

/**
 * @brief Information about the consumption call being intercepted.
 */
struct ConsumeContext
{
    std::string                         _consumerGroup;
    MessageQueue                        _queue;
    std::map<std::string, std::string>  _properties;
};

/**
 * @brief The real consumption call at the end of the interceptor chain.
 * @remark Errors are reported by throwing.
 */
using Invoker = std::function<void(ConsumeContext& context,
                                   boost::any& request,
                                   boost::any& reply)>;

/**
 * @brief Cross-cutting hook wrapping a consumption call. The interceptor must invoke 'next'
 *        to continue the chain and may act before and after doing so.
 */
using Interceptor = std::function<void(ConsumeContext& context,
                                       boost::any& request,
                                       boost::any& reply,
                                       const Invoker& next)>;

/**
 * @brief Ordered, append-only list of interceptors. The first interceptor appended is the
 *        outer-most wrapper: it observes a call before all others and sees the return last.
 */
class InterceptorChain
{
public:
    using InterceptorList = std::vector<Interceptor>;
    
    InterceptorChain() = default;
    InterceptorChain(std::initializer_list<Interceptor> interceptors);
    
    /**
     * @brief Append an interceptor as the new inner-most wrapper.
     * @param interceptor The interceptor.
     * @throws InvalidArgumentException if the interceptor is empty.
     */
    void append(Interceptor interceptor);
    
    size_t size() const;
    bool empty() const;
    const InterceptorList& interceptors() const;
    
    /**
     * @brief Compose the chain around an invoker.
     * @param invoker The real call.
     * @return An invoker which runs all interceptors in order and finally 'invoker'.
     * @remark The returned invoker holds its own copy of the interceptors. Later changes to
     *         this chain, or its destruction, do not affect it.
     */
    Invoker wrap(Invoker invoker) const;
    
    /**
     * @brief Run the chain for a single call.
     */
    void invoke(ConsumeContext& context,
                boost::any& request,
                boost::any& reply,
                const Invoker& invoker) const;
    
private:
    static void invokeAt(const InterceptorList& interceptors,
                         size_t position,
                         ConsumeContext& context,
                         boost::any& request,
                         boost::any& reply,
                         const Invoker& invoker);
    
    InterceptorList     _interceptors;
};

}
}

#endif //ROCKET_MQCONSUMER_INTERCEPTOR_H
