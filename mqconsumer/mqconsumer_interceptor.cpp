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
#include <mqconsumer/mqconsumer_interceptor.h>
#include <mqconsumer/mqconsumer_exception.h>
#include <memory>

namespace Rocket {
namespace mqconsumer {

InterceptorChain::InterceptorChain(std::initializer_list<Interceptor> interceptors)
{
    for (const auto& interceptor : interceptors) {
        append(interceptor);
    }
}

void InterceptorChain::append(Interceptor interceptor)
{
    if (!interceptor) {
        throw InvalidArgumentException(0, "Interceptor is empty");
    }
    _interceptors.emplace_back(std::move(interceptor));
}

size_t InterceptorChain::size() const
{
    return _interceptors.size();
}

bool InterceptorChain::empty() const
{
    return _interceptors.empty();
}

const InterceptorChain::InterceptorList& InterceptorChain::interceptors() const
{
    return _interceptors;
}

Invoker InterceptorChain::wrap(Invoker invoker) const
{
    if (!invoker) {
        throw InvalidArgumentException(0, "Invoker is empty");
    }
    if (_interceptors.empty()) {
        return invoker;
    }
    auto interceptors = std::make_shared<const InterceptorList>(_interceptors);
    return [interceptors, invoker = std::move(invoker)](ConsumeContext& context,
                                                        boost::any& request,
                                                        boost::any& reply) {
        invokeAt(*interceptors, 0, context, request, reply, invoker);
    };
}

void InterceptorChain::invoke(ConsumeContext& context,
                              boost::any& request,
                              boost::any& reply,
                              const Invoker& invoker) const
{
    if (!invoker) {
        throw InvalidArgumentException(3, "Invoker is empty");
    }
    invokeAt(_interceptors, 0, context, request, reply, invoker);
}

void InterceptorChain::invokeAt(const InterceptorList& interceptors,
                                size_t position,
                                ConsumeContext& context,
                                boost::any& request,
                                boost::any& reply,
                                const Invoker& invoker)
{
    if (position == interceptors.size()) {
        invoker(context, request, reply);
        return;
    }
    Invoker next = [&interceptors, position, &invoker](ConsumeContext& ctx,
                                                       boost::any& req,
                                                       boost::any& rep) {
        invokeAt(interceptors, position + 1, ctx, req, rep, invoker);
    };
    interceptors[position](context, request, reply, next);
}

}
}
