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
#ifndef ROCKET_MQCONSUMER_CLIENT_OPTIONS_H
#define ROCKET_MQCONSUMER_CLIENT_OPTIONS_H

#include <mqconsumer/mqconsumer_utils.h>
#include <string>
#include <vector>

namespace Rocket {
namespace mqconsumer {

/**
 * @brief Keys used to sign requests when ACL is enabled on the brokers.
 */
struct Credentials
{
    std::string     _accessKey;
    std::string     _secretKey;
    std::string     _securityToken;
    
    bool empty() const { return _accessKey.empty() || _secretKey.empty(); }
};

//========================================================================
//                           CLIENT OPTIONS
//========================================================================
/**
 * @brief Identity and connection settings shared by all clients (consumers and producers).
 */
class ClientOptions
{
public:
    static constexpr const char* DefaultInstanceName = "DEFAULT";
    static constexpr int DefaultRetryTimes = 3;
    
    /**
     * @brief Creates an empty set of client options. No defaults are applied.
     */
    ClientOptions() = default;
    
    /**
     * @brief Creates the default client options.
     * @return The options.
     */
    static ClientOptions defaults();
    
    const std::string& getGroupName() const;
    const std::vector<std::string>& getNameServerAddrs() const;
    const std::string& getInstanceName() const;
    const std::string& getNamespace() const;
    const Credentials& getCredentials() const;
    bool isAclEnabled() const;
    bool isVipChannelEnabled() const;
    int getRetryTimes() const;
    
protected:
    friend class ConsumerOptionsBuilder;
    
    void dump(JsonBuilder& json) const;
    
    std::string                 _groupName;
    std::vector<std::string>    _nameServerAddrs;
    std::string                 _instanceName;
    std::string                 _namespace;
    Credentials                 _credentials;
    bool                        _aclEnabled{false};
    bool                        _vipChannelEnabled{false};
    int                         _retryTimes{0};
};

}
}

#endif //ROCKET_MQCONSUMER_CLIENT_OPTIONS_H
