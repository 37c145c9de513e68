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
#include <mqconsumer/mqconsumer_client_options.h>

namespace Rocket {
namespace mqconsumer {

//========================================================================
//                           CLIENT OPTIONS
//========================================================================
ClientOptions ClientOptions::defaults()
{
    ClientOptions options;
    options._instanceName = DefaultInstanceName;
    options._retryTimes = DefaultRetryTimes;
    return options;
}

const std::string& ClientOptions::getGroupName() const
{
    return _groupName;
}

const std::vector<std::string>& ClientOptions::getNameServerAddrs() const
{
    return _nameServerAddrs;
}

const std::string& ClientOptions::getInstanceName() const
{
    return _instanceName;
}

const std::string& ClientOptions::getNamespace() const
{
    return _namespace;
}

const Credentials& ClientOptions::getCredentials() const
{
    return _credentials;
}

bool ClientOptions::isAclEnabled() const
{
    return _aclEnabled;
}

bool ClientOptions::isVipChannelEnabled() const
{
    return _vipChannelEnabled;
}

int ClientOptions::getRetryTimes() const
{
    return _retryTimes;
}

void ClientOptions::dump(JsonBuilder& json) const
{
    json.tag("groupName", _groupName);
    json.startMember("nameServerAddrs", JsonBuilder::Array::True);
    for (const auto& address : _nameServerAddrs) {
        json.value(address);
    }
    json.endMember();
    //never output the secret key
    json.tag("instanceName", _instanceName).
        tag("namespace", _namespace).
        tag("accessKey", _credentials._accessKey).
        tag("aclEnabled", _aclEnabled).
        tag("vipChannelEnabled", _vipChannelEnabled).
        tag("retryTimes", _retryTimes);
}

}
}
