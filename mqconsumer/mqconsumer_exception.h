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
#ifndef ROCKET_MQCONSUMER_EXCEPTION_H
#define ROCKET_MQCONSUMER_EXCEPTION_H

#include <mqconsumer/utils/mqconsumer_json_builder.h>
#include <stdexcept>
#include <sstream>
#include <string>
#include <vector>

namespace Rocket {
namespace mqconsumer {

//=========================================================================================
//                                 Exception
//=========================================================================================
struct Exception : public std::runtime_error
{
    using std::runtime_error::runtime_error;

    const char* what() const noexcept override
    {
        if (_what.empty()) {
            std::ostringstream oss;
            JsonBuilder json(oss);
            json.startMember(name()).
                tag("reason", std::runtime_error::what()).
                endMember().end();
            _what = oss.str();
        }
        return _what.c_str();
    }
    virtual const char* name() const noexcept
    {
        return "Exception";
    }
protected:
    mutable std::string _what;
};

//=========================================================================================
//                                 ConfigurationException
//=========================================================================================
struct ConfigurationException : public Exception
{
    using Exception::Exception;
    const char* name() const noexcept override
    {
        return "ConfigurationException";
    }
};

//=========================================================================================
//                                 InvalidArgumentException
//=========================================================================================
struct InvalidArgumentException : public Exception
{
    InvalidArgumentException(size_t argument,
                             const std::string& reason) :
        Exception(reason),
        _argument(argument)
    {
    }
    const char* what() const noexcept override
    {
        if (_what.empty()) {
            std::ostringstream oss;
            JsonBuilder json(oss);
            json.startMember(name()).
                tag("argument", argument()).
                tag("reason", std::runtime_error::what()).
                endMember().end();
            _what = oss.str();
        }
        return _what.c_str();
    }
    const char* name() const noexcept override
    {
        return "InvalidArgumentException";
    }
    size_t argument() const { return _argument; }
private:
    size_t  _argument;
};

//=========================================================================================
//                                 InvalidOptionException
//=========================================================================================
struct InvalidOptionException : public ConfigurationException
{
    InvalidOptionException(const std::string& option,
                           const std::string& reason) :
        ConfigurationException(reason),
        _option(option)
    {}
    const char* what() const noexcept override
    {
        if (_what.empty()) {
            std::ostringstream oss;
            JsonBuilder json(oss);
            json.startMember(name()).
                tag("option", option()).
                tag("reason", std::runtime_error::what()).
                endMember().end();
            _what = oss.str();
        }
        return _what.c_str();
    }
    const char* option() const noexcept
    {
        return _option.c_str();
    }
    const char* name() const noexcept override
    {
        return "InvalidOptionException";
    }
private:
    std::string _option;
};

//=========================================================================================
//                                 InvalidCombinationException
//=========================================================================================
/**
 * @brief Raised once when finalizing consumer options. Contains every problem found
 *        in the assembled configuration rather than only the first one.
 */
struct InvalidCombinationException : public ConfigurationException
{
    struct Violation
    {
        std::string _option;
        std::string _reason;
    };
    using ViolationList = std::vector<Violation>;
    
    explicit InvalidCombinationException(ViolationList violations) :
        ConfigurationException("Invalid consumer options"),
        _violations(std::move(violations))
    {}
    const char* what() const noexcept override
    {
        if (_what.empty()) {
            std::ostringstream oss;
            JsonBuilder json(oss);
            json.startMember(name()).
                tag("reason", std::runtime_error::what()).
                startMember("violations", JsonBuilder::Array::True);
            for (const auto& violation : _violations) {
                json.startMember().
                    tag("option", violation._option).
                    tag("reason", violation._reason).
                    endMember();
            }
            json.endMember().endMember().end();
            _what = oss.str();
        }
        return _what.c_str();
    }
    const char* name() const noexcept override
    {
        return "InvalidCombinationException";
    }
    const ViolationList& violations() const noexcept
    {
        return _violations;
    }
    bool hasViolation(const std::string& option) const noexcept
    {
        for (const auto& violation : _violations) {
            if (violation._option == option) {
                return true;
            }
        }
        return false;
    }
private:
    ViolationList _violations;
};

}
}

#endif //ROCKET_MQCONSUMER_EXCEPTION_H
