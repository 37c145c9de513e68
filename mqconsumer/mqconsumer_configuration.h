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
#ifndef ROCKET_MQCONSUMER_CONFIGURATION_H
#define ROCKET_MQCONSUMER_CONFIGURATION_H

#include <mqconsumer/mqconsumer_utils.h>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <limits>
#include <map>
#include <string>
#include <vector>

namespace Rocket {
namespace mqconsumer {

//========================================================================
//                           CONFIGURATION
//========================================================================
class Configuration
{
public:
    using OptionList = std::vector<cppkafka::ConfigurationOption>;
    using OptionInitList = std::initializer_list<cppkafka::ConfigurationOption>;
    
    /**
     * @brief Gets the value for a specific configuration.
     * @param name The name of the configuration option.
     * @return A pointer to the configuration object or null if it's not found.
     */
    const cppkafka::ConfigurationOption* getOption(const std::string& name) const;
    
    /**
     * @brief Get the options list.
     * @return The configuration options.
     */
    const OptionList& getOptions() const;
    
protected:
    using OptionExtractorFunc = std::function<bool(const cppkafka::ConfigurationOption*, void*)>;
    using OptionMap = std::map<std::string, OptionExtractorFunc, StringLessCompare>;
    
    Configuration() = default;
    Configuration(OptionList options);
    Configuration(OptionInitList options);
    virtual ~Configuration() = default;
    
    static const cppkafka::ConfigurationOption* findOption(const std::string& name,
                                                           const OptionList& config);
    /**
     * @brief Trim and validate every option against the allowed set.
     * @throws InvalidOptionException if an option is unknown, has an empty name or value, or fails validation.
     */
    static void parseOptions(const OptionMap& allowed,
                             OptionList& optionList);
    
    static bool extractBooleanValue(const char* optionName,
                                    const cppkafka::ConfigurationOption& option);
    static int64_t extractCounterValue(const char* optionName,
                                       const cppkafka::ConfigurationOption& option,
                                       int64_t minAllowed = 0,
                                       int64_t maxAllowed = std::numeric_limits<int64_t>::max());
    static cppkafka::LogLevel extractLogLevel(const char* optionName,
                                              const std::string &level);
    static std::vector<std::string> extractListValue(const char* optionName,
                                                     const cppkafka::ConfigurationOption& option);
    // Members
    OptionList  _options;
};

} // mqconsumer
} // Rocket

#endif //ROCKET_MQCONSUMER_CONFIGURATION_H
