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
#include <mqconsumer/mqconsumer_configuration.h>
#include <mqconsumer/mqconsumer_exception.h>
#include <algorithm>
#include <sstream>

namespace Rocket {
namespace mqconsumer {

//========================================================================
//                             CONFIGURATION
//========================================================================
Configuration::Configuration(OptionList options) :
    _options(std::move(options))
{
}

Configuration::Configuration(OptionInitList options) :
    _options(options)
{
}

const Configuration::OptionList& Configuration::getOptions() const
{
    return _options;
}

const cppkafka::ConfigurationOption* Configuration::getOption(const std::string& name) const
{
    return findOption(name, _options);
}

const cppkafka::ConfigurationOption* Configuration::findOption(const std::string& name,
                                                               const OptionList& config)
{
    const auto it = std::find_if(config.cbegin(), config.cend(),
                                 [&name](const cppkafka::ConfigurationOption& config)->bool {
        return StringEqualCompare()(config.get_key(), name);
    });
    if (it != config.cend()) {
        return &*it;
    }
    return nullptr;
}

void Configuration::parseOptions(const OptionMap& allowed,
                                 OptionList& optionList)
{
    for (auto optionIt = optionList.begin(); optionIt != optionList.end(); ++optionIt) {
        auto& option = *optionIt;
        trim(const_cast<std::string&>(option.get_key()));
        if (option.get_key().empty()) {
            throw InvalidOptionException("unknown", "Name is empty");
        }
        const auto duplicate = std::find_if(optionList.begin(), optionIt,
                                            [&option](const cppkafka::ConfigurationOption& previous)->bool {
            return StringEqualCompare()(previous.get_key(), option.get_key());
        });
        if (duplicate != optionIt) {
            throw InvalidOptionException(option.get_key(), "Duplicate option");
        }
        trim(const_cast<std::string&>(option.get_value()));
        if (option.get_value().empty()) {
            throw InvalidOptionException(option.get_key(), "Value is empty");
        }
        const auto it = allowed.find(option.get_key());
        if (it == allowed.end()) {
            throw InvalidOptionException(option.get_key(), "Option not found");
        }
        //validate
        it->second(&option, nullptr);
    }
}

bool Configuration::extractBooleanValue(const char* optionName,
                                        const cppkafka::ConfigurationOption& option)
{
    if (StringEqualCompare()(option.get_value(), "true")) {
        return true;
    }
    else if (StringEqualCompare()(option.get_value(), "false")) {
        return false;
    }
    throw InvalidOptionException(optionName, option.get_value());
}

int64_t Configuration::extractCounterValue(const char* optionName,
                                           const cppkafka::ConfigurationOption& option,
                                           int64_t minAllowed,
                                           int64_t maxAllowed)
{
    int64_t value{0};
    size_t pos{0};
    try {
        value = std::stoll(option.get_value(), &pos);
    }
    catch (const std::invalid_argument& ex) {
        throw InvalidOptionException(optionName, option.get_value());
    }
    catch (const std::out_of_range& ex) {
        throw InvalidOptionException(optionName, option.get_value());
    }
    if (pos != option.get_value().size()) {
        //trailing characters
        throw InvalidOptionException(optionName, option.get_value());
    }
    if ((value < minAllowed) || (value > maxAllowed)) {
        std::ostringstream reason;
        reason << "Allowed values are in the range: [" << minAllowed << ", " << maxAllowed << "]";
        throw InvalidOptionException(optionName, reason.str());
    }
    return value;
}

cppkafka::LogLevel Configuration::extractLogLevel(const char* optionName,
                                                  const std::string& level)
{
    StringEqualCompare compare;
    if (compare(level, "emergency")) {
        return cppkafka::LogLevel::LogEmerg;
    }
    if (compare(level, "alert")) {
        return cppkafka::LogLevel::LogAlert;
    }
    if (compare(level, "critical")) {
        return cppkafka::LogLevel::LogCrit;
    }
    if (compare(level, "error")) {
        return cppkafka::LogLevel::LogErr;
    }
    if (compare(level, "warning")) {
        return cppkafka::LogLevel::LogWarning;
    }
    if (compare(level, "notice")) {
        return cppkafka::LogLevel::LogNotice;
    }
    if (compare(level, "info")) {
        return cppkafka::LogLevel::LogInfo;
    }
    if (compare(level, "debug")) {
        return cppkafka::LogLevel::LogDebug;
    }
    throw InvalidOptionException(optionName, level);
}

std::vector<std::string> Configuration::extractListValue(const char* optionName,
                                                         const cppkafka::ConfigurationOption& option)
{
    std::vector<std::string> values = split(option.get_value(), ";,");
    if (values.empty()) {
        throw InvalidOptionException(optionName, option.get_value());
    }
    return values;
}

}
}
