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
#ifndef ROCKET_MQCONSUMER_UTILS_H
#define ROCKET_MQCONSUMER_UTILS_H

#include <mqconsumer/utils/mqconsumer_json_builder.h>
#include <cppkafka/cppkafka.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ostream>
#include <string>
#include <type_traits>
#include <vector>

namespace Rocket {
namespace mqconsumer {

enum class ConsumerModel : char
{
    Unset,          ///< Not configured. Rejected when building the options.
    Clustering,     ///< Queues are shared among all consumers of a group
    Broadcasting    ///< Every consumer of a group receives all messages
};
enum class ConsumeFromWhere : char
{
    LastOffset,     ///< Start from the end of the queue
    FirstOffset,    ///< Start from the earliest retained message
    Timestamp       ///< Start from the offset matching the consume timestamp
};
enum class SizeLimits : char
{
    Unlimited = -1  ///< Unlimited size or unbounded
};
enum class ReconsumeLimits : char
{
    Default = -1    ///< Use the library default number of re-consumptions
};
enum class FlowControlStatus : char
{
    Proceed = 0,    ///< Pulling may continue
    CountExceeded,  ///< Too many messages cached for this queue
    SizeExceeded,   ///< Too many bytes cached for this queue
    SpanExceeded    ///< Offset span of cached messages too wide (concurrent consumption only)
};

template <typename Enum>
constexpr auto EnumValue(Enum e) noexcept
{
    return static_cast<std::underlying_type_t<Enum>>(e);
}

const char* toString(ConsumerModel model);
const char* toString(ConsumeFromWhere fromWhere);
const char* toString(FlowControlStatus status);
const char* toString(cppkafka::LogLevel level);

std::ostream& operator<<(std::ostream& stream, ConsumerModel model);
std::ostream& operator<<(std::ostream& stream, ConsumeFromWhere fromWhere);
std::ostream& operator<<(std::ostream& stream, FlowControlStatus status);

//======================================================================================================================
//                                               String comparisons
//======================================================================================================================
struct StringLessCompare
{
    struct CharLessCompare
    {
        bool operator()(unsigned char c1, unsigned char c2) const
        {
            return std::tolower(c1) < std::tolower(c2);
        }
    };
    
    bool operator()(const std::string &s1, const std::string &s2) const
    {
        return std::lexicographical_compare(s1.begin(), s1.end(), s2.begin(), s2.end(), CharLessCompare());
    }
};

struct StringEqualCompare
{
    struct CharEqualCompare
    {
        bool operator()(unsigned char c1, unsigned char c2) const
        {
            return std::tolower(c1) == std::tolower(c2);
        }
    };
    
    bool operator()(const std::string &s1, const std::string &s2) const
    {
        return std::equal(s1.begin(), s1.end(), s2.begin(), s2.end(), CharEqualCompare());
    }
    
    // Compare the first 'n' characters
    bool operator()(const std::string &s1, const std::string &s2, size_t num) const
    {
        if ((s1.size() < num) || (s2.size() < num)) {
            return false;
        }
        return std::equal(s1.begin(), s1.begin() + num, s2.begin(), s2.begin() + num, CharEqualCompare());
    }
};

// Trim whitespaces at both ends
inline void trim(std::string& str)
{
    str.erase(str.begin(), std::find_if(str.begin(), str.end(), [](unsigned char c)->bool {
        return !std::isspace(c);
    }));
    str.erase(std::find_if(str.rbegin(), str.rend(), [](unsigned char c)->bool {
        return !std::isspace(c);
    }).base(), str.end());
}

/**
 * @brief Split a string on any of the delimiter characters. Tokens are trimmed and empty tokens are dropped.
 */
std::vector<std::string> split(const std::string& str, const char* delimiters);

/**
 * @brief Check that a consume timestamp has the 'YYYYMMDDHHmmss' layout and represents a valid calendar time.
 */
bool isValidConsumeTimestamp(const std::string& timestamp);

/**
 * @brief Format a point in time as a consume timestamp ('YYYYMMDDHHmmss', local time).
 */
std::string formatConsumeTimestamp(std::chrono::system_clock::time_point timePoint);

} //namespace mqconsumer
} //namespace Rocket

#endif //ROCKET_MQCONSUMER_UTILS_H
