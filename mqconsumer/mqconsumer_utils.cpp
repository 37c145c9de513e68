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
#include <mqconsumer/mqconsumer_utils.h>
#include <cstring>
#include <ctime>

namespace Rocket {
namespace mqconsumer {

const char* toString(ConsumerModel model)
{
    switch (model) {
        case ConsumerModel::Clustering: return "clustering";
        case ConsumerModel::Broadcasting: return "broadcasting";
        default: return "unset";
    }
}

const char* toString(ConsumeFromWhere fromWhere)
{
    switch (fromWhere) {
        case ConsumeFromWhere::FirstOffset: return "first";
        case ConsumeFromWhere::Timestamp: return "timestamp";
        default: return "last";
    }
}

const char* toString(FlowControlStatus status)
{
    switch (status) {
        case FlowControlStatus::CountExceeded: return "countExceeded";
        case FlowControlStatus::SizeExceeded: return "sizeExceeded";
        case FlowControlStatus::SpanExceeded: return "spanExceeded";
        default: return "proceed";
    }
}

const char* toString(cppkafka::LogLevel level)
{
    switch (level) {
        case cppkafka::LogLevel::LogEmerg: return "emergency";
        case cppkafka::LogLevel::LogAlert: return "alert";
        case cppkafka::LogLevel::LogCrit: return "critical";
        case cppkafka::LogLevel::LogErr: return "error";
        case cppkafka::LogLevel::LogWarning: return "warning";
        case cppkafka::LogLevel::LogNotice: return "notice";
        case cppkafka::LogLevel::LogInfo: return "info";
        default: return "debug";
    }
}

std::ostream& operator<<(std::ostream& stream, ConsumerModel model)
{
    return stream << toString(model);
}

std::ostream& operator<<(std::ostream& stream, ConsumeFromWhere fromWhere)
{
    return stream << toString(fromWhere);
}

std::ostream& operator<<(std::ostream& stream, FlowControlStatus status)
{
    return stream << toString(status);
}

std::vector<std::string> split(const std::string& str, const char* delimiters)
{
    std::vector<std::string> tokens;
    std::string::size_type begin = 0;
    while (begin <= str.size()) {
        std::string::size_type end = str.find_first_of(delimiters, begin);
        if (end == std::string::npos) {
            end = str.size();
        }
        std::string token = str.substr(begin, end - begin);
        trim(token);
        if (!token.empty()) {
            tokens.emplace_back(std::move(token));
        }
        begin = end + 1;
    }
    return tokens;
}

bool isValidConsumeTimestamp(const std::string& timestamp)
{
    static const int daysInMonth[] = {31, 29, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (timestamp.size() != 14) {
        return false;
    }
    if (!std::all_of(timestamp.begin(), timestamp.end(), [](unsigned char c)->bool { return std::isdigit(c); })) {
        return false;
    }
    auto field = [&timestamp](size_t pos, size_t len)->int {
        return std::stoi(timestamp.substr(pos, len));
    };
    int year = field(0, 4);
    int month = field(4, 2);
    int day = field(6, 2);
    if ((month < 1) || (month > 12) || (day < 1) || (day > daysInMonth[month - 1])) {
        return false;
    }
    bool leap = ((year % 4 == 0) && (year % 100 != 0)) || (year % 400 == 0);
    if ((month == 2) && (day == 29) && !leap) {
        return false;
    }
    return (field(8, 2) < 24) && (field(10, 2) < 60) && (field(12, 2) < 60);
}

std::string formatConsumeTimestamp(std::chrono::system_clock::time_point timePoint)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timePoint);
    std::tm local;
    std::memset(&local, 0, sizeof(local));
    localtime_r(&time, &local);
    char buf[16] = {0};
    std::strftime(buf, sizeof(buf), "%Y%m%d%H%M%S", &local);
    return buf;
}

}
}
