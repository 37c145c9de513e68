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
#ifndef ROCKET_MQCONSUMER_JSON_BUILDER_H
#define ROCKET_MQCONSUMER_JSON_BUILDER_H

#include <chrono>
#include <ostream>
#include <string>
#include <type_traits>
#include <vector>

namespace Rocket {
namespace mqconsumer {

/**
 * @brief Minimal streaming JSON writer used for exception descriptions and for
 *        dumping configuration objects to the log callback.
 * @note The root object is opened on construction and closed either by end() or by the destructor.
 */
class JsonBuilder
{
public:
    enum class Array { False, True };
    
    explicit JsonBuilder(std::ostream& oss) : _ostream(oss)
    {
        _ostream << "{";
    }
    ~JsonBuilder()
    {
        end();
    }
    JsonBuilder(const JsonBuilder&) = delete;
    JsonBuilder& operator=(const JsonBuilder&) = delete;
    
    JsonBuilder& startMember(const char* name,
                             Array isArray = Array::False)
    {
        separator();
        writeKey(name);
        return open(isArray);
    }
    // Anonymous member, used for elements of an array
    JsonBuilder& startMember(Array isArray = Array::False)
    {
        separator();
        return open(isArray);
    }
    JsonBuilder& endMember()
    {
        if (!_levels.empty()) {
            _ostream << (_levels.back()._isArray ? "]" : "}");
            _levels.pop_back();
        }
        return *this;
    }
    JsonBuilder& tag(const char* name,
                     const char* value)
    {
        separator();
        writeKey(name);
        writeString(value ? value : "");
        return *this;
    }
    JsonBuilder& tag(const char* name,
                     const std::string& value)
    {
        return tag(name, value.c_str());
    }
    JsonBuilder& tag(const char* name,
                     bool value)
    {
        separator();
        writeKey(name);
        _ostream << (value ? "true" : "false");
        return *this;
    }
    template <typename T, std::enable_if_t<std::is_arithmetic<T>::value && !std::is_same<T, bool>::value, int> = 0>
    JsonBuilder& tag(const char* name,
                     T value)
    {
        separator();
        writeKey(name);
        _ostream << +value;
        return *this;
    }
    template <typename REP, typename PERIOD>
    JsonBuilder& tag(const char* name,
                     const std::chrono::duration<REP, PERIOD>& value)
    {
        return tag(name, std::chrono::duration_cast<std::chrono::milliseconds>(value).count());
    }
    // Array element (string)
    JsonBuilder& value(const std::string& value)
    {
        separator();
        writeString(value.c_str());
        return *this;
    }
    // Raw tags assume the value is already JSON-formatted
    template <typename T>
    JsonBuilder& rawTag(const char* name,
                        const T& value)
    {
        separator();
        writeKey(name);
        _ostream << value;
        return *this;
    }
    // Closes any open members as well as the root object
    JsonBuilder& end()
    {
        if (!_closed) {
            while (!_levels.empty()) {
                endMember();
            }
            _ostream << "}";
            _closed = true;
        }
        return *this;
    }
    
private:
    struct Level
    {
        bool    _firstField{true};
        bool    _isArray{false};
    };
    JsonBuilder& open(Array isArray)
    {
        _levels.push_back({true, isArray == Array::True});
        _ostream << (_levels.back()._isArray ? "[" : "{");
        return *this;
    }
    void separator()
    {
        bool& first = _levels.empty() ? _rootFirstField : _levels.back()._firstField;
        if (first) {
            first = false;
        }
        else {
            _ostream << ",";
        }
    }
    void writeKey(const char* name)
    {
        writeString(name);
        _ostream << ":";
    }
    void writeString(const char* str)
    {
        _ostream << "\"";
        for (const char* c = str; *c; ++c) {
            switch (*c) {
                case '"':  _ostream << "\\\""; break;
                case '\\': _ostream << "\\\\"; break;
                case '\n': _ostream << "\\n"; break;
                case '\t': _ostream << "\\t"; break;
                case '\r': _ostream << "\\r"; break;
                case '\b': _ostream << "\\b"; break;
                case '\f': _ostream << "\\f"; break;
                default:
                    if (static_cast<unsigned char>(*c) < 0x20) {
                        static const char hex[] = "0123456789abcdef";
                        _ostream << "\\u00" << hex[(*c >> 4) & 0x0f] << hex[*c & 0x0f];
                    }
                    else {
                        _ostream << *c;
                    }
            }
        }
        _ostream << "\"";
    }
    
    std::ostream&       _ostream;
    std::vector<Level>  _levels;
    bool                _rootFirstField{true};
    bool                _closed{false};
};

}
}

#endif //ROCKET_MQCONSUMER_JSON_BUILDER_H
