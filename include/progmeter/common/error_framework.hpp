#pragma once

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace progmeter {
namespace common {

template<typename EnumType>
struct ErrorInfo {
    EnumType code;
    const char* code_str;
    const char* default_message;
};

// Where an error was raised plus the offending values, kept in the order
// they were added so messages read field before value.
struct ErrorContext {
    std::string component;
    std::vector<std::pair<std::string, std::string>> details;
    
    ErrorContext& with(std::string key, std::string value) {
        details.emplace_back(std::move(key), std::move(value));
        return *this;
    }
    
    // Empty when the key was never added.
    std::string detail(const std::string& key) const {
        for (const auto& entry : details) {
            if (entry.first == key) return entry.second;
        }
        return std::string();
    }
};

// "component=Config | field=bar_width | value=0"
inline std::string formatContext(const ErrorContext& ctx) {
    std::string result;
    if (!ctx.component.empty()) {
        result = "component=" + ctx.component;
    }
    for (const auto& entry : ctx.details) {
        if (!result.empty()) {
            result += " | ";
        }
        result += entry.first + "=" + entry.second;
    }
    return result;
}

// Per-enum table of code strings and default messages. Each enum provides
// a getInfoMap() specialization next to its declaration.
template<typename EnumType>
class ErrorRegistry {
public:
    static const ErrorInfo<EnumType>& getInfo(EnumType code) {
        const auto& map = getInfoMap();
        auto it = map.find(code);
        if (it != map.end()) {
            return it->second;
        }
        static const ErrorInfo<EnumType> unknown{code, "UNKNOWN", "Unknown error"};
        return unknown;
    }
    
    static const char* toString(EnumType code) { return getInfo(code).code_str; }
    static const char* getMessage(EnumType code) { return getInfo(code).default_message; }
    
    // "CODE: default message | component=... | key=value"
    static std::string describe(EnumType code, const ErrorContext& ctx) {
        const auto& info = getInfo(code);
        std::string message = std::string(info.code_str) + ": " + info.default_message;
        auto context = formatContext(ctx);
        if (!context.empty()) {
            message += " | " + context;
        }
        return message;
    }
    
protected:
    static const std::unordered_map<EnumType, ErrorInfo<EnumType>>& getInfoMap();
};

}}
