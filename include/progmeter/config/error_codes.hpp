#pragma once

#include "../common/error_framework.hpp"
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace progmeter {
namespace config {

enum class ConfigErrorCode {
    INVALID_REFRESH_INTERVAL = 100,
    INVALID_BAR_WIDTH = 101,
    INVALID_DISPLAY_WIDTH = 102,
    INVALID_SHAPE = 103,
    INVALID_OUTPUT_STREAM = 104,
    INVALID_BAR_POSITION = 105
};

using ConfigErrorCodeHelper = common::ErrorRegistry<ConfigErrorCode>;

// Thrown when a progress configuration value is rejected. The message
// is the registry description of the code and its context.
class ConfigError : public std::invalid_argument {
public:
    ConfigError(ConfigErrorCode code, const common::ErrorContext& context);
    
    ConfigErrorCode code() const noexcept { return code_; }
    const common::ErrorContext& context() const noexcept { return context_; }

private:
    ConfigErrorCode code_;
    common::ErrorContext context_;
};

}
}

namespace progmeter {
namespace common {

template<>
inline const std::unordered_map<config::ConfigErrorCode, ErrorInfo<config::ConfigErrorCode>>& 
ErrorRegistry<config::ConfigErrorCode>::getInfoMap() {
    static const std::unordered_map<config::ConfigErrorCode, ErrorInfo<config::ConfigErrorCode>> map = {
        {config::ConfigErrorCode::INVALID_REFRESH_INTERVAL, {
            config::ConfigErrorCode::INVALID_REFRESH_INTERVAL,
            "INVALID_REFRESH_INTERVAL",
            "Refresh interval must be positive"
        }},
        {config::ConfigErrorCode::INVALID_BAR_WIDTH, {
            config::ConfigErrorCode::INVALID_BAR_WIDTH,
            "INVALID_BAR_WIDTH",
            "Bar width must be at least one cell"
        }},
        {config::ConfigErrorCode::INVALID_DISPLAY_WIDTH, {
            config::ConfigErrorCode::INVALID_DISPLAY_WIDTH,
            "INVALID_DISPLAY_WIDTH",
            "Display width must be at least one column"
        }},
        {config::ConfigErrorCode::INVALID_SHAPE, {
            config::ConfigErrorCode::INVALID_SHAPE,
            "INVALID_SHAPE",
            "Bar shape must be a printable character"
        }},
        {config::ConfigErrorCode::INVALID_OUTPUT_STREAM, {
            config::ConfigErrorCode::INVALID_OUTPUT_STREAM,
            "INVALID_OUTPUT_STREAM",
            "Unknown output stream"
        }},
        {config::ConfigErrorCode::INVALID_BAR_POSITION, {
            config::ConfigErrorCode::INVALID_BAR_POSITION,
            "INVALID_BAR_POSITION",
            "Unknown bar position"
        }}
    };
    return map;
}

}
}
