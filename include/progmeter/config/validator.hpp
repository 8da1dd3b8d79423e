#pragma once

#include "../common/config.hpp"
#include "error_codes.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace progmeter {
namespace config {

struct ValidationIssue {
    ConfigErrorCode code;
    std::string field;
    std::string value;
};

struct ValidationResult {
    bool is_valid = true;
    std::vector<ValidationIssue> errors;
};

class ConfigValidator {
public:
    static ValidationResult validate(const common::ProgressConfig& config);
    
    // Throws ConfigError for the first problem found.
    static void ensureValid(const common::ProgressConfig& config);
    
    static bool validateRefreshInterval(std::chrono::milliseconds interval);
    static bool validateBarWidth(size_t width);
    static bool validateDisplayWidth(size_t width);
    static bool validateShape(char shape);
    static bool validateBarPosition(common::BarPosition position);
    static bool validateOutputStream(common::OutputStream stream);
    
    static void requireRefreshInterval(std::chrono::milliseconds interval);
    static void requireBarWidth(size_t width);
    static void requireDisplayWidth(size_t width);
    static void requireShapes(char body, char head, char fill);
    static void requireBarPosition(common::BarPosition position);
    static void requireOutputStream(common::OutputStream stream);

private:
    [[noreturn]] static void reject(ConfigErrorCode code, const std::string& field, const std::string& value);
};

}}
