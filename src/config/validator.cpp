#include "progmeter/config/validator.hpp"
#include "progmeter/common/logger.hpp"
#include <cctype>

namespace progmeter {
namespace config {

static std::string describeShape(char shape) {
    if (std::isprint(static_cast<unsigned char>(shape))) {
        return std::string("'") + shape + "'";
    }
    return fmt::format("0x{:02x}", static_cast<unsigned char>(shape));
}

ValidationResult ConfigValidator::validate(const common::ProgressConfig& config) {
    ValidationResult result;
    
    auto fail = [&result](ConfigErrorCode code, std::string field, std::string value) {
        result.errors.push_back({code, std::move(field), std::move(value)});
        result.is_valid = false;
    };
    
    if (!validateRefreshInterval(config.refresh_interval)) {
        fail(ConfigErrorCode::INVALID_REFRESH_INTERVAL, "refresh_interval",
             fmt::format("{}ms", config.refresh_interval.count()));
    }
    
    if (!validateBarWidth(config.bar_width)) {
        fail(ConfigErrorCode::INVALID_BAR_WIDTH, "bar_width", std::to_string(config.bar_width));
    }
    
    if (config.display_width && !validateDisplayWidth(*config.display_width)) {
        fail(ConfigErrorCode::INVALID_DISPLAY_WIDTH, "display_width",
             std::to_string(*config.display_width));
    }
    
    if (!validateShape(config.shape_body)) {
        fail(ConfigErrorCode::INVALID_SHAPE, "shape_body", describeShape(config.shape_body));
    }
    if (!validateShape(config.shape_head)) {
        fail(ConfigErrorCode::INVALID_SHAPE, "shape_head", describeShape(config.shape_head));
    }
    if (!validateShape(config.shape_void)) {
        fail(ConfigErrorCode::INVALID_SHAPE, "shape_void", describeShape(config.shape_void));
    }
    
    if (!validateBarPosition(config.bar_position)) {
        fail(ConfigErrorCode::INVALID_BAR_POSITION, "bar_position",
             std::to_string(static_cast<int>(config.bar_position)));
    }
    
    if (!validateOutputStream(config.output_stream)) {
        fail(ConfigErrorCode::INVALID_OUTPUT_STREAM, "output_stream",
             std::to_string(static_cast<int>(config.output_stream)));
    }
    
    return result;
}

void ConfigValidator::ensureValid(const common::ProgressConfig& config) {
    auto result = validate(config);
    if (!result.is_valid) {
        const auto& first = result.errors.front();
        reject(first.code, first.field, first.value);
    }
}

bool ConfigValidator::validateRefreshInterval(std::chrono::milliseconds interval) {
    return interval.count() > 0;
}

bool ConfigValidator::validateBarWidth(size_t width) {
    return width > 0;
}

bool ConfigValidator::validateDisplayWidth(size_t width) {
    return width > 0;
}

bool ConfigValidator::validateShape(char shape) {
    return std::isprint(static_cast<unsigned char>(shape)) != 0;
}

bool ConfigValidator::validateBarPosition(common::BarPosition position) {
    return position == common::BarPosition::LEFT || position == common::BarPosition::RIGHT;
}

bool ConfigValidator::validateOutputStream(common::OutputStream stream) {
    return stream == common::OutputStream::STDOUT || stream == common::OutputStream::STDERR;
}

void ConfigValidator::requireRefreshInterval(std::chrono::milliseconds interval) {
    if (!validateRefreshInterval(interval)) {
        reject(ConfigErrorCode::INVALID_REFRESH_INTERVAL, "refresh_interval",
               fmt::format("{}ms", interval.count()));
    }
}

void ConfigValidator::requireBarWidth(size_t width) {
    if (!validateBarWidth(width)) {
        reject(ConfigErrorCode::INVALID_BAR_WIDTH, "bar_width", std::to_string(width));
    }
}

void ConfigValidator::requireDisplayWidth(size_t width) {
    if (!validateDisplayWidth(width)) {
        reject(ConfigErrorCode::INVALID_DISPLAY_WIDTH, "display_width", std::to_string(width));
    }
}

void ConfigValidator::requireShapes(char body, char head, char fill) {
    if (!validateShape(body)) {
        reject(ConfigErrorCode::INVALID_SHAPE, "shape_body", describeShape(body));
    }
    if (!validateShape(head)) {
        reject(ConfigErrorCode::INVALID_SHAPE, "shape_head", describeShape(head));
    }
    if (!validateShape(fill)) {
        reject(ConfigErrorCode::INVALID_SHAPE, "shape_void", describeShape(fill));
    }
}

void ConfigValidator::requireBarPosition(common::BarPosition position) {
    if (!validateBarPosition(position)) {
        reject(ConfigErrorCode::INVALID_BAR_POSITION, "bar_position",
               std::to_string(static_cast<int>(position)));
    }
}

void ConfigValidator::requireOutputStream(common::OutputStream stream) {
    if (!validateOutputStream(stream)) {
        reject(ConfigErrorCode::INVALID_OUTPUT_STREAM, "output_stream",
               std::to_string(static_cast<int>(stream)));
    }
}

void ConfigValidator::reject(ConfigErrorCode code, const std::string& field, const std::string& value) {
    common::ErrorContext context;
    context.component = "Config";
    context.with("field", field).with("value", value);
    
    common::Logger::instance().debug("[Validator] Rejected | code={} | field={} | value={}",
                                     ConfigErrorCodeHelper::toString(code), field, value);
    throw ConfigError(code, context);
}

}}
