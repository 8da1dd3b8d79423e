#include <gtest/gtest.h>
#include "progmeter/common/config.hpp"
#include "progmeter/config/error_codes.hpp"
#include "progmeter/config/validator.hpp"
#include <chrono>
#include <stdexcept>
#include <string>

using namespace progmeter;
using config::ConfigError;
using config::ConfigErrorCode;
using config::ConfigValidator;

TEST(ConfigValidatorTest, DefaultsAreValid) {
    common::ProgressConfig defaults;
    auto result = ConfigValidator::validate(defaults);
    EXPECT_TRUE(result.is_valid);
    EXPECT_TRUE(result.errors.empty());
    
    EXPECT_EQ(defaults.refresh_interval, std::chrono::milliseconds(100));
    EXPECT_EQ(defaults.bar_position, common::BarPosition::LEFT);
    EXPECT_EQ(defaults.output_stream, common::OutputStream::STDOUT);
    EXPECT_TRUE(defaults.prefix.empty());
    EXPECT_FALSE(defaults.display_width.has_value());
    EXPECT_FALSE(defaults.total_override.has_value());
}

TEST(ConfigValidatorTest, CollectsEveryProblem) {
    common::ProgressConfig bad;
    bad.refresh_interval = std::chrono::milliseconds(0);
    bad.bar_width = 0;
    bad.display_width = 0;
    bad.shape_head = '\t';
    
    auto result = ConfigValidator::validate(bad);
    EXPECT_FALSE(result.is_valid);
    ASSERT_EQ(result.errors.size(), 4u);
    EXPECT_EQ(result.errors[0].code, ConfigErrorCode::INVALID_REFRESH_INTERVAL);
    EXPECT_EQ(result.errors[1].code, ConfigErrorCode::INVALID_BAR_WIDTH);
    EXPECT_EQ(result.errors[2].code, ConfigErrorCode::INVALID_DISPLAY_WIDTH);
    EXPECT_EQ(result.errors[3].code, ConfigErrorCode::INVALID_SHAPE);
    EXPECT_EQ(result.errors[3].field, "shape_head");
    EXPECT_EQ(result.errors[3].value, "0x09");
}

TEST(ConfigValidatorTest, EnsureValidThrowsFirstProblem) {
    common::ProgressConfig bad;
    bad.refresh_interval = std::chrono::milliseconds(-10);
    bad.bar_width = 0;
    
    try {
        ConfigValidator::ensureValid(bad);
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_EQ(e.code(), ConfigErrorCode::INVALID_REFRESH_INTERVAL);
        EXPECT_EQ(e.context().detail("field"), "refresh_interval");
        EXPECT_EQ(e.context().detail("value"), "-10ms");
    }
}

TEST(ConfigValidatorTest, ErrorMessageCarriesCodeAndContext) {
    try {
        ConfigValidator::requireBarWidth(0);
        FAIL() << "expected ConfigError";
    } catch (const std::invalid_argument& e) {
        std::string message = e.what();
        EXPECT_EQ(message.rfind("INVALID_BAR_WIDTH: ", 0), 0u);
        EXPECT_NE(message.find("field=bar_width"), std::string::npos);
        EXPECT_NE(message.find("value=0"), std::string::npos);
    }
}

TEST(ConfigValidatorTest, RequireFunctionsAcceptValidValues) {
    EXPECT_NO_THROW(ConfigValidator::requireRefreshInterval(std::chrono::milliseconds(1)));
    EXPECT_NO_THROW(ConfigValidator::requireBarWidth(1));
    EXPECT_NO_THROW(ConfigValidator::requireDisplayWidth(1));
    EXPECT_NO_THROW(ConfigValidator::requireShapes('#', '#', '.'));
    EXPECT_THROW(ConfigValidator::requireShapes('#', '#', '\0'), ConfigError);
    EXPECT_THROW(ConfigValidator::requireDisplayWidth(0), ConfigError);
}

TEST(ConfigValidatorTest, EnumValuesOutsideRangeAreRejected) {
    EXPECT_THROW(ConfigValidator::requireBarPosition(static_cast<common::BarPosition>(7)), ConfigError);
    EXPECT_THROW(ConfigValidator::requireOutputStream(static_cast<common::OutputStream>(7)), ConfigError);
}

TEST(ErrorRegistryTest, KnownAndUnknownCodes) {
    EXPECT_STREQ(config::ConfigErrorCodeHelper::toString(ConfigErrorCode::INVALID_SHAPE), "INVALID_SHAPE");
    EXPECT_STREQ(config::ConfigErrorCodeHelper::toString(static_cast<ConfigErrorCode>(999)), "UNKNOWN");
    EXPECT_STREQ(config::ConfigErrorCodeHelper::getMessage(static_cast<ConfigErrorCode>(999)), "Unknown error");
}

TEST(ConfigParsingTest, ParsesNamesCaseInsensitively) {
    EXPECT_EQ(common::parseBarPosition("RIGHT"), common::BarPosition::RIGHT);
    EXPECT_EQ(common::parseBarPosition("left"), common::BarPosition::LEFT);
    EXPECT_FALSE(common::parseBarPosition("middle").has_value());
    
    EXPECT_EQ(common::parseOutputStream("StdErr"), common::OutputStream::STDERR);
    EXPECT_EQ(common::parseOutputStream("out"), common::OutputStream::STDOUT);
    EXPECT_FALSE(common::parseOutputStream("file").has_value());
    
    EXPECT_EQ(common::to_string(common::BarPosition::RIGHT), "right");
    EXPECT_EQ(common::to_string(common::OutputStream::STDERR), "stderr");
}

TEST(ConfigParsingTest, ByteStreamDefaults) {
    auto config = common::createByteStreamConfig();
    EXPECT_EQ(config.unit, "B");
    EXPECT_TRUE(config.humanize);
}

TEST(ErrorRegistryTest, DescribeIncludesComponentAndOrderedDetails) {
    common::ErrorContext context;
    context.component = "Config";
    context.with("field", "bar_width").with("value", "0");
    
    EXPECT_EQ(common::formatContext(context), "component=Config | field=bar_width | value=0");
    EXPECT_EQ(config::ConfigErrorCodeHelper::describe(ConfigErrorCode::INVALID_BAR_WIDTH, context),
              "INVALID_BAR_WIDTH: Bar width must be at least one cell | "
              "component=Config | field=bar_width | value=0");
    EXPECT_EQ(context.detail("value"), "0");
    EXPECT_EQ(context.detail("missing"), "");
}

TEST(ErrorRegistryTest, ConfigErrorNamesItsComponent) {
    try {
        ConfigValidator::requireDisplayWidth(0);
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_EQ(e.context().component, "Config");
        EXPECT_NE(std::string(e.what()).find("component=Config | field=display_width"), std::string::npos);
    }
}
