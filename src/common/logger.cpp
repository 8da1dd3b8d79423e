#include "progmeter/common/logger.hpp"
#include "progmeter/common/constants.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <cctype>
#include <iostream>

namespace progmeter {
namespace common {

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(LogLevel level) {
    if (initialized_) {
        if (logger_) {
            logger_->warn("[Logger] Already initialized, ignoring duplicate initialization");
        }
        return;
    }

    if (logger_) {
        spdlog::drop(constants::system::LOGGER_NAME);
        logger_.reset();
    }

    try {
        auto spdlog_level = toSpdlogLevel(level);
        
        // Progress lines may own stdout, so diagnostics always go to stderr.
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(spdlog_level);
        
        logger_ = std::make_shared<spdlog::logger>(constants::system::LOGGER_NAME, console_sink);
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        logger_->set_level(spdlog_level);
        
        spdlog::register_logger(logger_);
        initialized_ = true;
        
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "[Logger] Initialization failed: " << ex.what() << std::endl;
        logger_.reset();
        initialized_ = false;
    }
}

void Logger::setLevel(LogLevel level) {
    if (logger_) {
        logger_->set_level(toSpdlogLevel(level));
        for (auto& sink : logger_->sinks()) {
            sink->set_level(toSpdlogLevel(level));
        }
    }
}

void Logger::shutdown() {
    if (logger_) {
        logger_->flush();
        spdlog::drop(constants::system::LOGGER_NAME);
        logger_.reset();
    }
    initialized_ = false;
}

void Logger::flush() {
    if (logger_) {
        logger_->flush();
    }
}

spdlog::level::level_enum Logger::toSpdlogLevel(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::WARN: return spdlog::level::warn;
        case LogLevel::INFO: return spdlog::level::info;
        case LogLevel::DEBUG: return spdlog::level::debug;
        default: return spdlog::level::info;
    }
}

std::optional<LogLevel> parseLogLevel(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    
    if (lowered == "error") return LogLevel::ERROR;
    if (lowered == "warn" || lowered == "warning") return LogLevel::WARN;
    if (lowered == "info") return LogLevel::INFO;
    if (lowered == "debug") return LogLevel::DEBUG;
    return std::nullopt;
}

}}
