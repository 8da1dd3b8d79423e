#pragma once

#include "constants.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace progmeter {
namespace common {

enum class BarPosition {
    LEFT,
    RIGHT
};

enum class OutputStream {
    STDOUT,
    STDERR
};

struct ProgressConfig {
    std::string prefix;
    OutputStream output_stream = OutputStream::STDOUT;
    // Caller-owned sink that replaces output_stream when set. Must outlive
    // the tracker it is attached to.
    std::ostream* output_sink = nullptr;
    BarPosition bar_position = BarPosition::LEFT;
    std::chrono::milliseconds refresh_interval{constants::render::DEFAULT_REFRESH_INTERVAL_MS};
    std::optional<size_t> display_width;
    std::optional<uint64_t> total_override;
    
    size_t bar_width = constants::render::DEFAULT_BAR_WIDTH;
    char shape_body = constants::render::SHAPE_BODY;
    char shape_head = constants::render::SHAPE_HEAD;
    char shape_void = constants::render::SHAPE_VOID;
    
    std::string unit;
    bool humanize = false;
};

ProgressConfig createByteStreamConfig();

std::string to_string(BarPosition position);
std::string to_string(OutputStream stream);

std::optional<BarPosition> parseBarPosition(const std::string& value);
std::optional<OutputStream> parseOutputStream(const std::string& value);

}}
