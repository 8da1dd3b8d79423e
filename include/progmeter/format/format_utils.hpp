#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace progmeter {
namespace format {

struct ScaledValue {
    double value;
    const char* suffix;
};

// Divides by 1000 until the value fits, picking K, M, G, ... as suffix.
ScaledValue scaleUnit(double value);

std::string formatCount(uint64_t count, bool humanize, const std::string& unit);

std::string formatRate(std::optional<double> per_second, const std::string& unit);

// 5s, 02:05, 01:02:05 or 3-01:02:05 depending on magnitude.
std::string formatDuration(std::chrono::steady_clock::duration duration);

std::string formatPercentage(double fraction);

// Terminal columns taken by UTF-8 text, one per code point.
size_t displayWidth(const std::string& text);

// Longest leading part of text that fits in columns, never splitting a
// UTF-8 sequence.
std::string truncateToWidth(const std::string& text, size_t columns);

}
}
