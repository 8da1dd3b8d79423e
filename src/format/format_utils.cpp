#include "progmeter/format/format_utils.hpp"
#include "progmeter/common/constants.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>

namespace progmeter {
namespace format {

ScaledValue scaleUnit(double value) {
    const auto& suffixes = constants::units::SUFFIXES;
    size_t index = 0;
    
    while (value > constants::units::HUMANIZE_BASE && index + 1 < suffixes.size()) {
        value /= constants::units::HUMANIZE_BASE;
        ++index;
    }
    
    return {value, suffixes[index]};
}

std::string formatCount(uint64_t count, bool humanize, const std::string& unit) {
    if (humanize) {
        auto scaled = scaleUnit(static_cast<double>(count));
        if (scaled.suffix[0] != '\0') {
            return fmt::format("{:.{}f}{}{}", scaled.value, constants::units::HUMANIZED_PRECISION,
                               scaled.suffix, unit);
        }
    }
    return fmt::format("{}{}", count, unit);
}

std::string formatRate(std::optional<double> per_second, const std::string& unit) {
    if (!per_second) {
        return fmt::format("{}{}/s", constants::render::UNKNOWN_VALUE, unit);
    }
    auto scaled = scaleUnit(*per_second);
    return fmt::format("{:.1f}{}{}/s", scaled.value, scaled.suffix, unit);
}

std::string formatDuration(std::chrono::steady_clock::duration duration) {
    using days = std::chrono::duration<int64_t, std::ratio<86400>>;
    
    if (duration.count() < 0) {
        duration = std::chrono::steady_clock::duration::zero();
    }
    
    auto d = std::chrono::duration_cast<days>(duration);
    auto h = std::chrono::duration_cast<std::chrono::hours>(duration -= d);
    auto m = std::chrono::duration_cast<std::chrono::minutes>(duration -= h);
    auto s = std::chrono::duration_cast<std::chrono::seconds>(duration -= m);
    
    if (d.count() > 0) {
        return fmt::format("{}-{:02}:{:02}:{:02}", d.count(), h.count(), m.count(), s.count());
    }
    if (h.count() > 0) {
        return fmt::format("{:02}:{:02}:{:02}", h.count(), m.count(), s.count());
    }
    if (m.count() > 0) {
        return fmt::format("{:02}:{:02}", m.count(), s.count());
    }
    return fmt::format("{}s", s.count());
}

std::string formatPercentage(double fraction) {
    fraction = std::clamp(fraction, 0.0, 1.0);
    return fmt::format("{:5.1f}%", 100.0 * fraction);
}

static bool isContinuationByte(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

size_t displayWidth(const std::string& text) {
    return static_cast<size_t>(std::count_if(text.begin(), text.end(),
                                             [](char c) { return !isContinuationByte(c); }));
}

std::string truncateToWidth(const std::string& text, size_t columns) {
    size_t seen = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        if (isContinuationByte(text[i])) {
            continue;
        }
        if (seen == columns) {
            return text.substr(0, i);
        }
        ++seen;
    }
    return text;
}

}
}
