#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace progmeter {
namespace render {

struct ProgressState {
    using Clock = std::chrono::steady_clock;
    
    uint64_t count = 0;
    std::optional<uint64_t> total;
    Clock::time_point start_time = Clock::now();
    Clock::time_point last_render_time = start_time;
    uint64_t last_render_count = 0;
    uint64_t render_count = 0;
    bool finished = false;
    bool render_failed = false;
    std::string extra_info;
    
    bool hasRendered() const { return render_count > 0; }
    
    // count / total clamped to [0, 1]; a zero total counts as complete.
    std::optional<double> fraction() const {
        if (!total) return std::nullopt;
        if (*total == 0 || count >= *total) return 1.0;
        return static_cast<double>(count) / static_cast<double>(*total);
    }
};

}}
