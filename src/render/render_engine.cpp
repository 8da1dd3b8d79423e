#include "progmeter/render/render_engine.hpp"
#include "progmeter/common/constants.hpp"
#include "progmeter/common/logger.hpp"
#include "progmeter/common/terminal.hpp"
#include "progmeter/format/format_utils.hpp"
#include <algorithm>
#include <exception>

namespace progmeter {
namespace render {

bool RenderEngine::shouldRender(const ProgressState& state, const common::ProgressConfig& config,
                                Clock::time_point now) {
    if (state.finished) {
        return false;
    }
    // A complete bar is drawn by the final render only.
    if (state.total && state.count >= *state.total) {
        return false;
    }
    if (!state.hasRendered()) {
        return true;
    }
    return now - state.last_render_time >= config.refresh_interval;
}

bool RenderEngine::maybeRender(ProgressState& state, const common::ProgressConfig& config) {
    auto now = Clock::now();
    if (!shouldRender(state, config, now)) {
        return false;
    }
    render(state, config, now, false);
    return true;
}

bool RenderEngine::finish(ProgressState& state, const common::ProgressConfig& config) {
    if (state.finished) {
        return false;
    }
    render(state, config, Clock::now(), true);
    return true;
}

std::optional<double> RenderEngine::rate(const ProgressState& state, Clock::time_point now) {
    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(now - state.start_time);
    if (elapsed.count() < constants::render::MIN_RATE_ELAPSED_US) {
        return std::nullopt;
    }
    return static_cast<double>(state.count) / std::chrono::duration<double>(elapsed).count();
}

std::optional<RenderEngine::Clock::duration> RenderEngine::eta(const ProgressState& state,
                                                               Clock::time_point now) {
    if (!state.total || state.count >= *state.total) {
        return std::nullopt;
    }
    
    auto per_second = rate(state, now);
    if (!per_second || *per_second <= 0.0) {
        return std::nullopt;
    }
    
    double seconds = static_cast<double>(*state.total - state.count) / *per_second;
    return std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(seconds));
}

std::string RenderEngine::formatLine(const ProgressState& state, const common::ProgressConfig& config,
                                     Clock::time_point now, size_t width, bool final) {
    const auto fraction = state.fraction();
    const auto summary = buildSummary(state, config, now, final);
    const auto percent = fraction ? format::formatPercentage(*fraction) : std::string();
    const size_t available = width > 1 ? width - 1 : 1;
    const size_t prefix_width = format::displayWidth(config.prefix);
    const size_t prefix_cost = prefix_width == 0 ? 0 : prefix_width + 1;
    
    std::string bar;
    if (fraction) {
        // Size the bar to whatever the other fields leave free.
        const size_t fixed = format::displayWidth(assemble(config.bar_position, percent, "", summary));
        
        size_t cells = config.bar_width;
        if (prefix_cost + fixed + cells > available) {
            size_t room = available > prefix_cost + fixed ? available - prefix_cost - fixed : 0;
            cells = std::min(config.bar_width, std::max(room, constants::render::MIN_BAR_WIDTH));
        }
        bar = buildBar(*fraction, cells, config);
    } else {
        const auto& frames = constants::render::SPINNER_FRAMES;
        bar = std::string(1, frames[state.render_count % frames.size()]);
    }
    
    const auto core = assemble(config.bar_position, percent, bar, summary);
    const size_t core_width = format::displayWidth(core);
    
    std::string prefix = config.prefix;
    if (prefix_cost > 0 && prefix_cost + core_width > available) {
        size_t overflow = prefix_cost + core_width - available;
        prefix = overflow < prefix_width ? format::truncateToWidth(prefix, prefix_width - overflow)
                                         : std::string();
    }
    
    std::string line = prefix.empty() ? core : prefix + " " + core;
    return format::truncateToWidth(line, available);
}

size_t RenderEngine::resolveWidth(const common::ProgressConfig& config) {
    if (config.display_width) {
        return *config.display_width;
    }
    if (config.output_sink) {
        return constants::render::DEFAULT_DISPLAY_WIDTH;
    }
    return common::Terminal::queryWidth(config.output_stream)
        .value_or(constants::render::DEFAULT_DISPLAY_WIDTH);
}

std::ostream& RenderEngine::resolveStream(const common::ProgressConfig& config) {
    if (config.output_sink) {
        return *config.output_sink;
    }
    return common::Terminal::stream(config.output_stream);
}

void RenderEngine::render(ProgressState& state, const common::ProgressConfig& config,
                          Clock::time_point now, bool final) {
    const auto line = formatLine(state, config, now, resolveWidth(config), final);
    
    state.render_count++;
    state.last_render_time = now;
    state.last_render_count = state.count;
    if (final) {
        state.finished = true;
    }
    
    if (state.render_failed) {
        return;
    }
    write(state, resolveStream(config), line, final);
}

bool RenderEngine::write(ProgressState& state, std::ostream& out, const std::string& line, bool final) {
    // A sink with exceptions enabled rethrows whatever its streambuf threw.
    try {
        out << '\r' << line;
        if (final) {
            out << '\n';
        }
        out.flush();
    } catch (const std::exception& e) {
        state.render_failed = true;
        common::Logger::instance().warn("[Render] Write failed, display disabled | error={}", e.what());
        return false;
    }
    
    if (!out) {
        state.render_failed = true;
        common::Logger::instance().warn("[Render] Output stream unusable, display disabled | renders={}",
                                        state.render_count);
        return false;
    }
    return true;
}

std::string RenderEngine::buildSummary(const ProgressState& state, const common::ProgressConfig& config,
                                       Clock::time_point now, bool final) {
    const std::string separator = constants::render::FIELD_SEPARATOR;
    
    std::string summary = format::formatCount(state.count, config.humanize, config.unit);
    if (state.total) {
        summary += "/" + format::formatCount(*state.total, config.humanize, config.unit);
    }
    
    summary += separator + format::formatDuration(now - state.start_time);
    
    if (state.total && !final) {
        auto remaining = eta(state, now);
        summary += separator + "ETA " +
                   (remaining ? format::formatDuration(*remaining) : constants::render::UNKNOWN_VALUE);
    }
    
    summary += separator + format::formatRate(rate(state, now), config.unit);
    
    if (!state.extra_info.empty()) {
        summary += separator + state.extra_info;
    }
    return summary;
}

std::string RenderEngine::buildBar(double fraction, size_t cells, const common::ProgressConfig& config) {
    if (cells == 0) {
        return std::string();
    }
    
    fraction = std::clamp(fraction, 0.0, 1.0);
    auto body = std::min(cells, static_cast<size_t>(fraction * static_cast<double>(cells)));
    
    std::string bar(body, config.shape_body);
    if (body < cells) {
        bar += config.shape_head;
        bar.append(cells - body - 1, config.shape_void);
    }
    return bar;
}

std::string RenderEngine::assemble(common::BarPosition position, const std::string& percent,
                                   const std::string& bar, const std::string& summary) {
    std::string framed;
    framed += constants::render::BAR_OPEN;
    framed += bar;
    framed += constants::render::BAR_CLOSE;
    
    if (position == common::BarPosition::RIGHT) {
        return percent.empty() ? summary + " " + framed
                               : summary + " " + framed + " " + percent;
    }
    return percent.empty() ? framed + " " + summary
                           : percent + " " + framed + " " + summary;
}

}}
