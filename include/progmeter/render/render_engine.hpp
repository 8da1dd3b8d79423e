#pragma once

#include "progress_state.hpp"
#include "../common/config.hpp"
#include <optional>
#include <ostream>
#include <string>

namespace progmeter {
namespace render {

// Stateless formatting and throttling. Every call borrows the state and
// configuration owned by a tracker; only the render bookkeeping fields of
// the state are written.
class RenderEngine {
public:
    using Clock = ProgressState::Clock;
    
    static bool shouldRender(const ProgressState& state, const common::ProgressConfig& config,
                             Clock::time_point now);
    
    // Renders when due. Returns true if a line was emitted.
    static bool maybeRender(ProgressState& state, const common::ProgressConfig& config);
    
    // Unconditional last render followed by a newline. Runs at most once.
    static bool finish(ProgressState& state, const common::ProgressConfig& config);
    
    static std::optional<double> rate(const ProgressState& state, Clock::time_point now);
    static std::optional<Clock::duration> eta(const ProgressState& state, Clock::time_point now);
    
    static std::string formatLine(const ProgressState& state, const common::ProgressConfig& config,
                                  Clock::time_point now, size_t width, bool final);
    
    static size_t resolveWidth(const common::ProgressConfig& config);
    static std::ostream& resolveStream(const common::ProgressConfig& config);

private:
    static void render(ProgressState& state, const common::ProgressConfig& config,
                       Clock::time_point now, bool final);
    static bool write(ProgressState& state, std::ostream& out, const std::string& line, bool final);
    
    static std::string buildSummary(const ProgressState& state, const common::ProgressConfig& config,
                                    Clock::time_point now, bool final);
    static std::string buildBar(double fraction, size_t cells, const common::ProgressConfig& config);
    static std::string assemble(common::BarPosition position, const std::string& percent,
                                const std::string& bar, const std::string& summary);
};

}}
