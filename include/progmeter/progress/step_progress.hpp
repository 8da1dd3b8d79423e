#pragma once

#include "with_config.hpp"
#include "../common/config.hpp"
#include "../render/progress_state.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace progmeter {
namespace progress {

// Progress tracker that only moves forward. Owns one ProgressState and one
// ProgressConfig and drives the RenderEngine on every step. The final line
// is rendered exactly once: by finish(), or by the destructor if finish()
// was never reached.
class StepProgress : public WithConfig<StepProgress> {
public:
    StepProgress();
    explicit StepProgress(std::optional<uint64_t> total);
    StepProgress(common::ProgressConfig config, std::optional<uint64_t> total);
    ~StepProgress();
    
    StepProgress(StepProgress&& other) noexcept;
    StepProgress& operator=(StepProgress&& other) noexcept;
    StepProgress(const StepProgress&) = delete;
    StepProgress& operator=(const StepProgress&) = delete;
    
    void step(uint64_t amount = 1);
    void finish();
    
    // Total derived from the source. Ignored while an explicit total is set.
    void setAutoTotal(std::optional<uint64_t> total);
    
    // Replaces an automatic total with the final count. Used when a source
    // whose size was only estimated runs out.
    void settleAutoTotal();
    
    uint64_t count() const { return state_.count; }
    std::optional<uint64_t> total() const { return state_.total; }
    bool isFinished() const { return state_.finished; }
    bool isLocked() const { return state_.hasRendered(); }
    
    const render::ProgressState& state() const { return state_; }
    const common::ProgressConfig& config() const { return config_; }

private:
    template<typename> friend class WithConfig;
    
    render::ProgressState state_;
    common::ProgressConfig config_;
    std::optional<uint64_t> auto_total_;
    bool active_ = true;
    
    StepProgress& tracker() { return *this; }
    common::ProgressConfig& mutableConfig() { return config_; }
    void replaceExtraInfo(std::string info) { state_.extra_info = std::move(info); }
    void overrideTotal(uint64_t total);
    void refreshTotal();
    void release() noexcept;
};

}}
