#include "progmeter/progress/step_progress.hpp"
#include "progmeter/render/render_engine.hpp"
#include "progmeter/common/logger.hpp"
#include "progmeter/config/validator.hpp"
#include <exception>
#include <utility>

namespace progmeter {
namespace progress {

StepProgress::StepProgress()
    : StepProgress(common::ProgressConfig{}, std::nullopt) {}

StepProgress::StepProgress(std::optional<uint64_t> total)
    : StepProgress(common::ProgressConfig{}, total) {}

StepProgress::StepProgress(common::ProgressConfig config, std::optional<uint64_t> total)
    : config_(std::move(config)),
      auto_total_(total) {
    config::ConfigValidator::ensureValid(config_);
    refreshTotal();
}

StepProgress::~StepProgress() {
    release();
}

StepProgress::StepProgress(StepProgress&& other) noexcept
    : state_(std::move(other.state_)),
      config_(std::move(other.config_)),
      auto_total_(other.auto_total_),
      active_(other.active_) {
    other.active_ = false;
}

StepProgress& StepProgress::operator=(StepProgress&& other) noexcept {
    if (this != &other) {
        release();
        state_ = std::move(other.state_);
        config_ = std::move(other.config_);
        auto_total_ = other.auto_total_;
        active_ = other.active_;
        other.active_ = false;
    }
    return *this;
}

void StepProgress::step(uint64_t amount) {
    state_.count += amount;
    if (active_) {
        render::RenderEngine::maybeRender(state_, config_);
    }
}

void StepProgress::finish() {
    if (active_) {
        render::RenderEngine::finish(state_, config_);
    }
}

void StepProgress::setAutoTotal(std::optional<uint64_t> total) {
    auto_total_ = total;
    refreshTotal();
}

void StepProgress::settleAutoTotal() {
    if (!config_.total_override && auto_total_) {
        auto_total_ = state_.count;
        refreshTotal();
    }
}

void StepProgress::overrideTotal(uint64_t total) {
    config_.total_override = total;
    refreshTotal();
}

void StepProgress::refreshTotal() {
    state_.total = config_.total_override ? config_.total_override : auto_total_;
}

void StepProgress::release() noexcept {
    if (!active_) {
        return;
    }
    active_ = false;
    if (state_.finished) {
        return;
    }
    try {
        common::Logger::instance().debug("[Progress] Finalizing on release | count={}", state_.count);
        render::RenderEngine::finish(state_, config_);
    } catch (const std::exception& e) {
        state_.finished = true;
        common::Logger::instance().warn("[Progress] Final render failed | count={} | error={}",
                                        state_.count, e.what());
    }
}

}}
