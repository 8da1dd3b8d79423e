#pragma once

#include "../common/config.hpp"
#include "../common/logger.hpp"
#include "../config/validator.hpp"
#include <chrono>
#include <cstdint>
#include <ostream>
#include <string>
#include <utility>

namespace progmeter {
namespace progress {


// Fluent setters shared by every tracker. Derived exposes its StepProgress
// through a tracker() member. Values are validated eagerly; once the first
// line has been rendered the configuration is frozen and setters only log,
// whatever value they are given.
//
// Setters are lvalue-only so a chain cannot outlive a temporary tracker:
//
//     auto bar = progress::wrapItems(items);
//     bar.setPrefix("Loading").setBarPosition(common::BarPosition::RIGHT);
//     for (auto item : bar) { ... }
template<typename Derived>
class WithConfig {
public:
    Derived& setPrefix(std::string prefix) & {
        return apply("prefix", [&](auto& p) { p.mutableConfig().prefix = std::move(prefix); });
    }
    
    Derived& setOutputStream(common::OutputStream stream) & {
        return apply("output_stream", [&](auto& p) {
            config::ConfigValidator::requireOutputStream(stream);
            p.mutableConfig().output_stream = stream;
            p.mutableConfig().output_sink = nullptr;
        });
    }
    
    // The sink must outlive the tracker.
    Derived& setOutputSink(std::ostream& sink) & {
        return apply("output_sink", [&](auto& p) { p.mutableConfig().output_sink = &sink; });
    }
    
    Derived& setBarPosition(common::BarPosition position) & {
        return apply("bar_position", [&](auto& p) {
            config::ConfigValidator::requireBarPosition(position);
            p.mutableConfig().bar_position = position;
        });
    }
    
    Derived& setRefreshInterval(std::chrono::milliseconds interval) & {
        return apply("refresh_interval", [&](auto& p) {
            config::ConfigValidator::requireRefreshInterval(interval);
            p.mutableConfig().refresh_interval = interval;
        });
    }
    
    Derived& setTotal(uint64_t total) & {
        return apply("total_override", [&](auto& p) { p.overrideTotal(total); });
    }
    
    Derived& setDisplayWidth(size_t width) & {
        return apply("display_width", [&](auto& p) {
            config::ConfigValidator::requireDisplayWidth(width);
            p.mutableConfig().display_width = width;
        });
    }
    
    Derived& setBarWidth(size_t width) & {
        return apply("bar_width", [&](auto& p) {
            config::ConfigValidator::requireBarWidth(width);
            p.mutableConfig().bar_width = width;
        });
    }
    
    Derived& setShapes(char body, char head, char fill) & {
        return apply("shapes", [&](auto& p) {
            config::ConfigValidator::requireShapes(body, head, fill);
            auto& config = p.mutableConfig();
            config.shape_body = body;
            config.shape_head = head;
            config.shape_void = fill;
        });
    }
    
    Derived& setUnit(std::string unit) & {
        return apply("unit", [&](auto& p) { p.mutableConfig().unit = std::move(unit); });
    }
    
    Derived& setHumanize(bool humanize) & {
        return apply("humanize", [&](auto& p) { p.mutableConfig().humanize = humanize; });
    }
    
    // Free text shown after the rate. Unlike the options above it may be
    // changed at any time and shows up on the next render.
    Derived& setExtraInfo(std::string info) & {
        auto& self = static_cast<Derived&>(*this);
        self.tracker().replaceExtraInfo(std::move(info));
        return self;
    }

protected:
    WithConfig() = default;
    ~WithConfig() = default;

private:
    template<typename Update>
    Derived& apply(const char* field, Update&& update) {
        auto& self = static_cast<Derived&>(*this);
        auto& tracker = self.tracker();
        if (tracker.isLocked()) {
            common::Logger::instance().warn("[Progress] Configuration frozen after first render | field={}",
                                            field);
            return self;
        }
        std::forward<Update>(update)(tracker);
        return self;
    }
};

}}
