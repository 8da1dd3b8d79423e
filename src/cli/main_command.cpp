#include "main_command.hpp"
#include "progmeter/common/logger.hpp"
#include "progmeter/config/validator.hpp"

namespace progmeter {
namespace cli {

MainCommand::MainCommand() = default;
MainCommand::~MainCommand() = default;

void MainCommand::addDisplayOptions(CLI::App* subcommand) {
    subcommand_ = subcommand;
    
    subcommand->add_option("-p,--prefix", prefix_,
                          "Text shown in front of the bar");
    subcommand->add_option("-s,--stream", stream_,
                          "Output stream: stdout or stderr")
                          ->check(CLI::IsMember({"stdout", "stderr", "out", "err"}, CLI::ignore_case));
    subcommand->add_option("-P,--position", position_,
                          "Bar position: left or right")
                          ->check(CLI::IsMember({"left", "right"}, CLI::ignore_case));
    subcommand->add_option("-r,--refresh-ms", refresh_ms_,
                          "Minimum delay between two redraws in milliseconds");
    subcommand->add_option("-w,--width", width_,
                          "Display width in columns (default: terminal width)");
    subcommand->add_option("-b,--bar-width", bar_width_,
                          "Number of cells in the bar");
    
    subcommand->callback([this]() { was_called_ = true; });
}

common::ProgressConfig MainCommand::buildConfig(common::ProgressConfig base) const {
    base.prefix = prefix_;
    base.refresh_interval = std::chrono::milliseconds(refresh_ms_);
    base.bar_width = bar_width_;
    
    if (auto stream = common::parseOutputStream(stream_)) {
        base.output_stream = *stream;
    }
    if (auto position = common::parseBarPosition(position_)) {
        base.bar_position = *position;
    }
    if (width_ > 0) {
        base.display_width = width_;
    }
    
    config::ConfigValidator::ensureValid(base);
    
    common::Logger::instance().debug("[CLI] Display | stream={} | position={} | refresh_ms={}",
                                     common::to_string(base.output_stream),
                                     common::to_string(base.bar_position),
                                     base.refresh_interval.count());
    return base;
}

}}
