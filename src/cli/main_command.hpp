#pragma once

#include "progmeter/common/config.hpp"
#include <CLI/CLI.hpp>
#include <string>

namespace progmeter {
namespace cli {

// Display options shared by every demo subcommand.
class MainCommand {
public:
    MainCommand();
    virtual ~MainCommand();
    
    bool wasCalled() const { return was_called_; }
    virtual int execute() = 0;

protected:
    CLI::App* subcommand_ = nullptr;
    bool was_called_ = false;
    
    std::string prefix_;
    std::string stream_ = "stdout";
    std::string position_ = "left";
    int refresh_ms_ = constants::render::DEFAULT_REFRESH_INTERVAL_MS;
    size_t width_ = 0;
    size_t bar_width_ = constants::render::DEFAULT_BAR_WIDTH;
    
    void addDisplayOptions(CLI::App* subcommand);
    
    // Throws config::ConfigError when an option is out of range.
    common::ProgressConfig buildConfig(common::ProgressConfig base = {}) const;
};

}}
