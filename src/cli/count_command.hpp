#pragma once

#include "main_command.hpp"
#include <CLI/CLI.hpp>
#include <cstdint>

namespace progmeter {
namespace cli {

class CountCommand : public MainCommand {
public:
    CountCommand();
    
    void setup(CLI::App* subcommand);
    int execute() override;

private:
    uint64_t items_ = 1000;
    int delay_ms_ = 5;
    bool unknown_total_ = false;
};

}}
