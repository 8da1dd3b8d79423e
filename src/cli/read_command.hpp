#pragma once

#include "main_command.hpp"
#include <CLI/CLI.hpp>
#include <string>

namespace progmeter {
namespace cli {

class ReadCommand : public MainCommand {
public:
    ReadCommand();
    
    void setup(CLI::App* subcommand);
    int execute() override;

private:
    std::string path_ = "-";
    bool raw_units_ = false;
};

}}
