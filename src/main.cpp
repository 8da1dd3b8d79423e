#include <CLI/CLI.hpp>
#include <iostream>
#include <memory>
#include <string>

#include "progmeter/common/constants.hpp"
#include "progmeter/common/logger.hpp"
#include "progmeter/config/error_codes.hpp"
#include "cli/count_command.hpp"
#include "cli/read_command.hpp"

int main(int argc, char** argv) {
    try {
        CLI::App app{progmeter::constants::system::APPLICATION_NAME, "progmeter-demo"};
        app.set_version_flag("--version,-v", progmeter::constants::version::getFullVersion());
        app.require_subcommand(0, 1);
        
        std::string log_level;
        app.add_option("-l,--log-level", log_level,
                      "Enable diagnostics on stderr: error, warn, info or debug")
                      ->check(CLI::IsMember({"error", "warn", "warning", "info", "debug"},
                                            CLI::ignore_case));
        
        auto count_cmd = std::make_unique<progmeter::cli::CountCommand>();
        auto read_cmd = std::make_unique<progmeter::cli::ReadCommand>();
        
        count_cmd->setup(app.add_subcommand("count", "Iterate a numeric range with a progress bar"));
        read_cmd->setup(app.add_subcommand("read", "Count the lines of a file with a progress bar"));
        
        CLI11_PARSE(app, argc, argv);
        
        if (!log_level.empty()) {
            auto level = progmeter::common::parseLogLevel(log_level);
            progmeter::common::Logger::instance().initialize(
                level.value_or(progmeter::common::LogLevel::INFO));
        }
        
        int result = 0;
        if (count_cmd->wasCalled()) {
            result = count_cmd->execute();
        } else if (read_cmd->wasCalled()) {
            result = read_cmd->execute();
        } else {
            std::cout << app.help() << std::endl;
        }
        
        progmeter::common::Logger::instance().shutdown();
        return result;
        
    } catch (const progmeter::config::ConfigError& e) {
        std::cerr << "Invalid option: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
