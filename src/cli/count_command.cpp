#include "count_command.hpp"
#include "progmeter/common/logger.hpp"
#include "progmeter/progmeter.hpp"
#include <chrono>
#include <iostream>
#include <optional>
#include <thread>

namespace progmeter {
namespace cli {

CountCommand::CountCommand() = default;

void CountCommand::setup(CLI::App* subcommand) {
    subcommand->add_option("items", items_, "Number of items to iterate over");
    subcommand->add_option("-d,--delay-ms", delay_ms_,
                          "Simulated work per item in milliseconds")
                          ->check(CLI::Range(0, 60000));
    subcommand->add_flag("-u,--unknown-total", unknown_total_,
                        "Hide the item count from the bar (spinner mode)");
    
    addDisplayOptions(subcommand);
}

int CountCommand::execute() {
    auto config = buildConfig();
    auto delay = std::chrono::milliseconds(delay_ms_);
    
    common::Logger::instance().info("[Count] Starting | items={} | delay_ms={}", items_, delay_ms_);
    
    uint64_t sum = 0;
    if (unknown_total_) {
        uint64_t next = 0;
        auto bar = progress::wrapGenerator<uint64_t>([&next, this]() -> std::optional<uint64_t> {
            if (next >= items_) return std::nullopt;
            return next++;
        }, config);
        for (auto value : bar) {
            sum += value;
            std::this_thread::sleep_for(delay);
        }
    } else {
        auto bar = progress::wrapCount<uint64_t>(0, items_, config);
        for (auto value : bar) {
            sum += value;
            std::this_thread::sleep_for(delay);
        }
    }
    
    std::cout << "Sum of 0.." << items_ << " is " << sum << "\n";
    return 0;
}

}}
