#include "read_command.hpp"
#include "progmeter/common/logger.hpp"
#include "progmeter/progress/byte_stream_progress.hpp"
#include "progmeter/source/byte_reader.hpp"
#include "progmeter/source/reader_streambuf.hpp"
#include <iostream>
#include <istream>
#include <memory>
#include <string>
#include <system_error>

namespace progmeter {
namespace cli {

ReadCommand::ReadCommand() = default;

void ReadCommand::setup(CLI::App* subcommand) {
    subcommand->add_option("path", path_, "File to read, '-' for standard input");
    subcommand->add_flag("--raw-units", raw_units_,
                        "Show exact byte counts instead of K/M/G");
    
    addDisplayOptions(subcommand);
}

int ReadCommand::execute() {
    auto base = common::createByteStreamConfig();
    base.humanize = !raw_units_;
    auto config = buildConfig(base);
    
    std::unique_ptr<source::ByteReader> reader;
    try {
        if (path_ == "-") {
            reader = std::make_unique<source::FileReader>(source::FileReader::standardInput());
        } else {
            reader = std::make_unique<source::FileReader>(path_);
        }
    } catch (const std::system_error& e) {
        common::Logger::instance().error("[Read] Open failed | path={} | error={}", path_, e.what());
        std::cerr << "Error: cannot open " << path_ << ": " << e.code().message() << "\n";
        return 1;
    }
    
    progress::ByteStreamProgress tracked(std::move(reader), config);
    source::ReaderStreambuf buffer(tracked);
    std::istream in(&buffer);
    in.exceptions(std::ios::badbit);
    
    size_t lines = 0;
    std::string line;
    try {
        while (std::getline(in, line)) {
            ++lines;
        }
    } catch (const std::system_error& e) {
        common::Logger::instance().error("[Read] Read failed | path={} | bytes={} | error={}",
                                         path_, tracked.count(), e.what());
        std::cerr << "Error: read failed after " << tracked.count() << " bytes\n";
        return 1;
    }
    
    common::Logger::instance().info("[Read] Complete | bytes={} | lines={}", tracked.count(), lines);
    std::cout << "This input has " << lines << " lines\n";
    return 0;
}

}}
