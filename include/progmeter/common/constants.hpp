#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace progmeter {
namespace constants {

namespace version {
    constexpr const char* LIBRARY_VERSION = "1.0.0";
    
    inline std::string getFullVersion() {
        return std::string("progmeter v") + LIBRARY_VERSION;
    }
}

namespace system {
    constexpr const char* APPLICATION_NAME = "progmeter";
    constexpr const char* LOGGER_NAME = "progmeter";
}

namespace render {
    constexpr int DEFAULT_REFRESH_INTERVAL_MS = 100;
    constexpr size_t DEFAULT_BAR_WIDTH = 40;
    constexpr size_t DEFAULT_DISPLAY_WIDTH = 80;
    constexpr size_t MIN_BAR_WIDTH = 5;
    
    constexpr char SHAPE_BODY = '=';
    constexpr char SHAPE_HEAD = '>';
    constexpr char SHAPE_VOID = ' ';
    constexpr char BAR_OPEN = '[';
    constexpr char BAR_CLOSE = ']';
    
    constexpr std::array<char, 4> SPINNER_FRAMES = {'|', '/', '-', '\\'};
    
    constexpr const char* UNKNOWN_VALUE = "--";
    constexpr const char* FIELD_SEPARATOR = " | ";
    
    // Below this elapsed time the average rate is not meaningful.
    constexpr int64_t MIN_RATE_ELAPSED_US = 1000;
}

namespace units {
    constexpr std::array<const char*, 9> SUFFIXES = {
        "", "K", "M", "G", "T", "P", "E", "Z", "Y"
    };
    constexpr double HUMANIZE_BASE = 1000.0;
    constexpr int HUMANIZED_PRECISION = 2;
}

namespace bytes {
    constexpr const char* UNIT = "B";
    constexpr size_t DEFAULT_READ_BUFFER_SIZE = 64 * 1024;
}

}
}
