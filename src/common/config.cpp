#include "progmeter/common/config.hpp"
#include <algorithm>
#include <cctype>

namespace progmeter {
namespace common {

static std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

ProgressConfig createByteStreamConfig() {
    ProgressConfig config;
    config.unit = constants::bytes::UNIT;
    config.humanize = true;
    return config;
}

std::string to_string(BarPosition position) {
    switch (position) {
        case BarPosition::LEFT: return "left";
        case BarPosition::RIGHT: return "right";
        default: return "unknown";
    }
}

std::string to_string(OutputStream stream) {
    switch (stream) {
        case OutputStream::STDOUT: return "stdout";
        case OutputStream::STDERR: return "stderr";
        default: return "unknown";
    }
}

std::optional<BarPosition> parseBarPosition(const std::string& value) {
    auto lowered = toLower(value);
    if (lowered == "left") return BarPosition::LEFT;
    if (lowered == "right") return BarPosition::RIGHT;
    return std::nullopt;
}

std::optional<OutputStream> parseOutputStream(const std::string& value) {
    auto lowered = toLower(value);
    if (lowered == "stdout" || lowered == "out") return OutputStream::STDOUT;
    if (lowered == "stderr" || lowered == "err") return OutputStream::STDERR;
    return std::nullopt;
}

}}
