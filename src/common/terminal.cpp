#include "progmeter/common/terminal.hpp"
#include <iostream>
#include <sys/ioctl.h>
#include <unistd.h>

namespace progmeter {
namespace common {

std::ostream& Terminal::stream(OutputStream output) {
    return output == OutputStream::STDERR ? std::cerr : std::cout;
}

int Terminal::descriptor(OutputStream output) {
    return output == OutputStream::STDERR ? STDERR_FILENO : STDOUT_FILENO;
}

bool Terminal::isTty(OutputStream output) {
    return isatty(descriptor(output)) != 0;
}

std::optional<size_t> Terminal::queryWidth(OutputStream output) {
    if (!isTty(output)) {
        return std::nullopt;
    }
    
    struct winsize w {};
    if (ioctl(descriptor(output), TIOCGWINSZ, &w) == 0 && w.ws_col > 0) {
        return static_cast<size_t>(w.ws_col);
    }
    return std::nullopt;
}

}}
