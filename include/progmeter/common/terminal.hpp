#pragma once

#include "config.hpp"
#include <cstddef>
#include <optional>
#include <ostream>

namespace progmeter {
namespace common {

class Terminal {
public:
    static std::ostream& stream(OutputStream output);
    static int descriptor(OutputStream output);
    static bool isTty(OutputStream output);
    
    // Column count of the terminal behind the stream, if it is one.
    static std::optional<size_t> queryWidth(OutputStream output);
};

}}
