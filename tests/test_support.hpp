#pragma once

#include "progmeter/source/byte_reader.hpp"
#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <stdexcept>
#include <streambuf>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace progmeter {
namespace test {

// Lines written by the renderer, in order. Every render starts with '\r'.
inline std::vector<std::string> renderedLines(const std::string& output) {
    std::vector<std::string> lines;
    size_t pos = 0;
    while ((pos = output.find('\r', pos)) != std::string::npos) {
        size_t end = output.find('\r', pos + 1);
        std::string line = output.substr(pos + 1, end == std::string::npos ? std::string::npos : end - pos - 1);
        if (!line.empty() && line.back() == '\n') {
            line.pop_back();
        }
        lines.push_back(line);
        pos = pos + 1;
    }
    return lines;
}

inline size_t occurrences(const std::string& text, const std::string& needle) {
    size_t count = 0;
    for (size_t pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + needle.size())) {
        ++count;
    }
    return count;
}

// Returns the scripted chunk sizes one read at a time, then end of stream.
// A chunk of 0 is returned as end of stream; a negative entry throws.
class ScriptedReader : public source::ByteReader {
public:
    explicit ScriptedReader(std::vector<long> chunks, std::optional<uint64_t> total = std::nullopt)
        : chunks_(std::move(chunks)), total_(total) {}
    
    size_t read(char* buffer, size_t size) override {
        ++calls_;
        if (index_ >= chunks_.size()) {
            return 0;
        }
        long chunk = chunks_[index_++];
        if (chunk < 0) {
            throw std::system_error(EIO, std::generic_category(), "scripted failure");
        }
        size_t n = std::min(static_cast<size_t>(chunk), size);
        std::memset(buffer, 'x', n);
        return n;
    }
    
    std::optional<uint64_t> totalSize() const override { return total_; }
    
    size_t calls() const { return calls_; }

private:
    std::vector<long> chunks_;
    std::optional<uint64_t> total_;
    size_t index_ = 0;
    size_t calls_ = 0;
};

// Output buffer whose every write fails, like a closed pipe.
class ThrowingStreambuf : public std::streambuf {
protected:
    int_type overflow(int_type) override {
        throw std::runtime_error("sink closed");
    }
    
    std::streamsize xsputn(const char*, std::streamsize) override {
        throw std::runtime_error("sink closed");
    }
};

}}
