#pragma once

#include "byte_reader.hpp"
#include "../common/constants.hpp"
#include <streambuf>
#include <vector>

namespace progmeter {
namespace source {

// Input streambuf over a borrowed ByteReader, so any reader (a decorated
// one included) can back a std::istream.
class ReaderStreambuf : public std::streambuf {
public:
    explicit ReaderStreambuf(ByteReader& reader,
                             size_t buffer_size = constants::bytes::DEFAULT_READ_BUFFER_SIZE);

protected:
    int_type underflow() override;
    std::streamsize xsgetn(char* s, std::streamsize count) override;
    
    // Forwarded to the reader's seek(); failures yield pos_type(-1).
    pos_type seekoff(off_type offset, std::ios_base::seekdir dir,
                     std::ios_base::openmode which = std::ios_base::in) override;
    pos_type seekpos(pos_type pos, std::ios_base::openmode which = std::ios_base::in) override;

private:
    ByteReader& reader_;
    std::vector<char> buffer_;
};

}}
