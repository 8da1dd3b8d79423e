#include "progmeter/source/reader_streambuf.hpp"
#include "progmeter/common/logger.hpp"
#include <algorithm>
#include <cstring>
#include <system_error>

namespace progmeter {
namespace source {

ReaderStreambuf::ReaderStreambuf(ByteReader& reader, size_t buffer_size)
    : reader_(reader), buffer_(std::max<size_t>(buffer_size, 1)) {
    setg(buffer_.data(), buffer_.data(), buffer_.data());
}

ReaderStreambuf::int_type ReaderStreambuf::underflow() {
    if (gptr() < egptr()) {
        return traits_type::to_int_type(*gptr());
    }
    
    size_t n = reader_.read(buffer_.data(), buffer_.size());
    if (n == 0) {
        return traits_type::eof();
    }
    
    setg(buffer_.data(), buffer_.data(), buffer_.data() + n);
    return traits_type::to_int_type(*gptr());
}

std::streamsize ReaderStreambuf::xsgetn(char* s, std::streamsize count) {
    std::streamsize copied = 0;
    while (copied < count) {
        std::streamsize available = egptr() - gptr();
        if (available == 0) {
            if (traits_type::eq_int_type(underflow(), traits_type::eof())) {
                break;
            }
            continue;
        }
        std::streamsize chunk = std::min(available, count - copied);
        std::memcpy(s + copied, gptr(), static_cast<size_t>(chunk));
        gbump(static_cast<int>(chunk));
        copied += chunk;
    }
    return copied;
}

ReaderStreambuf::pos_type ReaderStreambuf::seekoff(off_type offset, std::ios_base::seekdir dir,
                                                   std::ios_base::openmode which) {
    if (!(which & std::ios_base::in)) {
        return pos_type(off_type(-1));
    }
    
    const off_type buffered = egptr() - gptr();
    
    try {
        // A pure position query keeps the buffer.
        if (dir == std::ios_base::cur && offset == 0) {
            uint64_t pos = reader_.seek(0, std::ios_base::cur);
            return pos_type(static_cast<off_type>(pos) - buffered);
        }
        
        // Bytes already buffered are ahead of the reader's own position.
        if (dir == std::ios_base::cur) {
            offset -= buffered;
        }
        uint64_t pos = reader_.seek(static_cast<int64_t>(offset), dir);
        setg(buffer_.data(), buffer_.data(), buffer_.data());
        return pos_type(static_cast<off_type>(pos));
    } catch (const std::system_error& e) {
        common::Logger::instance().debug("[Reader] Seek failed | error={}", e.what());
        return pos_type(off_type(-1));
    }
}

ReaderStreambuf::pos_type ReaderStreambuf::seekpos(pos_type pos, std::ios_base::openmode which) {
    return seekoff(off_type(pos), std::ios_base::beg, which);
}

}}
