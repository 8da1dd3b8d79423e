#include "progmeter/progress/byte_stream_progress.hpp"
#include "progmeter/common/logger.hpp"
#include <stdexcept>

namespace progmeter {
namespace progress {

ByteStreamProgress::ByteStreamProgress(std::unique_ptr<source::ByteReader> inner)
    : ByteStreamProgress(std::move(inner), common::createByteStreamConfig()) {}

ByteStreamProgress::ByteStreamProgress(std::unique_ptr<source::ByteReader> inner,
                                       common::ProgressConfig config)
    : inner_(std::move(inner)),
      tracker_(std::move(config), std::nullopt) {
    if (!inner_) {
        throw std::invalid_argument("ByteStreamProgress requires a reader");
    }
    tracker_.setAutoTotal(inner_->totalSize());
}

size_t ByteStreamProgress::read(char* buffer, size_t size) {
    if (size == 0) {
        return 0;
    }
    
    size_t n = inner_->read(buffer, size);
    if (n == 0) {
        if (!at_end_) {
            common::Logger::instance().debug("[Progress] End of stream | bytes={}", tracker_.count());
        }
        at_end_ = true;
        tracker_.finish();
    } else {
        tracker_.step(n);
    }
    return n;
}

uint64_t ByteStreamProgress::seek(int64_t offset, std::ios_base::seekdir origin) {
    uint64_t pos = inner_->seek(offset, origin);
    if (pos > tracker_.count()) {
        common::Logger::instance().debug("[Progress] Seek forward | from={} | to={}", tracker_.count(), pos);
        tracker_.step(pos - tracker_.count());
    }
    return pos;
}

std::optional<uint64_t> ByteStreamProgress::totalSize() const {
    return inner_->totalSize();
}

ByteStreamProgress wrapReader(std::unique_ptr<source::ByteReader> reader) {
    return ByteStreamProgress(std::move(reader));
}

ByteStreamProgress wrapFile(const std::string& path) {
    return ByteStreamProgress(std::make_unique<source::FileReader>(path));
}

}}
