#include "progmeter/source/byte_reader.hpp"
#include "progmeter/common/logger.hpp"
#include <cerrno>
#include <fcntl.h>
#include <ios>
#include <sys/stat.h>
#include <system_error>
#include <unistd.h>

namespace progmeter {
namespace source {

uint64_t ByteReader::seek(int64_t, std::ios_base::seekdir) {
    throw std::system_error(ESPIPE, std::generic_category(), "seek");
}

FileReader::FileReader(const std::string& path)
    : owns_(true), path_(path) {
    do {
        fd_ = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    } while (fd_ < 0 && errno == EINTR);
    
    if (fd_ < 0) {
        int err = errno;
        common::Logger::instance().debug("[Reader] Open failed | path={} | errno={}", path, err);
        throw std::system_error(err, std::generic_category(), "open " + path);
    }
}

FileReader::FileReader(int fd, bool owns_descriptor)
    : fd_(fd), owns_(owns_descriptor) {
    if (fd_ < 0) {
        throw std::system_error(EBADF, std::generic_category(), "adopt descriptor");
    }
}

FileReader::~FileReader() {
    close();
}

FileReader::FileReader(FileReader&& other) noexcept
    : fd_(other.fd_), owns_(other.owns_), path_(std::move(other.path_)) {
    other.fd_ = -1;
    other.owns_ = false;
}

FileReader& FileReader::operator=(FileReader&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        owns_ = other.owns_;
        path_ = std::move(other.path_);
        other.fd_ = -1;
        other.owns_ = false;
    }
    return *this;
}

FileReader FileReader::standardInput() {
    return FileReader(STDIN_FILENO, false);
}

size_t FileReader::read(char* buffer, size_t size) {
    if (fd_ < 0) {
        throw std::system_error(EBADF, std::generic_category(), "read");
    }
    
    ssize_t n;
    do {
        n = ::read(fd_, buffer, size);
    } while (n < 0 && errno == EINTR);
    
    if (n < 0) {
        throw std::system_error(errno, std::generic_category(),
                                path_.empty() ? std::string("read") : "read " + path_);
    }
    return static_cast<size_t>(n);
}

uint64_t FileReader::seek(int64_t offset, std::ios_base::seekdir origin) {
    if (fd_ < 0) {
        throw std::system_error(EBADF, std::generic_category(), "seek");
    }
    
    int whence = SEEK_SET;
    if (origin == std::ios_base::cur) {
        whence = SEEK_CUR;
    } else if (origin == std::ios_base::end) {
        whence = SEEK_END;
    }
    
    off_t pos = ::lseek(fd_, static_cast<off_t>(offset), whence);
    if (pos < 0) {
        throw std::system_error(errno, std::generic_category(),
                                path_.empty() ? std::string("seek") : "seek " + path_);
    }
    return static_cast<uint64_t>(pos);
}

std::optional<uint64_t> FileReader::totalSize() const {
    struct stat st;
    if (fd_ < 0 || fstat(fd_, &st) != 0 || !S_ISREG(st.st_mode)) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(st.st_size);
}

void FileReader::close() noexcept {
    if (fd_ >= 0 && owns_) {
        ::close(fd_);
    }
    fd_ = -1;
}

IstreamReader::IstreamReader(std::istream& in)
    : in_(in), start_(position(in)), total_(measure(in)) {}

size_t IstreamReader::read(char* buffer, size_t size) {
    if (size == 0 || in_.eof()) {
        return 0;
    }
    
    in_.read(buffer, static_cast<std::streamsize>(size));
    if (in_.bad()) {
        throw std::system_error(std::make_error_code(std::io_errc::stream), "istream read");
    }
    return static_cast<size_t>(in_.gcount());
}

uint64_t IstreamReader::seek(int64_t offset, std::ios_base::seekdir origin) {
    std::streamoff target = static_cast<std::streamoff>(offset);
    if (origin == std::ios_base::beg) {
        target += start_;
    }
    
    in_.clear();
    in_.seekg(target, origin);
    auto pos = in_.tellg();
    if (in_.fail() || pos == std::istream::pos_type(-1) || static_cast<std::streamoff>(pos) < start_) {
        in_.clear();
        throw std::system_error(ESPIPE, std::generic_category(), "istream seek");
    }
    return static_cast<uint64_t>(static_cast<std::streamoff>(pos) - start_);
}

std::streamoff IstreamReader::position(std::istream& in) {
    auto pos = in.tellg();
    if (pos == std::istream::pos_type(-1)) {
        in.clear();
        return 0;
    }
    return static_cast<std::streamoff>(pos);
}

std::optional<uint64_t> IstreamReader::measure(std::istream& in) {
    auto start = in.tellg();
    if (start == std::istream::pos_type(-1)) {
        in.clear();
        return std::nullopt;
    }
    
    in.seekg(0, std::ios::end);
    auto end = in.tellg();
    in.clear();
    in.seekg(start);
    
    if (end == std::istream::pos_type(-1) || end < start) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(end - start);
}

}}
