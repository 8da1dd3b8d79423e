#pragma once

#include <cstddef>
#include <cstdint>
#include <ios>
#include <istream>
#include <optional>
#include <string>

namespace progmeter {
namespace source {

// Blocking byte source. read() returns the number of bytes stored in
// buffer, 0 at end of stream, and throws std::system_error on failure.
class ByteReader {
public:
    virtual ~ByteReader() = default;
    
    virtual size_t read(char* buffer, size_t size) = 0;
    
    virtual std::optional<uint64_t> totalSize() const { return std::nullopt; }
    
    // Moves the read position and returns the new offset from the start.
    // Readers without random access throw std::system_error (ESPIPE).
    virtual uint64_t seek(int64_t offset, std::ios_base::seekdir origin);
};

// Reads a file descriptor. Descriptors opened from a path are owned and
// closed on destruction; adopted descriptors can be left open.
class FileReader final : public ByteReader {
public:
    explicit FileReader(const std::string& path);
    FileReader(int fd, bool owns_descriptor);
    ~FileReader() override;
    
    FileReader(FileReader&& other) noexcept;
    FileReader& operator=(FileReader&& other) noexcept;
    FileReader(const FileReader&) = delete;
    FileReader& operator=(const FileReader&) = delete;
    
    static FileReader standardInput();
    
    size_t read(char* buffer, size_t size) override;
    uint64_t seek(int64_t offset, std::ios_base::seekdir origin) override;
    
    // Size of a regular file; pipes and terminals have none.
    std::optional<uint64_t> totalSize() const override;
    
    int descriptor() const { return fd_; }

private:
    int fd_ = -1;
    bool owns_ = false;
    std::string path_;
    
    void close() noexcept;
};

// Adapts a borrowed std::istream. The total is the number of bytes between
// the current position and the end when the stream is seekable. Seek
// offsets are relative to the position the stream had on construction.
class IstreamReader final : public ByteReader {
public:
    explicit IstreamReader(std::istream& in);
    
    size_t read(char* buffer, size_t size) override;
    uint64_t seek(int64_t offset, std::ios_base::seekdir origin) override;
    std::optional<uint64_t> totalSize() const override { return total_; }

private:
    std::istream& in_;
    std::streamoff start_;
    std::optional<uint64_t> total_;
    
    static std::streamoff position(std::istream& in);
    static std::optional<uint64_t> measure(std::istream& in);
};

}}
