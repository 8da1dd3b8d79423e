#pragma once

#include "step_progress.hpp"
#include "with_config.hpp"
#include "../common/config.hpp"
#include "../source/byte_reader.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace progmeter {
namespace progress {

// Decorates a ByteReader: every successful read advances the bar by the
// bytes returned. A zero-byte read (end of stream) renders the final line.
// Read failures propagate untouched and leave the progress unchanged.
// Seeking past the bytes counted so far advances the bar to the new
// position; seeking back leaves it where it is.
class ByteStreamProgress final : public source::ByteReader,
                                 public WithConfig<ByteStreamProgress> {
public:
    explicit ByteStreamProgress(std::unique_ptr<source::ByteReader> inner);
    ByteStreamProgress(std::unique_ptr<source::ByteReader> inner, common::ProgressConfig config);
    
    ByteStreamProgress(ByteStreamProgress&&) noexcept = default;
    ByteStreamProgress& operator=(ByteStreamProgress&&) noexcept = default;
    
    size_t read(char* buffer, size_t size) override;
    uint64_t seek(int64_t offset, std::ios_base::seekdir origin) override;
    std::optional<uint64_t> totalSize() const override;
    
    const StepProgress& progress() const { return tracker_; }
    uint64_t count() const { return tracker_.count(); }
    bool isAtEnd() const { return at_end_; }

private:
    friend class WithConfig<ByteStreamProgress>;
    
    std::unique_ptr<source::ByteReader> inner_;
    StepProgress tracker_;
    bool at_end_ = false;
    
    StepProgress& tracker() { return tracker_; }
};

ByteStreamProgress wrapReader(std::unique_ptr<source::ByteReader> reader);

// Opens path and wraps it; the file size becomes the total.
ByteStreamProgress wrapFile(const std::string& path);

}}
