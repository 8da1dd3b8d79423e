#pragma once

#include <cstdint>
#include <functional>
#include <iterator>
#include <optional>
#include <type_traits>
#include <utility>

namespace progmeter {
namespace source {

// Lazy producer of items. next() returns std::nullopt once exhausted;
// errors are reported by throwing.
template<typename T>
class ItemSource {
public:
    using value_type = T;
    
    virtual ~ItemSource() = default;
    
    virtual std::optional<T> next() = 0;
    
    // Number of items still to come, when the source knows it.
    virtual std::optional<uint64_t> remaining() const { return std::nullopt; }
};

// Items of an iterator pair. The range is borrowed and must outlive the
// source. The size is known up front for forward iterators.
template<typename Iterator>
class RangeSource final : public ItemSource<typename std::iterator_traits<Iterator>::value_type> {
public:
    using value_type = typename std::iterator_traits<Iterator>::value_type;
    
    RangeSource(Iterator first, Iterator last)
        : current_(std::move(first)), last_(std::move(last)) {
        using category = typename std::iterator_traits<Iterator>::iterator_category;
        if constexpr (std::is_base_of_v<std::forward_iterator_tag, category>) {
            remaining_ = static_cast<uint64_t>(std::distance(current_, last_));
        }
    }
    
    std::optional<value_type> next() override {
        if (current_ == last_) {
            return std::nullopt;
        }
        std::optional<value_type> item(*current_);
        ++current_;
        if (remaining_ && *remaining_ > 0) {
            --*remaining_;
        }
        return item;
    }
    
    std::optional<uint64_t> remaining() const override { return remaining_; }

private:
    Iterator current_;
    Iterator last_;
    std::optional<uint64_t> remaining_;
};

// Half-open numeric range [first, last).
template<typename T>
class CountingSource final : public ItemSource<T> {
    static_assert(std::is_integral_v<T>, "CountingSource requires an integral type");

public:
    CountingSource(T first, T last) : current_(first), last_(last) {}
    
    std::optional<T> next() override {
        if (current_ >= last_) {
            return std::nullopt;
        }
        return current_++;
    }
    
    std::optional<uint64_t> remaining() const override {
        if (current_ >= last_) {
            return 0;
        }
        return static_cast<uint64_t>(last_ - current_);
    }

private:
    T current_;
    T last_;
};

// Items produced by a callable; the length is unknown.
template<typename T>
class GeneratorSource final : public ItemSource<T> {
public:
    using Generator = std::function<std::optional<T>()>;
    
    explicit GeneratorSource(Generator generator) : generator_(std::move(generator)) {}
    
    std::optional<T> next() override {
        if (done_) {
            return std::nullopt;
        }
        auto item = generator_();
        if (!item) {
            done_ = true;
        }
        return item;
    }

private:
    Generator generator_;
    bool done_ = false;
};

}}
