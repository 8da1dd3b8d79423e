#pragma once

#include "step_progress.hpp"
#include "with_config.hpp"
#include "../common/config.hpp"
#include "../source/item_source.hpp"
#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>

namespace progmeter {
namespace progress {

// Decorates an ItemSource: yields exactly the wrapped items, advancing the
// bar by one per item. Exhaustion triggers the final render; destroying the
// decorator early triggers it as well.
template<typename T>
class SequenceProgress final : public source::ItemSource<T>,
                               public WithConfig<SequenceProgress<T>> {
public:
    struct Sentinel {};
    
    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = T;
        using difference_type = std::ptrdiff_t;
        using pointer = const T*;
        using reference = const T&;
        
        Iterator() = default;
        explicit Iterator(SequenceProgress* owner) : owner_(owner) { advance(); }
        
        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }
        
        Iterator& operator++() {
            advance();
            return *this;
        }
        void operator++(int) { advance(); }
        
        friend bool operator==(const Iterator& it, Sentinel) { return !it.current_; }
        friend bool operator==(Sentinel s, const Iterator& it) { return it == s; }
        friend bool operator!=(const Iterator& it, Sentinel s) { return !(it == s); }
        friend bool operator!=(Sentinel s, const Iterator& it) { return !(it == s); }
    
    private:
        SequenceProgress* owner_ = nullptr;
        std::optional<T> current_;
        
        void advance() { current_ = owner_->next(); }
    };
    
    explicit SequenceProgress(std::unique_ptr<source::ItemSource<T>> inner,
                              common::ProgressConfig config = {})
        : inner_(std::move(inner)),
          tracker_(std::move(config), std::nullopt) {
        if (!inner_) {
            throw std::invalid_argument("SequenceProgress requires a source");
        }
        tracker_.setAutoTotal(inner_->remaining());
    }
    
    SequenceProgress(SequenceProgress&&) noexcept = default;
    SequenceProgress& operator=(SequenceProgress&&) noexcept = default;
    
    std::optional<T> next() override {
        if (exhausted_) {
            return std::nullopt;
        }
        
        auto item = inner_->next();
        if (!item) {
            exhausted_ = true;
            tracker_.settleAutoTotal();
            tracker_.finish();
            return item;
        }
        
        if (auto left = inner_->remaining()) {
            tracker_.setAutoTotal(tracker_.count() + 1 + *left);
        }
        tracker_.step(1);
        return item;
    }
    
    std::optional<uint64_t> remaining() const override {
        if (exhausted_) {
            return 0;
        }
        return inner_->remaining();
    }
    
    Iterator begin() { return Iterator(this); }
    Sentinel end() { return Sentinel{}; }
    
    const StepProgress& progress() const { return tracker_; }
    uint64_t count() const { return tracker_.count(); }
    bool isExhausted() const { return exhausted_; }

private:
    friend class WithConfig<SequenceProgress<T>>;
    
    std::unique_ptr<source::ItemSource<T>> inner_;
    StepProgress tracker_;
    bool exhausted_ = false;
    
    StepProgress& tracker() { return tracker_; }
};

template<typename Iterator>
SequenceProgress<typename std::iterator_traits<Iterator>::value_type>
wrapRange(Iterator first, Iterator last, common::ProgressConfig config = {}) {
    using value_type = typename std::iterator_traits<Iterator>::value_type;
    return SequenceProgress<value_type>(
        std::make_unique<source::RangeSource<Iterator>>(std::move(first), std::move(last)),
        std::move(config));
}

// The container is borrowed and must outlive the returned decorator.
template<typename Container>
auto wrapItems(const Container& items, common::ProgressConfig config = {}) {
    return wrapRange(std::begin(items), std::end(items), std::move(config));
}

template<typename Container, typename... Rest>
void wrapItems(const Container&& items, Rest&&... rest) = delete;

template<typename T>
SequenceProgress<T> wrapCount(T first, T last, common::ProgressConfig config = {}) {
    return SequenceProgress<T>(std::make_unique<source::CountingSource<T>>(first, last),
                               std::move(config));
}

template<typename T>
SequenceProgress<T> wrapGenerator(typename source::GeneratorSource<T>::Generator generator,
                                     common::ProgressConfig config = {}) {
    return SequenceProgress<T>(std::make_unique<source::GeneratorSource<T>>(std::move(generator)),
                               std::move(config));
}

}}
