#pragma once

#include "datatypes.hpp"

#include <cstddef>
#include <stdexcept>

namespace core {

    // Read-only window over the first `length` rows of a BarSeries.
    // Strategies only ever see bars through this view, so they cannot reach
    // rows past the current step.
    class SeriesView {
    public:
        using const_iterator = BarSeries::const_iterator;

        SeriesView() = default;
        SeriesView(const BarSeries& series, std::size_t length)
            : series_(&series), length_(length < series.size() ? length : series.size()) {}

        std::size_t size() const { return length_; }
        bool empty() const { return length_ == 0; }

        const Bar& operator[](std::size_t i) const { return (*series_)[i]; }

        const Bar& at(std::size_t i) const {
            if (i >= length_) {
                throw std::out_of_range("SeriesView index out of range");
            }
            return (*series_)[i];
        }

        const Bar& back() const { return at(length_ - 1); }

        const_iterator begin() const { return series_ ? series_->cbegin() : const_iterator(); }
        const_iterator end() const {
            return series_ ? series_->cbegin() + static_cast<std::ptrdiff_t>(length_) : const_iterator();
        }

    private:
        const BarSeries* series_ = nullptr;
        std::size_t length_ = 0;
    };

} // namespace core
