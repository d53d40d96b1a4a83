#pragma once

#include <cstddef>
#include <stdexcept>
#include <vector>

namespace pagecraft {

/// Fixed-capacity FIFO that overwrites its oldest entry when full.
///
/// Used for bounded histories (hierarchy operations, captured log lines)
/// where only the most recent N entries matter.
///
/// Example:
/// @code
/// RingBuffer<int> history(3);
/// history.push(1); history.push(2); history.push(3); history.push(4);
/// // history.toVector() == {2, 3, 4}
/// @endcode
template <typename T>
class RingBuffer {
public:
    explicit RingBuffer(size_t capacity) : buffer_(capacity > 0 ? capacity : 1) {}

    /// Append a value, evicting the oldest entry if the buffer is full
    void push(T value) {
        buffer_[head_] = std::move(value);
        head_ = (head_ + 1) % buffer_.size();
        if (size_ < buffer_.size()) {
            ++size_;
        }
    }

    /// Access by age: index 0 is the oldest retained entry.
    /// Throws std::out_of_range if index >= size().
    const T& at(size_t index) const {
        if (index >= size_) {
            throw std::out_of_range("RingBuffer index out of range");
        }
        return buffer_[physicalIndex(index)];
    }

    const T& operator[](size_t index) const { return buffer_[physicalIndex(index)]; }

    /// Most recently pushed entry. Undefined if empty().
    const T& back() const { return buffer_[(head_ + buffer_.size() - 1) % buffer_.size()]; }

    size_t size() const { return size_; }
    size_t capacity() const { return buffer_.size(); }
    bool empty() const { return size_ == 0; }
    bool full() const { return size_ == buffer_.size(); }

    void clear() {
        head_ = 0;
        size_ = 0;
    }

    /// Copy entries out, oldest first
    std::vector<T> toVector() const {
        std::vector<T> result;
        result.reserve(size_);
        for (size_t i = 0; i < size_; ++i) {
            result.push_back(buffer_[physicalIndex(i)]);
        }
        return result;
    }

private:
    size_t physicalIndex(size_t logical) const {
        size_t start = (head_ + buffer_.size() - size_) % buffer_.size();
        return (start + logical) % buffer_.size();
    }

    std::vector<T> buffer_;
    size_t head_ = 0;   ///< Next write slot
    size_t size_ = 0;
};

}  // namespace pagecraft
