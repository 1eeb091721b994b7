/**
 * @file ring_buffer.hpp
 * @brief Fixed-capacity FIFO that overwrites its oldest element when full.
 */

#pragma once

#include <cstddef>
#include <stdexcept>
#include <utility>
#include <vector>

namespace fleetwatch {

/**
 * @brief Bounded ring buffer. Not thread-safe; owners provide locking.
 */
template <typename T>
class RingBuffer {
public:
    explicit RingBuffer(size_t capacity) : slots_(capacity) {
        if (capacity == 0) throw std::invalid_argument("RingBuffer capacity must be positive");
    }

    /// Append; evicts the oldest element when full.
    void push(T value) {
        slots_[head_] = std::move(value);
        head_ = (head_ + 1) % slots_.size();
        if (size_ < slots_.size()) ++size_;
    }

    [[nodiscard]] size_t size() const noexcept { return size_; }
    [[nodiscard]] size_t capacity() const noexcept { return slots_.size(); }
    [[nodiscard]] bool empty() const noexcept { return size_ == 0; }
    [[nodiscard]] bool full() const noexcept { return size_ == slots_.size(); }

    /// Oldest element. Precondition: !empty().
    [[nodiscard]] const T& front() const { return slots_[index_of(0)]; }

    /// Newest element. Precondition: !empty().
    [[nodiscard]] const T& back() const { return slots_[index_of(size_ - 1)]; }

    /// i-th element counting from the oldest.
    [[nodiscard]] const T& at(size_t i) const {
        if (i >= size_) throw std::out_of_range("RingBuffer index out of range");
        return slots_[index_of(i)];
    }

    /// Copy out, oldest first.
    [[nodiscard]] std::vector<T> to_vector() const {
        std::vector<T> out;
        out.reserve(size_);
        for (size_t i = 0; i < size_; ++i) out.push_back(slots_[index_of(i)]);
        return out;
    }

    void clear() noexcept {
        head_ = 0;
        size_ = 0;
    }

private:
    [[nodiscard]] size_t index_of(size_t i) const noexcept {
        return (head_ + slots_.size() - size_ + i) % slots_.size();
    }

    std::vector<T> slots_;
    size_t head_{0};    ///< Next slot to write
    size_t size_{0};
};

}  // namespace fleetwatch
