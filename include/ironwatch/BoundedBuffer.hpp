#pragma once
#include <cstddef>
#include <deque>
#include <stdexcept>
#include <utility>

namespace ironwatch {

/**
 * Fixed-capacity FIFO log. Pushing into a full buffer evicts the oldest
 * element, so size() never exceeds capacity().
 */
template <typename T>
class BoundedBuffer {
public:
    using value_type = T;
    using const_iterator = typename std::deque<T>::const_iterator;

    explicit BoundedBuffer(size_t capacity)
        : capacity_(capacity) {
        if (capacity_ == 0) {
            throw std::invalid_argument("BoundedBuffer capacity must be non-zero");
        }
    }

    void push(const T& value) {
        if (items_.size() == capacity_) {
            items_.pop_front();
        }
        items_.push_back(value);
    }

    void push(T&& value) {
        if (items_.size() == capacity_) {
            items_.pop_front();
        }
        items_.push_back(std::move(value));
    }

    // Removes and returns the oldest element. Precondition: !empty().
    T pop() {
        T value = std::move(items_.front());
        items_.pop_front();
        return value;
    }

    void clear() { items_.clear(); }

    size_t size() const { return items_.size(); }
    size_t capacity() const { return capacity_; }
    bool empty() const { return items_.empty(); }
    bool full() const { return items_.size() == capacity_; }

    const T& front() const { return items_.front(); }
    const T& back() const { return items_.back(); }
    const T& operator[](size_t index) const { return items_[index]; }

    const_iterator begin() const { return items_.begin(); }
    const_iterator end() const { return items_.end(); }

private:
    size_t capacity_;
    std::deque<T> items_;
};

}
