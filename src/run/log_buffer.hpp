#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>
#include <core/constants.hpp>

// Fixed-capacity ring keeping the most recent `capacity` items. Once full,
// each push evicts the oldest item. Not synchronized: one writer, read after
// the writer is done.
template <typename T>
class RingBuffer {
public:
    explicit RingBuffer(std::size_t capacity = LOG_BUFFER_LINES) : capacity_(capacity) {
        items_.reserve(capacity_);
    }

    void push(T item) {
        if (capacity_ == 0) return;
        if (items_.size() < capacity_) {
            items_.push_back(std::move(item));
            return;
        }
        items_[head_] = std::move(item);
        head_ = (head_ + 1) % capacity_;
    }

    // Retained items, oldest first.
    std::vector<T> items() const {
        std::vector<T> out;
        out.reserve(items_.size());
        for (std::size_t i = 0; i < items_.size(); i++) {
            out.push_back(items_[(head_ + i) % items_.size()]);
        }
        return out;
    }

    void clear() {
        items_.clear();
        head_ = 0;
    }

    std::size_t size() const { return items_.size(); }
    std::size_t capacity() const { return capacity_; }
    bool empty() const { return items_.empty(); }

private:
    std::size_t capacity_;
    std::size_t head_ = 0;   // oldest item once the ring is full
    std::vector<T> items_;
};

using LogBuffer = RingBuffer<std::string>;
