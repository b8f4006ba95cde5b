#pragma once

#include <array>
#include <cstddef>
#include <utility>
#include <type_traits>


namespace lcr {
namespace local {

//------------------------------------------------------------------------------
// Single-threaded, fixed-capacity history ring.
//
// Unlike a queue, a history ring never rejects a push: when full, the oldest
// entry is overwritten. Entries are addressable by age:
//
//   at(0)          -> oldest retained entry
//   at(size() - 1) -> newest entry (== back())
//   recent(k)      -> k-th newest entry (recent(0) == back())
//
// Front removal (pop_front) supports age-based pruning on top of the capacity
// bound.
//
// Characteristics:
//   • O(1) push / pop_front / indexed access
//   • No dynamic allocation; storage is inline
//   • Capacity does not need to be a power of two
//
// Thread-safety:
//   - NOT thread-safe. Must only be used from a single thread.
//
// Template parameters:
//   T         - element type (default constructible, movable)
//   Capacity  - maximum number of retained entries (>= 1)
//------------------------------------------------------------------------------
template <typename T, std::size_t Capacity>
class history_ring {
    static_assert(Capacity >= 1, "Capacity must be >= 1");
    static_assert(std::is_default_constructible_v<T>, "T must be default constructible");

public:
    history_ring() = default;

    // Append, overwriting the oldest entry when full.
    // Returns true when an entry was evicted.
    inline bool push(T item) {
        const std::size_t slot = (head_ + size_) % Capacity;
        buffer_[slot] = std::move(item);
        if (size_ < Capacity) {
            ++size_;
            return false;
        }
        head_ = (head_ + 1) % Capacity;
        return true;
    }

    // Remove the oldest entry. Returns false if empty.
    inline bool pop_front() noexcept {
        if (size_ == 0) {
            return false;
        }
        buffer_[head_] = T{};
        head_ = (head_ + 1) % Capacity;
        --size_;
        return true;
    }

    // PRECONDITION: i < size()
    [[nodiscard]] inline const T& at(std::size_t i) const noexcept {
        return buffer_[(head_ + i) % Capacity];
    }

    // PRECONDITION: k < size()
    [[nodiscard]] inline const T& recent(std::size_t k) const noexcept {
        return at(size_ - 1 - k);
    }

    // PRECONDITION: !empty()
    [[nodiscard]] inline const T& front() const noexcept { return at(0); }
    [[nodiscard]] inline const T& back() const noexcept { return at(size_ - 1); }

    // Visit the `count` newest entries, newest first.
    template <typename Fn>
    inline void for_each_recent(std::size_t count, Fn&& fn) const {
        const std::size_t n = (count < size_) ? count : size_;
        for (std::size_t k = 0; k < n; ++k) {
            fn(recent(k));
        }
    }

    // Count the entries among the `count` newest that satisfy `pred`.
    template <typename Pred>
    [[nodiscard]] inline std::size_t count_recent(std::size_t count, Pred&& pred) const {
        std::size_t hits = 0;
        for_each_recent(count, [&](const T& v) { if (pred(v)) ++hits; });
        return hits;
    }

    inline void clear() noexcept {
        while (pop_front()) {}
    }

    [[nodiscard]] inline std::size_t size() const noexcept { return size_; }
    [[nodiscard]] inline bool empty() const noexcept { return size_ == 0; }
    [[nodiscard]] inline bool full() const noexcept { return size_ == Capacity; }
    [[nodiscard]] static constexpr std::size_t capacity() noexcept { return Capacity; }

private:
    std::array<T, Capacity> buffer_{};
    std::size_t head_{0};   // index of the oldest entry
    std::size_t size_{0};
};

} // namespace local
} // namespace lcr
