#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <type_traits>
#include <utility>


namespace lcr::lockfree {

/*
--------------------------------------------------------------------------------
 spsc_ring<T, N>

 Bounded single-producer / single-consumer queue. A websocket backend's I/O
 thread pushes, the reactor pops; nothing else touches it.

   - N is a power of two; one slot stays empty, so N - 1 items fit
   - push() never blocks: false means full and the item is left as it was
   - head and tail live on separate cache lines
--------------------------------------------------------------------------------
*/
template <typename T, std::size_t N>
class spsc_ring {
    static_assert(N >= 2 && (N & (N - 1)) == 0, "spsc_ring size must be a power of two");
    static_assert(std::is_default_constructible_v<T>);

public:
    spsc_ring() = default;
    spsc_ring(const spsc_ring&) = delete;
    spsc_ring& operator=(const spsc_ring&) = delete;

    // -- producer -------------------------------------------------------------

    template <typename U>
    [[nodiscard]] bool push(U&& item) {
        const std::size_t h = head_.load(std::memory_order_relaxed);
        const std::size_t next = wrap(h + 1);
        if (next == tail_.load(std::memory_order_acquire)) {
            return false;
        }
        slots_[h] = std::forward<U>(item);
        head_.store(next, std::memory_order_release);
        return true;
    }

    // -- consumer -------------------------------------------------------------

    [[nodiscard]] bool pop(T& out) {
        const std::size_t t = tail_.load(std::memory_order_relaxed);
        if (t == head_.load(std::memory_order_acquire)) {
            return false;
        }
        out = std::move(slots_[t]);
        tail_.store(wrap(t + 1), std::memory_order_release);
        return true;
    }

    void clear() {
        T discarded{};
        while (pop(discarded)) {
        }
    }

    // -- either side (a snapshot) ---------------------------------------------

    [[nodiscard]] bool empty() const noexcept {
        return head_.load(std::memory_order_acquire) == tail_.load(std::memory_order_acquire);
    }

    [[nodiscard]] static constexpr std::size_t capacity() noexcept { return N - 1; }

private:
    static constexpr std::size_t wrap(std::size_t i) noexcept { return i & (N - 1); }

    std::array<T, N> slots_{};
    alignas(64) std::atomic<std::size_t> head_{0};
    alignas(64) std::atomic<std::size_t> tail_{0};
};

} // namespace lcr::lockfree
