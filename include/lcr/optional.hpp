#pragma once

#include <cassert>
#include <type_traits>
#include <utility>


namespace lcr {

// Value-or-nothing for small default-constructible values (bridge facts,
// optional JSON fields). The payload is always constructed, so the type is
// trivially copyable whenever T is and can live inside plain snapshot structs.
template <typename T>
class optional {
    static_assert(std::is_default_constructible_v<T>, "lcr::optional<T> needs a default constructible T");

public:
    optional() = default;
    optional(const T& v) : value_(v), has_(true) {}
    optional(T&& v) : value_(std::move(v)), has_(true) {}

    optional& operator=(const T& v) {
        value_ = v;
        has_ = true;
        return *this;
    }

    optional& operator=(T&& v) {
        value_ = std::move(v);
        has_ = true;
        return *this;
    }

    [[nodiscard]] bool has() const noexcept { return has_; }

    // Precondition: has()
    [[nodiscard]] const T& value() const {
        assert(has_);
        return value_;
    }

    [[nodiscard]] T value_or(T fallback) const {
        if (!has_) {
            return fallback;
        }
        return value_;
    }

    void reset() {
        value_ = T{};
        has_ = false;
    }

private:
    T value_{};
    bool has_{false};
};

} // namespace lcr
