#pragma once

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <random>

#include "bandlink/core/config/supervisor.hpp"


namespace bandlink::core::policy {

/*
===============================================================================
 policy::Backoff
===============================================================================

Bounded exponential backoff with symmetric jitter.

    nominal(n) = min(base * multiplier^(n-1), cap)          n = 1, 2, 3, ...
    delay(n)   = clamp(nominal(n) * U(1 - jitter, 1 + jitter), 0, cap)

With the defaults (1s, x2, 30s, ±20%) the nominal sequence is
1s, 2s, 4s, 8s, 16s, 30s, 30s, ...

max_attempts == 0 means unbounded. exhausted(n) tells the Connection whether
the n-th attempt may still be scheduled.

The random engine is owned by the policy and can be seeded, so tests observe
a reproducible sequence.
===============================================================================
*/

class Backoff {
public:
    explicit Backoff(const config::Reconnect& cfg = {}, std::uint64_t seed = std::random_device{}()) noexcept
        : cfg_(cfg)
        , rng_(seed)
    {}

    // Nominal delay before attempt `attempt` (1-based), no jitter
    [[nodiscard]]
    inline std::chrono::milliseconds nominal_delay(std::uint32_t attempt) const noexcept {
        const double exponent = static_cast<double>(attempt == 0 ? 0 : attempt - 1);
        const double base = static_cast<double>(cfg_.base_delay.count());
        const double cap  = static_cast<double>(cfg_.max_delay.count());
        // Large exponents overflow to +inf, which min() folds into the cap
        const double raw = base * std::pow(cfg_.multiplier, exponent);
        return std::chrono::milliseconds(static_cast<std::int64_t>(std::min(raw, cap)));
    }

    // Jittered delay before attempt `attempt` (1-based)
    [[nodiscard]]
    inline std::chrono::milliseconds delay(std::uint32_t attempt) noexcept {
        const double nominal = static_cast<double>(nominal_delay(attempt).count());
        double factor = 1.0;
        if (cfg_.jitter > 0.0) {
            std::uniform_real_distribution<double> dist(1.0 - cfg_.jitter, 1.0 + cfg_.jitter);
            factor = dist(rng_);
        }
        const double cap = static_cast<double>(cfg_.max_delay.count());
        const double jittered = std::clamp(nominal * factor, 0.0, cap);
        return std::chrono::milliseconds(static_cast<std::int64_t>(std::llround(jittered)));
    }

    // True when `attempt` (1-based) exceeds the configured bound
    [[nodiscard]]
    inline bool exhausted(std::uint32_t attempt) const noexcept {
        return cfg_.max_attempts != 0 && attempt > cfg_.max_attempts;
    }

    [[nodiscard]]
    inline const config::Reconnect& config() const noexcept {
        return cfg_;
    }

private:
    config::Reconnect cfg_;
    std::mt19937_64 rng_;
};

} // namespace bandlink::core::policy
