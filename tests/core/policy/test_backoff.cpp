/*
===============================================================================
 policy::Backoff Unit Tests
===============================================================================

Covered Requirements:
---------------------
1. Nominal sequence 1s, 2s, 4s, 8s, 16s, 30s (capped)
2. Jittered delays stay within ±20% of nominal and never exceed the cap
3. Same seed, same sequence
4. max_attempts bounds the cycle, 0 is unbounded
5. Very large attempt numbers saturate at the cap

===============================================================================
*/

#include <iostream>
#include <chrono>
#include <cstdint>

#include "bandlink/core/policy/backoff.hpp"
#include "common/test_check.hpp"

using namespace bandlink::core;
using namespace std::chrono_literals;


void test_nominal_sequence() {
    std::cout << "[TEST] Nominal delay sequence\n";
    policy::Backoff b;

    TEST_CHECK(b.nominal_delay(1) == 1000ms);
    TEST_CHECK(b.nominal_delay(2) == 2000ms);
    TEST_CHECK(b.nominal_delay(3) == 4000ms);
    TEST_CHECK(b.nominal_delay(4) == 8000ms);
    TEST_CHECK(b.nominal_delay(5) == 16000ms);
    TEST_CHECK(b.nominal_delay(6) == 30000ms);
    TEST_CHECK(b.nominal_delay(7) == 30000ms);

    std::cout << "[TEST] OK\n";
}

void test_jitter_bounds() {
    std::cout << "[TEST] Jitter stays within bounds\n";
    policy::Backoff b{config::Reconnect{}, 7};

    bool varied = false;
    for (int round = 0; round < 50; ++round) {
        for (std::uint32_t n = 1; n <= 8; ++n) {
            const auto nominal = b.nominal_delay(n).count();
            const auto d = b.delay(n).count();
            TEST_CHECK(d >= static_cast<std::int64_t>(nominal * 0.8) - 1);
            TEST_CHECK(d <= static_cast<std::int64_t>(nominal * 1.2) + 1);
            TEST_CHECK(d <= 30000);
            varied = varied || d != nominal;
        }
    }
    TEST_CHECK(varied);

    std::cout << "[TEST] OK\n";
}

void test_seeded_sequence() {
    std::cout << "[TEST] Same seed, same sequence\n";
    policy::Backoff a{config::Reconnect{}, 1234};
    policy::Backoff b{config::Reconnect{}, 1234};

    for (std::uint32_t n = 1; n <= 10; ++n) {
        TEST_CHECK(a.delay(n) == b.delay(n));
    }

    // Without jitter delay() equals the nominal value
    config::Reconnect rc{};
    rc.jitter = 0.0;
    policy::Backoff exact{rc};
    for (std::uint32_t n = 1; n <= 10; ++n) {
        TEST_CHECK(exact.delay(n) == exact.nominal_delay(n));
    }

    std::cout << "[TEST] OK\n";
}

void test_max_attempts() {
    std::cout << "[TEST] max_attempts bounds the cycle\n";
    policy::Backoff unbounded;
    TEST_CHECK(!unbounded.exhausted(1));
    TEST_CHECK(!unbounded.exhausted(1000000));

    config::Reconnect rc{};
    rc.max_attempts = 3;
    policy::Backoff bounded{rc};
    TEST_CHECK(!bounded.exhausted(1));
    TEST_CHECK(!bounded.exhausted(3));
    TEST_CHECK(bounded.exhausted(4));

    std::cout << "[TEST] OK\n";
}

void test_saturation() {
    std::cout << "[TEST] Large attempt numbers saturate at the cap\n";
    policy::Backoff b;

    TEST_CHECK(b.nominal_delay(64) == 30000ms);
    TEST_CHECK(b.nominal_delay(5000) == 30000ms);
    TEST_CHECK(b.delay(5000) <= 30000ms);

    std::cout << "[TEST] OK\n";
}


int main() {
    test_nominal_sequence();
    test_jitter_bounds();
    test_seeded_sequence();
    test_max_attempts();
    test_saturation();

    std::cout << "\n[BACKOFF TESTS PASSED]\n";
    return 0;
}
