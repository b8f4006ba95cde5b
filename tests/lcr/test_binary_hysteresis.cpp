#include <iostream>

#include "lcr/control/binary_hysteresis.hpp"
#include "common/test_check.hpp"

using lcr::control::BinaryHysteresis;
using Transition = BinaryHysteresis::Transition;


void test_fast_on_slow_off() {
    std::cout << "[TEST] Fast on, slow off\n";
    BinaryHysteresis h{1, 2};

    TEST_CHECK(!h.is_active());
    TEST_CHECK(h.on_active_signal() == Transition::Activated);
    TEST_CHECK(h.is_active());
    TEST_CHECK(h.on_active_signal() == Transition::None);

    TEST_CHECK(h.on_inactive_signal() == Transition::None);
    TEST_CHECK(h.is_holding());
    TEST_CHECK(h.holding_streak() == 1);

    TEST_CHECK(h.on_inactive_signal() == Transition::Deactivated);
    TEST_CHECK(!h.is_active());
    TEST_CHECK(!h.is_holding());

    std::cout << "[TEST] OK\n";
}

void test_active_signal_clears_hold() {
    std::cout << "[TEST] Active signal clears the hold-over\n";
    BinaryHysteresis h{1, 2};

    (void)h.on_active_signal();
    (void)h.on_inactive_signal();
    TEST_CHECK(h.is_holding());
    TEST_CHECK(h.on_active_signal() == Transition::None);
    TEST_CHECK(!h.is_holding());

    // Alternating never deactivates
    for (int i = 0; i < 20; ++i) {
        TEST_CHECK((i % 2 == 0 ? h.on_inactive_signal() : h.on_active_signal()) == Transition::None);
    }
    TEST_CHECK(h.is_active());

    std::cout << "[TEST] OK\n";
}

void test_slow_on() {
    std::cout << "[TEST] Activation threshold\n";
    BinaryHysteresis h{3, 1};

    TEST_CHECK(h.on_active_signal() == Transition::None);
    TEST_CHECK(h.on_active_signal() == Transition::None);
    TEST_CHECK(h.on_inactive_signal() == Transition::None);   // streak reset
    TEST_CHECK(h.on_active_signal() == Transition::None);
    TEST_CHECK(h.on_active_signal() == Transition::None);
    TEST_CHECK(h.on_active_signal() == Transition::Activated);
    TEST_CHECK(h.on_inactive_signal() == Transition::Deactivated);

    // Zero thresholds behave as 1
    BinaryHysteresis z{0, 0};
    TEST_CHECK(z.activate_threshold() == 1);
    TEST_CHECK(z.on_active_signal() == Transition::Activated);

    h.reset();
    TEST_CHECK(h.state() == BinaryHysteresis::State::Inactive);

    std::cout << "[TEST] OK\n";
}


int main() {
    test_fast_on_slow_off();
    test_active_signal_clears_hold();
    test_slow_on();

    std::cout << "\n[BINARY HYSTERESIS TESTS PASSED]\n";
    return 0;
}
