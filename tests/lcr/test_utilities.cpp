#include <chrono>
#include <iostream>
#include <sstream>
#include <string>

#include "lcr/format.hpp"
#include "lcr/lockfree/spsc_ring.hpp"
#include "lcr/log/logger.hpp"
#include "common/test_check.hpp"


void test_format_number_exact() {
    std::cout << "[TEST] format_number_exact\n";
    TEST_CHECK(lcr::format_number_exact(0) == "0");
    TEST_CHECK(lcr::format_number_exact(999) == "999");
    TEST_CHECK(lcr::format_number_exact(1000) == "1,000");
    TEST_CHECK(lcr::format_number_exact(6436311) == "6,436,311");
    std::cout << "[TEST] OK\n";
}

void test_format_percent_and_fixed() {
    std::cout << "[TEST] format_percent / format_fixed\n";
    TEST_CHECK(lcr::format_percent(0.0) == "0.0%");
    TEST_CHECK(lcr::format_percent(0.25) == "25.0%");
    TEST_CHECK(lcr::format_percent(1.0) == "100.0%");
    TEST_CHECK(lcr::format_fixed(12.345, 1) == "12.3");
    TEST_CHECK(lcr::format_fixed(3.0) == "3.00");
    std::cout << "[TEST] OK\n";
}

void test_format_duration() {
    std::cout << "[TEST] format_duration\n";
    using std::chrono::milliseconds;
    TEST_CHECK(lcr::format_duration(milliseconds(850)) == "850 ms");
    TEST_CHECK(lcr::format_duration(milliseconds(12'500)) == "12.5 s");
    TEST_CHECK(lcr::format_duration(milliseconds(3'720'000)) == "1h 02m 00s");
    std::cout << "[TEST] OK\n";
}

void test_spsc_ring_fifo_and_full() {
    std::cout << "[TEST] spsc_ring keeps FIFO order and reports full\n";
    lcr::lockfree::spsc_ring<std::string, 4> ring;
    static_assert(decltype(ring)::capacity() == 3);

    TEST_CHECK(ring.empty());
    TEST_CHECK(ring.push(std::string("a")));
    TEST_CHECK(ring.push(std::string("b")));
    TEST_CHECK(ring.push(std::string("c")));

    std::string rejected = "d";
    TEST_CHECK(!ring.push(rejected));
    TEST_CHECK(rejected == "d");

    std::string out;
    TEST_CHECK(ring.pop(out) && out == "a");
    TEST_CHECK(ring.push(std::move(rejected)));
    TEST_CHECK(ring.pop(out) && out == "b");
    TEST_CHECK(ring.pop(out) && out == "c");
    TEST_CHECK(ring.pop(out) && out == "d");
    TEST_CHECK(!ring.pop(out));
    TEST_CHECK(ring.empty());

    (void)ring.push(std::string("x"));
    ring.clear();
    TEST_CHECK(ring.empty());
    std::cout << "[TEST] OK\n";
}

void test_parse_level() {
    std::cout << "[TEST] parse_level\n";
    lcr::log::Level lvl = lcr::log::Level::Info;
    TEST_CHECK(lcr::log::parse_level("debug", lvl) && lvl == lcr::log::Level::Debug);
    TEST_CHECK(lcr::log::parse_level("warning", lvl) && lvl == lcr::log::Level::Warn);
    TEST_CHECK(lcr::log::parse_level("off", lvl) && lvl == lcr::log::Level::Off);
    TEST_CHECK(!lcr::log::parse_level("verbose", lvl));
    TEST_CHECK(lvl == lcr::log::Level::Off);
    std::cout << "[TEST] OK\n";
}

void test_log_records_respect_level() {
    std::cout << "[TEST] Log records respect the level\n";
    auto& logger = lcr::log::Logger::instance();
    std::ostringstream sink;
    logger.set_output(&sink);
    logger.enable_color(false);
    logger.set_level(lcr::log::Level::Warn);

    int formatted = 0;
    auto count = [&formatted]() { return ++formatted; };

    BL_INFO("suppressed " << count());
    TEST_CHECK(formatted == 0);
    TEST_CHECK(sink.str().empty());

    BL_WARN("bridge " << "unresponsive (" << count() << ")");
    TEST_CHECK(formatted == 1);
    const std::string line = sink.str();
    TEST_CHECK(line.find("[WARN ] bridge unresponsive (1)\n") != std::string::npos);

    logger.set_level(lcr::log::Level::Off);
    BL_FATAL("silenced");
    TEST_CHECK(sink.str() == line);

    logger.set_output(nullptr);
    logger.set_level(lcr::log::Level::Info);
    std::cout << "[TEST] OK\n";
}

int main() {
    test_format_number_exact();
    test_format_percent_and_fixed();
    test_format_duration();
    test_spsc_ring_fifo_and_full();
    test_parse_level();
    test_log_records_respect_level();

    std::cout << "\n[LCR UTILITY TESTS PASSED]\n";
    return 0;
}
