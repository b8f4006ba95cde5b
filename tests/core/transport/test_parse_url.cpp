#include <iostream>

#include "bandlink/core/transport/parse_url.hpp"
#include "common/test_check.hpp"

using namespace bandlink::core::transport;


void test_host_port_path() {
    std::cout << "[TEST] Host, port and path\n";
    ParsedUrl u;
    TEST_CHECK(parse_url("ws://127.0.0.1:18765/bridge?client=1", u) == Error::None);
    TEST_CHECK(!u.secure);
    TEST_CHECK(u.host == "127.0.0.1");
    TEST_CHECK(u.port == "18765");
    TEST_CHECK(u.path == "/bridge?client=1");
    std::cout << "[TEST] OK\n";
}

void test_defaults() {
    std::cout << "[TEST] Default port and path\n";
    ParsedUrl u;
    TEST_CHECK(parse_url("ws://localhost", u) == Error::None);
    TEST_CHECK(u.port == "80");
    TEST_CHECK(u.path == "/");

    TEST_CHECK(parse_url("wss://localhost/x", u) == Error::None);
    TEST_CHECK(u.secure);
    TEST_CHECK(u.port == "443");
    TEST_CHECK(u.path == "/x");
    std::cout << "[TEST] OK\n";
}

void test_malformed() {
    std::cout << "[TEST] Malformed urls\n";
    ParsedUrl u;
    TEST_CHECK(parse_url("127.0.0.1:18765", u) == Error::InvalidUrl);
    TEST_CHECK(parse_url("http://127.0.0.1:18765", u) == Error::InvalidUrl);
    TEST_CHECK(parse_url("ws://:18765", u) == Error::InvalidUrl);
    TEST_CHECK(parse_url("ws://127.0.0.1:", u) == Error::InvalidUrl);
    TEST_CHECK(parse_url("ws://127.0.0.1:0", u) == Error::InvalidUrl);
    TEST_CHECK(parse_url("ws://127.0.0.1:65536", u) == Error::InvalidUrl);
    TEST_CHECK(parse_url("ws://127.0.0.1:+80", u) == Error::InvalidUrl);
    TEST_CHECK(parse_url("ws://127.0.0.1:80x", u) == Error::InvalidUrl);
    TEST_CHECK(u.host.empty());
    std::cout << "[TEST] OK\n";
}

int main() {
    test_host_port_path();
    test_defaults();
    test_malformed();

    std::cout << "\n[PARSE URL TESTS PASSED]\n";
    return 0;
}
