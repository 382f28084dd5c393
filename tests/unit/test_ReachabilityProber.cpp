#include <catch2/catch_test_macros.hpp>

#include "helpers/FakeServices.hpp"

using namespace hostwatch::core;
using namespace hostwatch::test;

namespace {
const Host TEST_HOST{"example.com", 80};
constexpr std::chrono::milliseconds TIMEOUT{100};
} // namespace

TEST_CASE("probeWithRetry stops at the first success", "[ReachabilityProber]") {
    SECTION("First attempt succeeds") {
        SequenceProber prober({true});

        REQUIRE(prober.probeWithRetry(TEST_HOST, TIMEOUT, 3));
        REQUIRE(prober.calls == 1);
    }

    SECTION("Second attempt succeeds") {
        SequenceProber prober({false, true});

        REQUIRE(prober.probeWithRetry(TEST_HOST, TIMEOUT, 3));
        REQUIRE(prober.calls == 2);
    }

    SECTION("Last attempt succeeds") {
        SequenceProber prober({false, false, true});

        REQUIRE(prober.probeWithRetry(TEST_HOST, TIMEOUT, 3));
        REQUIRE(prober.calls == 3);
    }
}

TEST_CASE("probeWithRetry gives up after maxAttempts", "[ReachabilityProber]") {
    SECTION("Every attempt fails") {
        SequenceProber prober({false, false, false, true});

        REQUIRE_FALSE(prober.probeWithRetry(TEST_HOST, TIMEOUT, 3));
        REQUIRE(prober.calls == 3);
    }

    SECTION("A single attempt is made when maxAttempts is 1") {
        SequenceProber prober({false, true});

        REQUIRE_FALSE(prober.probeWithRetry(TEST_HOST, TIMEOUT, 1));
        REQUIRE(prober.calls == 1);
    }

    SECTION("maxAttempts below 1 still makes one attempt") {
        SequenceProber zero({true});
        SequenceProber negative({false});

        REQUIRE(zero.probeWithRetry(TEST_HOST, TIMEOUT, 0));
        REQUIRE(zero.calls == 1);
        REQUIRE_FALSE(negative.probeWithRetry(TEST_HOST, TIMEOUT, -5));
        REQUIRE(negative.calls == 1);
    }
}

TEST_CASE("probeWithRetry passes the timeout to every attempt", "[ReachabilityProber]") {
    FakeProber prober;

    REQUIRE_FALSE(prober.probeWithRetry(TEST_HOST, std::chrono::milliseconds(1234), 2));
    REQUIRE(prober.calls(TEST_HOST) == 2);
    REQUIRE(prober.lastTimeout() == std::chrono::milliseconds(1234));
}
