#include <catch2/catch_test_macros.hpp>
#include "../src/backoff.hpp"
#include <stdexcept>

using std::chrono::milliseconds;

TEST_CASE("Backoff policy", "[backoff]") {
    SECTION("Fixed strategy always waits the base delay") {
        BackoffPolicy policy(BackoffStrategy::Fixed, milliseconds(5000), milliseconds(60000));

        REQUIRE(policy.next_delay() == milliseconds(0));
        REQUIRE(policy.record_failure() == milliseconds(5000));
        REQUIRE(policy.record_failure() == milliseconds(5000));
        REQUIRE(policy.record_failure() == milliseconds(5000));
        REQUIRE(policy.consecutive_failures() == 3);
    }

    SECTION("Exponential strategy grows and caps") {
        BackoffPolicy policy(BackoffStrategy::Exponential, milliseconds(1000),
                             milliseconds(5000), 2.0);

        REQUIRE(policy.record_failure() == milliseconds(1000));
        REQUIRE(policy.record_failure() == milliseconds(2000));
        REQUIRE(policy.record_failure() == milliseconds(4000));
        REQUIRE(policy.record_failure() == milliseconds(5000));
        REQUIRE(policy.record_failure() == milliseconds(5000));
        REQUIRE(policy.next_delay() == milliseconds(5000));
    }

    SECTION("Success resets the failure count") {
        BackoffPolicy policy(BackoffStrategy::Exponential, milliseconds(100),
                             milliseconds(10000), 3.0);
        policy.record_failure();
        policy.record_failure();
        policy.record_success();

        REQUIRE(policy.consecutive_failures() == 0);
        REQUIRE(policy.next_delay() == milliseconds(0));
        REQUIRE(policy.record_failure() == milliseconds(100));
    }

    SECTION("Strategy names") {
        REQUIRE(parse_backoff_strategy("fixed") == BackoffStrategy::Fixed);
        REQUIRE(parse_backoff_strategy("exponential") == BackoffStrategy::Exponential);
        REQUIRE_THROWS_AS(parse_backoff_strategy("linear"), std::invalid_argument);
        REQUIRE(std::string(to_string(BackoffStrategy::Exponential)) == "exponential");
    }
}
