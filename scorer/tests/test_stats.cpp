#include <catch2/catch_test_macros.hpp>
#include "../src/stats.hpp"
#include <thread>
#include <vector>

TEST_CASE("Stats tracker", "[stats]") {
    StatsTracker stats;

    SECTION("Starts empty") {
        auto snap = stats.snapshot();
        REQUIRE(snap.processed_count == 0);
        REQUIRE_FALSE(snap.last_processed_timestamp.has_value());

        auto j = snap.to_json();
        REQUIRE(j["last_processed_timestamp"].is_null());
        REQUIRE(j["processed_count"] == 0);
    }

    SECTION("Each outcome counts once toward processed") {
        stats.record_success(100);
        stats.record_failure(200);
        stats.record_success(150);

        auto snap = stats.snapshot();
        REQUIRE(snap.processed_count == 3);
        REQUIRE(snap.success_count == 2);
        REQUIRE(snap.failure_count == 1);
        REQUIRE(snap.last_processed_timestamp == std::optional<int64_t>(150));

        auto j = snap.to_json();
        REQUIRE(j["success_count"] == 2);
        REQUIRE(j["failure_count"] == 1);
        REQUIRE(j["last_processed_timestamp"] == 150);
    }

    SECTION("Snapshots never tear under a concurrent writer") {
        constexpr int kWrites = 20000;
        std::thread writer([&stats] {
            for (int i = 0; i < kWrites; ++i) {
                if (i % 3 == 0) {
                    stats.record_failure(i);
                } else {
                    stats.record_success(i);
                }
            }
        });

        for (int i = 0; i < 2000; ++i) {
            auto snap = stats.snapshot();
            REQUIRE(snap.processed_count == snap.success_count + snap.failure_count);
        }
        writer.join();

        REQUIRE(stats.snapshot().processed_count == kWrites);
    }
}
