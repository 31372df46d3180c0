#include "quarry/storage/store_telemetry.hpp"

#include <catch2/catch.hpp>

#include <thread>
#include <vector>

using quarry::storage::StoreTelemetry;

TEST_CASE("StoreTelemetry accumulates scan and write counters")
{
    StoreTelemetry telemetry;
    telemetry.record_full_scan(10U);
    telemetry.record_full_scan(5U);
    telemetry.record_point_lookup(true);
    telemetry.record_point_lookup(false);
    telemetry.record_point_lookup(false);
    telemetry.record_scan_failure();
    telemetry.record_write(3U, 30U);
    telemetry.record_write_failure();
    telemetry.record_partition_append();
    telemetry.record_partition_append();

    const auto snapshot = telemetry.snapshot();
    CHECK(snapshot.full_scans == 2U);
    CHECK(snapshot.full_scan_rows == 15U);
    CHECK(snapshot.point_lookups == 3U);
    CHECK(snapshot.point_lookup_hits == 1U);
    CHECK(snapshot.point_lookup_misses == 2U);
    CHECK(snapshot.scan_failures == 1U);
    CHECK(snapshot.writes == 1U);
    CHECK(snapshot.write_failures == 1U);
    CHECK(snapshot.groups_written == 3U);
    CHECK(snapshot.rows_written == 30U);
    CHECK(snapshot.partition_appends == 2U);
}

TEST_CASE("StoreTelemetry latency scopes record per operation")
{
    StoreTelemetry telemetry;
    {
        StoreTelemetry::LatencyScope scope{&telemetry, StoreTelemetry::Operation::PointLookup};
    }
    {
        StoreTelemetry::LatencyScope scope{nullptr, StoreTelemetry::Operation::Write};
    }
    telemetry.record_latency(StoreTelemetry::Operation::Write, 250U);
    telemetry.record_latency(StoreTelemetry::Operation::Write, 50U);

    const auto snapshot = telemetry.snapshot();
    CHECK(snapshot.point_lookup_latency.invocations == 1U);
    CHECK(snapshot.full_scan_latency.invocations == 0U);
    CHECK(snapshot.write_latency.invocations == 2U);
    CHECK(snapshot.write_latency.total_duration_ns == 300U);
    CHECK(snapshot.write_latency.last_duration_ns == 50U);
}

TEST_CASE("StoreTelemetry reset clears everything")
{
    StoreTelemetry telemetry;
    telemetry.record_write(1U, 1U);
    telemetry.record_latency(StoreTelemetry::Operation::FullScan, 10U);
    telemetry.reset();

    const auto snapshot = telemetry.snapshot();
    CHECK(snapshot.writes == 0U);
    CHECK(snapshot.rows_written == 0U);
    CHECK(snapshot.full_scan_latency.invocations == 0U);
    CHECK(snapshot.full_scan_latency.total_duration_ns == 0U);
}

TEST_CASE("StoreTelemetry counters tolerate concurrent writers")
{
    StoreTelemetry telemetry;
    std::vector<std::thread> workers;
    for (int worker = 0; worker < 4; ++worker) {
        workers.emplace_back([&telemetry] {
            for (int iteration = 0; iteration < 1000; ++iteration) {
                telemetry.record_point_lookup(iteration % 2 == 0);
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    const auto snapshot = telemetry.snapshot();
    CHECK(snapshot.point_lookups == 4000U);
    CHECK(snapshot.point_lookup_hits == 2000U);
    CHECK(snapshot.point_lookup_misses == 2000U);
}
