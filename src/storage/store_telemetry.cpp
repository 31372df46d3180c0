#include "quarry/storage/store_telemetry.hpp"

namespace quarry::storage {

StoreTelemetry::LatencyScope::LatencyScope(StoreTelemetry* telemetry, Operation operation) noexcept
    : telemetry_{telemetry}
    , operation_{operation}
{
    if (telemetry_ != nullptr) {
        start_ = std::chrono::steady_clock::now();
    }
}

StoreTelemetry::LatencyScope::~LatencyScope()
{
    if (telemetry_ == nullptr) {
        return;
    }
    const auto end = std::chrono::steady_clock::now();
    const auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start_);
    const auto duration_ns = elapsed.count() > 0 ? static_cast<std::uint64_t>(elapsed.count()) : 0ULL;
    telemetry_->record_latency(operation_, duration_ns);
}

void StoreTelemetry::record_full_scan(std::size_t rows) noexcept
{
    full_scans_.fetch_add(1U, std::memory_order_relaxed);
    full_scan_rows_.fetch_add(static_cast<std::uint64_t>(rows), std::memory_order_relaxed);
}

void StoreTelemetry::record_point_lookup(bool hit) noexcept
{
    point_lookups_.fetch_add(1U, std::memory_order_relaxed);
    if (hit) {
        point_lookup_hits_.fetch_add(1U, std::memory_order_relaxed);
    } else {
        point_lookup_misses_.fetch_add(1U, std::memory_order_relaxed);
    }
}

void StoreTelemetry::record_scan_failure() noexcept
{
    scan_failures_.fetch_add(1U, std::memory_order_relaxed);
}

void StoreTelemetry::record_write(std::size_t groups, std::size_t rows) noexcept
{
    writes_.fetch_add(1U, std::memory_order_relaxed);
    groups_written_.fetch_add(static_cast<std::uint64_t>(groups), std::memory_order_relaxed);
    rows_written_.fetch_add(static_cast<std::uint64_t>(rows), std::memory_order_relaxed);
}

void StoreTelemetry::record_write_failure() noexcept
{
    write_failures_.fetch_add(1U, std::memory_order_relaxed);
}

void StoreTelemetry::record_partition_append() noexcept
{
    partition_appends_.fetch_add(1U, std::memory_order_relaxed);
}

void StoreTelemetry::record_latency(Operation operation, std::uint64_t duration_ns) noexcept
{
    const auto index = static_cast<std::size_t>(operation);
    if (index >= latencies_.size()) {
        return;
    }

    auto& counters = latencies_[index];
    counters.invocations.fetch_add(1U, std::memory_order_relaxed);
    counters.total_duration_ns.fetch_add(duration_ns, std::memory_order_relaxed);
    counters.last_duration_ns.store(duration_ns, std::memory_order_relaxed);
}

StoreTelemetrySnapshot StoreTelemetry::snapshot() const noexcept
{
    StoreTelemetrySnapshot snapshot{};
    snapshot.full_scans = full_scans_.load(std::memory_order_relaxed);
    snapshot.full_scan_rows = full_scan_rows_.load(std::memory_order_relaxed);
    snapshot.point_lookups = point_lookups_.load(std::memory_order_relaxed);
    snapshot.point_lookup_hits = point_lookup_hits_.load(std::memory_order_relaxed);
    snapshot.point_lookup_misses = point_lookup_misses_.load(std::memory_order_relaxed);
    snapshot.scan_failures = scan_failures_.load(std::memory_order_relaxed);
    snapshot.writes = writes_.load(std::memory_order_relaxed);
    snapshot.write_failures = write_failures_.load(std::memory_order_relaxed);
    snapshot.groups_written = groups_written_.load(std::memory_order_relaxed);
    snapshot.rows_written = rows_written_.load(std::memory_order_relaxed);
    snapshot.partition_appends = partition_appends_.load(std::memory_order_relaxed);

    const auto make_latency_snapshot = [&](Operation operation) {
        StoreTelemetrySnapshot::OperationLatencySnapshot latency{};
        const auto index = static_cast<std::size_t>(operation);
        if (index < latencies_.size()) {
            const auto& counters = latencies_[index];
            latency.invocations = counters.invocations.load(std::memory_order_relaxed);
            latency.total_duration_ns = counters.total_duration_ns.load(std::memory_order_relaxed);
            latency.last_duration_ns = counters.last_duration_ns.load(std::memory_order_relaxed);
        }
        return latency;
    };

    snapshot.full_scan_latency = make_latency_snapshot(Operation::FullScan);
    snapshot.point_lookup_latency = make_latency_snapshot(Operation::PointLookup);
    snapshot.write_latency = make_latency_snapshot(Operation::Write);
    return snapshot;
}

void StoreTelemetry::reset() noexcept
{
    full_scans_.store(0U, std::memory_order_relaxed);
    full_scan_rows_.store(0U, std::memory_order_relaxed);
    point_lookups_.store(0U, std::memory_order_relaxed);
    point_lookup_hits_.store(0U, std::memory_order_relaxed);
    point_lookup_misses_.store(0U, std::memory_order_relaxed);
    scan_failures_.store(0U, std::memory_order_relaxed);
    writes_.store(0U, std::memory_order_relaxed);
    write_failures_.store(0U, std::memory_order_relaxed);
    groups_written_.store(0U, std::memory_order_relaxed);
    rows_written_.store(0U, std::memory_order_relaxed);
    partition_appends_.store(0U, std::memory_order_relaxed);

    for (auto& counters : latencies_) {
        counters.invocations.store(0U, std::memory_order_relaxed);
        counters.total_duration_ns.store(0U, std::memory_order_relaxed);
        counters.last_duration_ns.store(0U, std::memory_order_relaxed);
    }
}

}  // namespace quarry::storage
