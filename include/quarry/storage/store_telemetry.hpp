#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>

namespace quarry::storage {

struct StoreTelemetrySnapshot final {
    struct OperationLatencySnapshot final {
        std::uint64_t invocations = 0U;
        std::uint64_t total_duration_ns = 0U;
        std::uint64_t last_duration_ns = 0U;
    };

    std::uint64_t full_scans = 0U;
    std::uint64_t full_scan_rows = 0U;
    std::uint64_t point_lookups = 0U;
    std::uint64_t point_lookup_hits = 0U;
    std::uint64_t point_lookup_misses = 0U;
    std::uint64_t scan_failures = 0U;
    std::uint64_t writes = 0U;
    std::uint64_t write_failures = 0U;
    std::uint64_t groups_written = 0U;
    std::uint64_t rows_written = 0U;
    std::uint64_t partition_appends = 0U;

    OperationLatencySnapshot full_scan_latency{};
    OperationLatencySnapshot point_lookup_latency{};
    OperationLatencySnapshot write_latency{};
};

class StoreTelemetry final {
public:
    enum class Operation {
        FullScan = 0,
        PointLookup,
        Write,
        Count
    };

    class LatencyScope final {
    public:
        LatencyScope(StoreTelemetry* telemetry, Operation operation) noexcept;
        ~LatencyScope();

        LatencyScope(const LatencyScope&) = delete;
        LatencyScope& operator=(const LatencyScope&) = delete;

    private:
        StoreTelemetry* telemetry_ = nullptr;
        Operation operation_ = Operation::FullScan;
        std::chrono::steady_clock::time_point start_{};
    };

    void record_full_scan(std::size_t rows) noexcept;
    void record_point_lookup(bool hit) noexcept;
    void record_scan_failure() noexcept;
    void record_write(std::size_t groups, std::size_t rows) noexcept;
    void record_write_failure() noexcept;
    void record_partition_append() noexcept;

    void record_latency(Operation operation, std::uint64_t duration_ns) noexcept;

    [[nodiscard]] StoreTelemetrySnapshot snapshot() const noexcept;
    void reset() noexcept;

private:
    struct OperationLatencyCounters final {
        std::atomic<std::uint64_t> invocations{0U};
        std::atomic<std::uint64_t> total_duration_ns{0U};
        std::atomic<std::uint64_t> last_duration_ns{0U};
    };

    std::atomic<std::uint64_t> full_scans_{0U};
    std::atomic<std::uint64_t> full_scan_rows_{0U};
    std::atomic<std::uint64_t> point_lookups_{0U};
    std::atomic<std::uint64_t> point_lookup_hits_{0U};
    std::atomic<std::uint64_t> point_lookup_misses_{0U};
    std::atomic<std::uint64_t> scan_failures_{0U};
    std::atomic<std::uint64_t> writes_{0U};
    std::atomic<std::uint64_t> write_failures_{0U};
    std::atomic<std::uint64_t> groups_written_{0U};
    std::atomic<std::uint64_t> rows_written_{0U};
    std::atomic<std::uint64_t> partition_appends_{0U};

    std::array<OperationLatencyCounters, static_cast<std::size_t>(Operation::Count)> latencies_{};
};

}  // namespace quarry::storage
