#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace quarry::storage {

enum class StoreOperation : std::uint8_t {
    Create = 0,
    Scan,
    PointLookup,
    Write
};

struct StoreEvent final {
    StoreOperation operation = StoreOperation::Scan;
    std::string identifier{};
    bool success = false;
    std::string status{};
    std::uint64_t rows = 0U;
    std::uint64_t groups = 0U;
    std::uint64_t partitions = 0U;
    double duration_ms = 0.0;
    std::chrono::system_clock::time_point started_at{};
    std::chrono::system_clock::time_point finished_at{};
};

[[nodiscard]] std::string_view to_string(StoreOperation operation) noexcept;

// One JSON object per event, suitable for line-oriented logs.
[[nodiscard]] std::string format_store_event_json(const StoreEvent& event);

}  // namespace quarry::storage
