#pragma once

#include "quarry/storage/projected_row.hpp"
#include "quarry/storage/validity_bitmap.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <system_error>
#include <vector>

namespace quarry::storage {

constexpr std::size_t kSlotsPerBlock = 1000U;

// Fixed-capacity columnar block. Every column owns `width * num_slots` bytes
// of a single arena. Slots are handed out in order and never reused.
class ColumnBlock final {
public:
    explicit ColumnBlock(std::vector<std::size_t> column_sizes);

    // CapacityExceeded when full. Explicit nulls leave the column unset.
    [[nodiscard]] std::error_code insert(const ProjectedRow& row);
    [[nodiscard]] std::error_code insert(const ProjectedRow& row, std::size_t& out_record_index);

    // NoSuchRecord past the high-water mark. Explicit nulls clear the column.
    [[nodiscard]] std::error_code update(std::size_t record_index, const ProjectedRow& row);

    // Tombstones the slot: clears validity, zero-fills bytes, clears liveness.
    [[nodiscard]] std::error_code remove(std::size_t record_index);

    // Absent for unallocated or deleted slots, and when none of the requested
    // columns holds a value.
    [[nodiscard]] std::optional<ProjectedRow> row_at_index(std::size_t index,
                                                           std::span<const ColumnId> column_ids) const;

    [[nodiscard]] std::size_t num_slots() const noexcept
    {
        return num_slots_;
    }

    [[nodiscard]] std::size_t num_records() const noexcept
    {
        return num_records_;
    }

    [[nodiscard]] std::size_t column_count() const noexcept
    {
        return column_sizes_.size();
    }

    [[nodiscard]] const std::vector<std::size_t>& column_sizes() const noexcept
    {
        return column_sizes_;
    }

    [[nodiscard]] bool is_full() const noexcept
    {
        return num_records_ == num_slots_;
    }

    [[nodiscard]] bool is_live(std::size_t index) const noexcept;
    [[nodiscard]] std::size_t live_count() const noexcept;
    [[nodiscard]] bool has_value(ColumnId column_id, std::size_t index) const noexcept;

private:
    // Throws before any mutation so a rejected row leaves the block unchanged.
    void require_writable(const ProjectedRow& row) const;
    void write_value(ColumnId column_id, std::size_t record_index, const std::vector<std::byte>& value);
    [[nodiscard]] std::span<const std::byte> cell(ColumnId column_id, std::size_t record_index) const noexcept;
    void require_known_column(ColumnId column_id) const;

    std::size_t num_slots_ = kSlotsPerBlock;
    std::size_t num_records_ = 0U;
    std::vector<std::size_t> column_sizes_{};
    std::vector<std::size_t> column_offsets_{};
    std::vector<std::byte> column_bytes_{};
    std::vector<ValidityBitmap> validity_{};
    ValidityBitmap live_{};
};

}  // namespace quarry::storage
