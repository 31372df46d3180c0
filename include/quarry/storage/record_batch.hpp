#pragma once

#include "quarry/storage/projected_row.hpp"
#include "quarry/storage/table_schema.hpp"
#include "quarry/storage/validity_bitmap.hpp"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <span>
#include <system_error>
#include <vector>

namespace quarry::storage {

// Validity bitmaps address rows with 32-bit positions.
constexpr std::size_t kMaxBatchRows = std::numeric_limits<std::uint32_t>::max();

struct BatchColumn final {
    std::vector<std::byte> data{};
    ValidityBitmap validity{};
};

// Immutable columnar group of rows bound to a schema. Column `i` stores
// `num_rows * width_i` bytes; a row is null in a column when its validity bit
// is unset.
class RecordBatch final {
public:
    RecordBatch() = default;

    // SchemaMismatch when the column count, byte sizes or nulls disagree with
    // the schema; CapacityExceeded above kMaxBatchRows rows.
    [[nodiscard]] static std::error_code make(std::shared_ptr<const TableSchema> schema,
                                              std::vector<BatchColumn> columns,
                                              std::size_t num_rows,
                                              RecordBatch& out);

    [[nodiscard]] const std::shared_ptr<const TableSchema>& schema() const noexcept
    {
        return schema_;
    }

    [[nodiscard]] std::size_t num_rows() const noexcept
    {
        return num_rows_;
    }

    [[nodiscard]] std::size_t num_columns() const noexcept
    {
        return columns_.size();
    }

    [[nodiscard]] bool is_null(std::size_t column, std::size_t row) const noexcept;
    [[nodiscard]] std::span<const std::byte> value(std::size_t column, std::size_t row) const noexcept;
    [[nodiscard]] ColumnValue value_at(std::size_t column, std::size_t row) const;

    // Full row with every column id present.
    [[nodiscard]] ProjectedRow row(std::size_t row) const;

    // Rows [offset, offset + length), clamped to the batch.
    [[nodiscard]] RecordBatch slice(std::size_t offset, std::size_t length) const;

    // Columns in the given order; indices must be below num_columns().
    [[nodiscard]] RecordBatch project(std::span<const std::size_t> indices) const;

private:
    friend class RecordBatchBuilder;

    RecordBatch(std::shared_ptr<const TableSchema> schema, std::vector<BatchColumn> columns, std::size_t num_rows);

    std::shared_ptr<const TableSchema> schema_{};
    std::vector<BatchColumn> columns_{};
    std::size_t num_rows_ = 0U;
};

class RecordBatchBuilder final {
public:
    explicit RecordBatchBuilder(std::shared_ptr<const TableSchema> schema);

    // One value per schema column. SchemaMismatch on a wrong count, a wrong
    // byte width, or a null in a non-nullable column; CapacityExceeded once the
    // batch holds kMaxBatchRows rows. The builder is unchanged on failure.
    [[nodiscard]] std::error_code append_row(std::span<const ColumnValue> values);

    [[nodiscard]] std::size_t row_count() const noexcept
    {
        return num_rows_;
    }

    // Hands over the accumulated rows and resets the builder.
    [[nodiscard]] RecordBatch finish();

private:
    std::shared_ptr<const TableSchema> schema_{};
    std::vector<BatchColumn> columns_{};
    std::size_t num_rows_ = 0U;
};

}  // namespace quarry::storage
