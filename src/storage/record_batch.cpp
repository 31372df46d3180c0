#include "quarry/storage/record_batch.hpp"

#include "quarry/storage/storage_errors.hpp"

#include <algorithm>
#include <numeric>
#include <utility>

namespace quarry::storage {

namespace {

[[nodiscard]] bool validity_within(const ValidityBitmap& validity, std::size_t num_rows)
{
    bool within = true;
    validity.for_each([&within, num_rows](std::uint32_t index) {
        if (index >= num_rows) {
            within = false;
        }
    });
    return within;
}

}  // namespace

RecordBatch::RecordBatch(std::shared_ptr<const TableSchema> schema, std::vector<BatchColumn> columns, std::size_t num_rows)
    : schema_{std::move(schema)}
    , columns_{std::move(columns)}
    , num_rows_{num_rows}
{
}

std::error_code RecordBatch::make(std::shared_ptr<const TableSchema> schema,
                                  std::vector<BatchColumn> columns,
                                  std::size_t num_rows,
                                  RecordBatch& out)
{
    if (!schema || columns.size() != schema->column_count()) {
        return make_error_code(StorageErrc::SchemaMismatch);
    }
    if (num_rows > kMaxBatchRows) {
        return make_error_code(StorageErrc::CapacityExceeded);
    }

    for (std::size_t index = 0U; index < columns.size(); ++index) {
        const auto& definition = schema->column(index);
        const auto& column = columns[index];
        if (column.data.size() != definition.width * num_rows) {
            return make_error_code(StorageErrc::SchemaMismatch);
        }
        if (!validity_within(column.validity, num_rows)) {
            return make_error_code(StorageErrc::SchemaMismatch);
        }
        if (!definition.nullable && column.validity.count() != num_rows) {
            return make_error_code(StorageErrc::SchemaMismatch);
        }
    }

    out = RecordBatch{std::move(schema), std::move(columns), num_rows};
    return {};
}

bool RecordBatch::is_null(std::size_t column, std::size_t row) const noexcept
{
    if (column >= columns_.size() || row >= num_rows_) {
        return true;
    }
    return !columns_[column].validity.contains(static_cast<std::uint32_t>(row));
}

std::span<const std::byte> RecordBatch::value(std::size_t column, std::size_t row) const noexcept
{
    if (is_null(column, row)) {
        return {};
    }
    const auto width = schema_->column(column).width;
    return std::span<const std::byte>{columns_[column].data}.subspan(row * width, width);
}

ColumnValue RecordBatch::value_at(std::size_t column, std::size_t row) const
{
    if (is_null(column, row)) {
        return std::nullopt;
    }
    const auto bytes = value(column, row);
    return std::vector<std::byte>(bytes.begin(), bytes.end());
}

ProjectedRow RecordBatch::row(std::size_t row) const
{
    std::vector<ColumnId> ids(columns_.size());
    std::iota(ids.begin(), ids.end(), ColumnId{0});
    std::vector<ColumnValue> values;
    values.reserve(columns_.size());
    for (std::size_t column = 0U; column < columns_.size(); ++column) {
        values.push_back(value_at(column, row));
    }
    return ProjectedRow{std::move(ids), std::move(values)};
}

RecordBatch RecordBatch::slice(std::size_t offset, std::size_t length) const
{
    const auto begin = std::min(offset, num_rows_);
    const auto count = std::min(length, num_rows_ - begin);

    std::vector<BatchColumn> sliced;
    sliced.reserve(columns_.size());
    for (std::size_t column = 0U; column < columns_.size(); ++column) {
        const auto width = schema_->column(column).width;
        const auto& source = columns_[column];
        BatchColumn target{};
        const auto first = source.data.begin() + static_cast<std::ptrdiff_t>(begin * width);
        target.data.assign(first, first + static_cast<std::ptrdiff_t>(count * width));
        for (std::size_t row = 0U; row < count; ++row) {
            if (source.validity.contains(static_cast<std::uint32_t>(begin + row))) {
                target.validity.insert(static_cast<std::uint32_t>(row));
            }
        }
        sliced.push_back(std::move(target));
    }
    return RecordBatch{schema_, std::move(sliced), count};
}

RecordBatch RecordBatch::project(std::span<const std::size_t> indices) const
{
    std::vector<BatchColumn> projected;
    projected.reserve(indices.size());
    for (const auto index : indices) {
        projected.push_back(columns_.at(index));
    }
    auto schema = std::make_shared<const TableSchema>(schema_->project(indices));
    return RecordBatch{std::move(schema), std::move(projected), num_rows_};
}

RecordBatchBuilder::RecordBatchBuilder(std::shared_ptr<const TableSchema> schema)
    : schema_{std::move(schema)}
{
    if (schema_) {
        columns_.resize(schema_->column_count());
    }
}

std::error_code RecordBatchBuilder::append_row(std::span<const ColumnValue> values)
{
    if (!schema_ || values.size() != schema_->column_count()) {
        return make_error_code(StorageErrc::SchemaMismatch);
    }
    if (num_rows_ >= kMaxBatchRows) {
        return make_error_code(StorageErrc::CapacityExceeded);
    }
    for (std::size_t column = 0U; column < values.size(); ++column) {
        const auto& definition = schema_->column(column);
        if (!values[column]) {
            if (!definition.nullable) {
                return make_error_code(StorageErrc::SchemaMismatch);
            }
            continue;
        }
        if (values[column]->size() != definition.width) {
            return make_error_code(StorageErrc::SchemaMismatch);
        }
    }

    const auto row = static_cast<std::uint32_t>(num_rows_);
    for (std::size_t column = 0U; column < values.size(); ++column) {
        auto& target = columns_[column];
        if (values[column]) {
            target.data.insert(target.data.end(), values[column]->begin(), values[column]->end());
            target.validity.insert(row);
        } else {
            target.data.resize(target.data.size() + schema_->column(column).width, std::byte{0});
        }
    }
    ++num_rows_;
    return {};
}

RecordBatch RecordBatchBuilder::finish()
{
    std::vector<BatchColumn> columns;
    columns.swap(columns_);
    const auto rows = num_rows_;
    num_rows_ = 0U;
    if (schema_) {
        columns_.resize(schema_->column_count());
    }
    return RecordBatch{schema_, std::move(columns), rows};
}

}  // namespace quarry::storage
