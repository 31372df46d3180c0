#include "quarry/storage/column_block.hpp"

#include "quarry/storage/storage_errors.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <string>
#include <utility>

namespace quarry::storage {

namespace {

[[nodiscard]] std::uint32_t to_bit(std::size_t index) noexcept
{
    return static_cast<std::uint32_t>(index);
}

}  // namespace

ColumnBlock::ColumnBlock(std::vector<std::size_t> column_sizes)
    : column_sizes_{std::move(column_sizes)}
    , live_{kSlotsPerBlock}
{
    column_offsets_.reserve(column_sizes_.size());
    validity_.reserve(column_sizes_.size());
    std::size_t offset = 0U;
    for (const auto size : column_sizes_) {
        column_offsets_.push_back(offset);
        offset += size * num_slots_;
        validity_.emplace_back(num_slots_);
    }
    column_bytes_.assign(offset, std::byte{0});
}

std::error_code ColumnBlock::insert(const ProjectedRow& row)
{
    std::size_t ignored = 0U;
    return insert(row, ignored);
}

std::error_code ColumnBlock::insert(const ProjectedRow& row, std::size_t& out_record_index)
{
    if (num_records_ == num_slots_) {
        return make_error_code(StorageErrc::CapacityExceeded);
    }
    require_writable(row);

    const auto record_index = num_records_;
    const auto& ids = row.column_ids();
    const auto& values = row.column_values();
    std::size_t row_index = 0U;
    for (ColumnId column_id = 0U; column_id < column_sizes_.size() && row_index < ids.size(); ++column_id) {
        if (ids[row_index] != column_id) {
            continue;
        }
        if (values[row_index]) {
            write_value(column_id, record_index, *values[row_index]);
            validity_[column_id].insert(to_bit(record_index));
        }
        ++row_index;
    }

    ++num_records_;
    live_.insert(to_bit(record_index));
    out_record_index = record_index;
    return {};
}

std::error_code ColumnBlock::update(std::size_t record_index, const ProjectedRow& row)
{
    if (record_index >= num_records_) {
        return make_error_code(StorageErrc::NoSuchRecord);
    }
    require_writable(row);

    const auto& ids = row.column_ids();
    const auto& values = row.column_values();
    for (std::size_t row_index = 0U; row_index < ids.size(); ++row_index) {
        const auto column_id = ids[row_index];
        if (values[row_index]) {
            write_value(column_id, record_index, *values[row_index]);
            validity_[column_id].insert(to_bit(record_index));
        } else {
            validity_[column_id].remove(to_bit(record_index));
        }
    }
    return {};
}

std::error_code ColumnBlock::remove(std::size_t record_index)
{
    if (record_index >= num_records_) {
        return make_error_code(StorageErrc::NoSuchRecord);
    }

    for (auto& bitmap : validity_) {
        bitmap.remove(to_bit(record_index));
    }
    for (ColumnId column_id = 0U; column_id < column_sizes_.size(); ++column_id) {
        const auto size = column_sizes_[column_id];
        const auto start = column_offsets_[column_id] + size * record_index;
        std::fill_n(column_bytes_.begin() + static_cast<std::ptrdiff_t>(start), size, std::byte{0});
    }
    live_.remove(to_bit(record_index));
    // num_records_ is a high-water mark.
    return {};
}

std::optional<ProjectedRow> ColumnBlock::row_at_index(std::size_t index, std::span<const ColumnId> column_ids) const
{
    require_strictly_ascending(column_ids, "ColumnBlock::row_at_index");
    if (!column_ids.empty()) {
        require_known_column(column_ids.back());
    }
    if (index >= num_records_ || !live_.contains(to_bit(index))) {
        return std::nullopt;
    }

    std::vector<ColumnValue> column_values;
    column_values.reserve(column_ids.size());
    bool has_value = false;
    for (const auto column_id : column_ids) {
        if (validity_[column_id].contains(to_bit(index))) {
            has_value = true;
            const auto bytes = cell(column_id, index);
            column_values.emplace_back(std::vector<std::byte>(bytes.begin(), bytes.end()));
        } else {
            column_values.emplace_back(std::nullopt);
        }
    }

    if (!has_value) {
        return std::nullopt;
    }
    return ProjectedRow{std::vector<ColumnId>(column_ids.begin(), column_ids.end()), std::move(column_values)};
}

bool ColumnBlock::is_live(std::size_t index) const noexcept
{
    return index < num_records_ && live_.contains(to_bit(index));
}

std::size_t ColumnBlock::live_count() const noexcept
{
    return live_.count();
}

bool ColumnBlock::has_value(ColumnId column_id, std::size_t index) const noexcept
{
    if (column_id >= validity_.size() || index >= num_records_) {
        return false;
    }
    return validity_[column_id].contains(to_bit(index));
}

void ColumnBlock::write_value(ColumnId column_id, std::size_t record_index, const std::vector<std::byte>& value)
{
    const auto size = column_sizes_[column_id];
    if (size == 0U) {
        return;
    }
    const auto start = column_offsets_[column_id] + record_index * size;
    std::memcpy(column_bytes_.data() + start, value.data(), size);
}

std::span<const std::byte> ColumnBlock::cell(ColumnId column_id, std::size_t record_index) const noexcept
{
    const auto size = column_sizes_[column_id];
    const auto start = column_offsets_[column_id] + record_index * size;
    return {column_bytes_.data() + start, size};
}

void ColumnBlock::require_writable(const ProjectedRow& row) const
{
    const auto& ids = row.column_ids();
    const auto& values = row.column_values();
    if (!ids.empty()) {
        require_known_column(ids.back());
    }
    for (std::size_t row_index = 0U; row_index < ids.size(); ++row_index) {
        const auto size = column_sizes_[ids[row_index]];
        if (values[row_index] && values[row_index]->size() < size) {
            throw std::invalid_argument{"ColumnBlock value for column " + std::to_string(ids[row_index])
                                        + " is shorter than " + std::to_string(size) + " bytes"};
        }
    }
}

void ColumnBlock::require_known_column(ColumnId column_id) const
{
    if (column_id >= column_sizes_.size()) {
        throw std::invalid_argument{"ColumnBlock has no column " + std::to_string(column_id)};
    }
}

}  // namespace quarry::storage
