#include "quarry/storage/block_table.hpp"

#include "quarry/storage/storage_errors.hpp"

#include <utility>

namespace quarry::storage {

BlockTable::BlockTable(std::vector<std::size_t> column_sizes)
    : column_sizes_{std::move(column_sizes)}
{
}

std::optional<ProjectedRow> BlockTable::get_row(TupleLocator locator, std::span<const ColumnId> column_ids) const
{
    const auto* target = block(locator.block_index);
    if (target == nullptr) {
        return std::nullopt;
    }
    return target->row_at_index(locator.row_index, column_ids);
}

std::error_code BlockTable::insert(const ProjectedRow& row, TupleLocator& out_locator)
{
    if (blocks_.empty() || blocks_.back().is_full()) {
        blocks_.emplace_back(column_sizes_);
    }

    std::size_t record_index = 0U;
    if (auto ec = blocks_.back().insert(row, record_index); ec) {
        return ec;
    }
    out_locator = TupleLocator{blocks_.size() - 1U, record_index};
    return {};
}

std::error_code BlockTable::update(TupleLocator locator, const ProjectedRow& row)
{
    auto* target = mutable_block(locator.block_index);
    if (target == nullptr) {
        return make_error_code(StorageErrc::NoSuchRecord);
    }
    return target->update(locator.row_index, row);
}

std::error_code BlockTable::remove(TupleLocator locator)
{
    auto* target = mutable_block(locator.block_index);
    if (target == nullptr) {
        return make_error_code(StorageErrc::NoSuchRecord);
    }
    return target->remove(locator.row_index);
}

const ColumnBlock* BlockTable::block(std::size_t block_index) const noexcept
{
    if (block_index >= blocks_.size()) {
        return nullptr;
    }
    return &blocks_[block_index];
}

std::size_t BlockTable::live_row_count() const noexcept
{
    std::size_t total = 0U;
    for (const auto& entry : blocks_) {
        total += entry.live_count();
    }
    return total;
}

ColumnBlock* BlockTable::mutable_block(std::size_t block_index) noexcept
{
    if (block_index >= blocks_.size()) {
        return nullptr;
    }
    return &blocks_[block_index];
}

}  // namespace quarry::storage
