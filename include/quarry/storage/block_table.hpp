#pragma once

#include "quarry/storage/column_block.hpp"
#include "quarry/storage/projected_row.hpp"
#include "quarry/storage/tuple_locator.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <system_error>
#include <vector>

namespace quarry::storage {

// Ordered sequence of blocks sharing one column layout. Not internally
// synchronized; callers serialize mutations.
class BlockTable final {
public:
    explicit BlockTable(std::vector<std::size_t> column_sizes);

    // Absent for an unknown block, an unallocated or deleted slot, or a row
    // whose requested columns are all null.
    [[nodiscard]] std::optional<ProjectedRow> get_row(TupleLocator locator,
                                                      std::span<const ColumnId> column_ids) const;

    // Appends to the last block, opening a new one once it is full.
    [[nodiscard]] std::error_code insert(const ProjectedRow& row, TupleLocator& out_locator);
    [[nodiscard]] std::error_code update(TupleLocator locator, const ProjectedRow& row);
    [[nodiscard]] std::error_code remove(TupleLocator locator);

    [[nodiscard]] std::size_t block_count() const noexcept
    {
        return blocks_.size();
    }

    [[nodiscard]] const ColumnBlock* block(std::size_t block_index) const noexcept;

    [[nodiscard]] const std::vector<std::size_t>& column_sizes() const noexcept
    {
        return column_sizes_;
    }

    [[nodiscard]] std::size_t live_row_count() const noexcept;

private:
    [[nodiscard]] ColumnBlock* mutable_block(std::size_t block_index) noexcept;

    std::vector<std::size_t> column_sizes_{};
    std::vector<ColumnBlock> blocks_{};
};

}  // namespace quarry::storage
