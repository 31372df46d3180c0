#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

namespace quarry::storage {

using ColumnId = std::size_t;
using ColumnValue = std::optional<std::vector<std::byte>>;

// Throws std::invalid_argument unless ids are strictly ascending.
void require_strictly_ascending(std::span<const ColumnId> column_ids, const char* context);

// Row restricted to a sorted, duplicate-free subset of columns. A disengaged
// value marks an explicit null for that column.
class ProjectedRow final {
public:
    ProjectedRow() = default;
    ProjectedRow(std::vector<ColumnId> column_ids, std::vector<ColumnValue> column_values);

    [[nodiscard]] const std::vector<ColumnId>& column_ids() const noexcept
    {
        return column_ids_;
    }

    [[nodiscard]] const std::vector<ColumnValue>& column_values() const noexcept
    {
        return column_values_;
    }

    [[nodiscard]] std::size_t size() const noexcept
    {
        return column_ids_.size();
    }

    [[nodiscard]] bool empty() const noexcept
    {
        return column_ids_.empty();
    }

    // Value for a column id, or nullptr when the id is not part of the row.
    [[nodiscard]] const ColumnValue* find(ColumnId column_id) const noexcept;

    friend bool operator==(const ProjectedRow& lhs, const ProjectedRow& rhs) = default;

private:
    std::vector<ColumnId> column_ids_{};
    std::vector<ColumnValue> column_values_{};
};

}  // namespace quarry::storage
