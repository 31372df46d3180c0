#include "quarry/storage/projected_row.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace quarry::storage {

void require_strictly_ascending(std::span<const ColumnId> column_ids, const char* context)
{
    const auto violation = std::adjacent_find(column_ids.begin(), column_ids.end(), [](ColumnId lhs, ColumnId rhs) {
        return lhs >= rhs;
    });
    if (violation != column_ids.end()) {
        throw std::invalid_argument{std::string{context} + " requires strictly ascending column ids"};
    }
}

ProjectedRow::ProjectedRow(std::vector<ColumnId> column_ids, std::vector<ColumnValue> column_values)
    : column_ids_{std::move(column_ids)}
    , column_values_{std::move(column_values)}
{
    if (column_ids_.size() != column_values_.size()) {
        throw std::invalid_argument{"ProjectedRow requires one value per column id"};
    }
    require_strictly_ascending(column_ids_, "ProjectedRow");
}

const ColumnValue* ProjectedRow::find(ColumnId column_id) const noexcept
{
    const auto it = std::lower_bound(column_ids_.begin(), column_ids_.end(), column_id);
    if (it == column_ids_.end() || *it != column_id) {
        return nullptr;
    }
    return &column_values_[static_cast<std::size_t>(it - column_ids_.begin())];
}

}  // namespace quarry::storage
