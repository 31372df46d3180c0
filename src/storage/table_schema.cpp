#include "quarry/storage/table_schema.hpp"

#include "quarry/storage/storage_errors.hpp"

#include <algorithm>
#include <unordered_set>
#include <utility>

namespace quarry::storage {

TableSchema::TableSchema(std::vector<ColumnDefinition> columns, std::string primary_key_column)
    : columns_{std::move(columns)}
    , primary_key_column_{std::move(primary_key_column)}
{
}

std::error_code TableSchema::validate() const
{
    std::unordered_set<std::string_view> names;
    for (const auto& column : columns_) {
        if (column.name.empty() || column.width == 0U) {
            return make_error_code(StorageErrc::SchemaMismatch);
        }
        if (!names.insert(column.name).second) {
            return make_error_code(StorageErrc::SchemaMismatch);
        }
    }

    const auto key_index = primary_key_index();
    if (!key_index) {
        return make_error_code(StorageErrc::SchemaMismatch);
    }
    const auto& key_column = columns_[*key_index];
    if (key_column.nullable || !is_key_width(key_column.width)) {
        return make_error_code(StorageErrc::SchemaMismatch);
    }
    return {};
}

bool TableSchema::accepts(const TableSchema& other) const noexcept
{
    if (columns_.size() != other.columns_.size()) {
        return false;
    }
    for (std::size_t index = 0U; index < columns_.size(); ++index) {
        const auto& mine = columns_[index];
        const auto& theirs = other.columns_[index];
        if (mine.name != theirs.name || mine.width != theirs.width) {
            return false;
        }
        if (!mine.nullable && theirs.nullable) {
            return false;
        }
    }
    return true;
}

std::optional<std::size_t> TableSchema::find_column(std::string_view name) const noexcept
{
    const auto it = std::find_if(columns_.begin(), columns_.end(), [name](const ColumnDefinition& column) {
        return column.name == name;
    });
    if (it == columns_.end()) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(it - columns_.begin());
}

std::optional<std::size_t> TableSchema::primary_key_index() const noexcept
{
    return find_column(primary_key_column_);
}

std::vector<std::size_t> TableSchema::column_sizes() const
{
    std::vector<std::size_t> sizes;
    sizes.reserve(columns_.size());
    for (const auto& column : columns_) {
        sizes.push_back(column.width);
    }
    return sizes;
}

TableSchema TableSchema::project(std::span<const std::size_t> indices) const
{
    std::vector<ColumnDefinition> projected;
    projected.reserve(indices.size());
    for (const auto index : indices) {
        projected.push_back(columns_.at(index));
    }
    return TableSchema{std::move(projected), primary_key_column_};
}

bool is_key_width(std::size_t width) noexcept
{
    return width == 1U || width == 2U || width == 4U || width == 8U;
}

PrimaryKey decode_integer(std::span<const std::byte> bytes) noexcept
{
    const auto width = std::min<std::size_t>(bytes.size(), sizeof(std::uint64_t));
    if (width == 0U) {
        return 0;
    }

    std::uint64_t raw = 0U;
    for (std::size_t index = 0U; index < width; ++index) {
        raw |= static_cast<std::uint64_t>(std::to_integer<std::uint8_t>(bytes[index])) << (8U * index);
    }
    if (width < sizeof(std::uint64_t)) {
        const auto sign_bit = std::uint64_t{1} << (8U * width - 1U);
        if ((raw & sign_bit) != 0U) {
            raw |= ~((sign_bit << 1U) - 1U);
        }
    }
    return static_cast<PrimaryKey>(raw);
}

std::vector<std::byte> encode_integer(std::int64_t value, std::size_t width)
{
    std::vector<std::byte> bytes(width, std::byte{0});
    const auto raw = static_cast<std::uint64_t>(value);
    for (std::size_t index = 0U; index < width && index < sizeof(std::uint64_t); ++index) {
        bytes[index] = static_cast<std::byte>((raw >> (8U * index)) & 0xFFU);
    }
    return bytes;
}

}  // namespace quarry::storage
