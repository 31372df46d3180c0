#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace quarry::storage {

using PrimaryKey = std::int64_t;

struct ColumnDefinition final {
    std::string name{};
    std::size_t width = 0U;
    bool nullable = true;

    friend bool operator==(const ColumnDefinition&, const ColumnDefinition&) = default;
};

class TableSchema final {
public:
    TableSchema() = default;
    TableSchema(std::vector<ColumnDefinition> columns, std::string primary_key_column);

    // SchemaMismatch unless column names are unique and non-empty, widths are
    // non-zero, and the primary key names a non-nullable 1, 2, 4 or 8 byte column.
    [[nodiscard]] std::error_code validate() const;

    // True when batches described by `other` can be stored under this schema:
    // same column names and widths in order, and no nullable column where this
    // schema forbids nulls.
    [[nodiscard]] bool accepts(const TableSchema& other) const noexcept;

    [[nodiscard]] const std::vector<ColumnDefinition>& columns() const noexcept
    {
        return columns_;
    }

    [[nodiscard]] std::size_t column_count() const noexcept
    {
        return columns_.size();
    }

    [[nodiscard]] const ColumnDefinition& column(std::size_t index) const
    {
        return columns_.at(index);
    }

    [[nodiscard]] const std::string& primary_key_column() const noexcept
    {
        return primary_key_column_;
    }

    [[nodiscard]] std::optional<std::size_t> find_column(std::string_view name) const noexcept;
    [[nodiscard]] std::optional<std::size_t> primary_key_index() const noexcept;
    [[nodiscard]] std::vector<std::size_t> column_sizes() const;

    // Schema restricted to the given column indices, in the given order.
    [[nodiscard]] TableSchema project(std::span<const std::size_t> indices) const;

    friend bool operator==(const TableSchema&, const TableSchema&) = default;

private:
    std::vector<ColumnDefinition> columns_{};
    std::string primary_key_column_{};
};

[[nodiscard]] bool is_key_width(std::size_t width) noexcept;

// Little-endian two's complement, sign-extended from the stored width.
[[nodiscard]] PrimaryKey decode_integer(std::span<const std::byte> bytes) noexcept;
[[nodiscard]] std::vector<std::byte> encode_integer(std::int64_t value, std::size_t width);

}  // namespace quarry::storage
