#include "quarry/storage/storage_errors.hpp"
#include "quarry/storage/table_schema.hpp"

#include <catch2/catch.hpp>

#include <array>
#include <vector>

using quarry::storage::ColumnDefinition;
using quarry::storage::StorageErrc;
using quarry::storage::TableSchema;

namespace {

TableSchema make_schema()
{
    return TableSchema{{ColumnDefinition{"id", 4U, false}, ColumnDefinition{"score", 8U}, ColumnDefinition{"flag", 1U}}, "id"};
}

}  // namespace

TEST_CASE("TableSchema validates column and key definitions")
{
    CHECK_FALSE(make_schema().validate());

    const auto mismatch = quarry::storage::make_error_code(StorageErrc::SchemaMismatch);
    CHECK(TableSchema{{ColumnDefinition{"id", 4U, false}, ColumnDefinition{"id", 2U}}, "id"}.validate() == mismatch);
    CHECK(TableSchema{{ColumnDefinition{"id", 4U, false}, ColumnDefinition{"", 2U}}, "id"}.validate() == mismatch);
    CHECK(TableSchema{{ColumnDefinition{"id", 4U, false}, ColumnDefinition{"pad", 0U}}, "id"}.validate() == mismatch);
    CHECK(TableSchema{{ColumnDefinition{"id", 4U, false}}, "missing"}.validate() == mismatch);
    CHECK(TableSchema{{ColumnDefinition{"id", 4U, true}}, "id"}.validate() == mismatch);
    CHECK(TableSchema{{ColumnDefinition{"id", 3U, false}}, "id"}.validate() == mismatch);
}

TEST_CASE("TableSchema accepts batches with matching columns")
{
    const auto schema = make_schema();
    CHECK(schema.accepts(schema));

    auto reordered = TableSchema{{ColumnDefinition{"score", 8U}, ColumnDefinition{"id", 4U, false}, ColumnDefinition{"flag", 1U}}, "id"};
    CHECK_FALSE(schema.accepts(reordered));

    auto widened = TableSchema{{ColumnDefinition{"id", 8U, false}, ColumnDefinition{"score", 8U}, ColumnDefinition{"flag", 1U}}, "id"};
    CHECK_FALSE(schema.accepts(widened));

    auto nullable_key = TableSchema{{ColumnDefinition{"id", 4U, true}, ColumnDefinition{"score", 8U}, ColumnDefinition{"flag", 1U}}, "id"};
    CHECK_FALSE(schema.accepts(nullable_key));
    CHECK(nullable_key.accepts(schema));
}

TEST_CASE("TableSchema lookups and projection")
{
    const auto schema = make_schema();
    CHECK(schema.find_column("score") == std::optional<std::size_t>{1U});
    CHECK_FALSE(schema.find_column("nope").has_value());
    CHECK(schema.primary_key_index() == std::optional<std::size_t>{0U});
    CHECK(schema.column_sizes() == std::vector<std::size_t>{4U, 8U, 1U});

    const std::array<std::size_t, 2> indices{2U, 0U};
    const auto projected = schema.project(indices);
    REQUIRE(projected.column_count() == 2U);
    CHECK(projected.column(0U).name == "flag");
    CHECK(projected.column(1U).name == "id");
    CHECK(projected.primary_key_column() == "id");
}

TEST_CASE("Integer keys decode little-endian with sign extension")
{
    using quarry::storage::decode_integer;
    using quarry::storage::encode_integer;

    CHECK(decode_integer(encode_integer(42, 4U)) == 42);
    CHECK(decode_integer(encode_integer(-1, 1U)) == -1);
    CHECK(decode_integer(encode_integer(-300, 2U)) == -300);
    CHECK(decode_integer(encode_integer(-5'000'000'000LL, 8U)) == -5'000'000'000LL);

    const std::vector<std::byte> raw{std::byte{0x01}, std::byte{0x02}};
    CHECK(decode_integer(raw) == 0x0201);
    CHECK(encode_integer(0x0102, 2U) == std::vector<std::byte>{std::byte{0x02}, std::byte{0x01}});

    CHECK(quarry::storage::is_key_width(8U));
    CHECK_FALSE(quarry::storage::is_key_width(3U));
}
