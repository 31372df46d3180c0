#include "quarry/storage/primary_key_index.hpp"
#include "quarry/storage/storage_errors.hpp"

#include <catch2/catch.hpp>

#include <array>
#include <memory>
#include <vector>

using quarry::storage::BatchRowLocator;
using quarry::storage::ColumnDefinition;
using quarry::storage::ColumnValue;
using quarry::storage::PrimaryKey;
using quarry::storage::PrimaryKeyIndex;
using quarry::storage::RecordBatch;
using quarry::storage::RecordBatchBuilder;
using quarry::storage::StorageErrc;
using quarry::storage::TableSchema;

namespace {

std::shared_ptr<const TableSchema> make_schema(bool nullable_key = false)
{
    return std::make_shared<const TableSchema>(
        TableSchema{{ColumnDefinition{"payload", 1U}, ColumnDefinition{"id", 2U, nullable_key}}, "id"});
}

RecordBatch make_batch(std::initializer_list<PrimaryKey> keys)
{
    RecordBatchBuilder builder{make_schema()};
    for (const auto key : keys) {
        const std::array<ColumnValue, 2> values{ColumnValue{}, quarry::storage::encode_integer(key, 2U)};
        REQUIRE_FALSE(builder.append_row(values));
    }
    return builder.finish();
}

}  // namespace

TEST_CASE("PrimaryKeyIndex maps every key to its batch row")
{
    const std::vector<std::vector<RecordBatch>> partitions{
        {make_batch({5, 3}), make_batch({-7})},
        {},
        {make_batch({100})},
    };

    PrimaryKeyIndex index;
    REQUIRE_FALSE(index.build(partitions, 1U));
    CHECK(index.size() == 4U);
    CHECK(index.find(5) == std::optional<BatchRowLocator>{BatchRowLocator{0U, 0U, 0U}});
    CHECK(index.find(3) == std::optional<BatchRowLocator>{BatchRowLocator{0U, 0U, 1U}});
    CHECK(index.find(-7) == std::optional<BatchRowLocator>{BatchRowLocator{0U, 1U, 0U}});
    CHECK(index.find(100) == std::optional<BatchRowLocator>{BatchRowLocator{2U, 0U, 0U}});
    CHECK_FALSE(index.find(4).has_value());
    CHECK(index.contains(100));
    CHECK_FALSE(index.contains(101));
}

TEST_CASE("PrimaryKeyIndex visits keys in ascending order")
{
    const std::vector<std::vector<RecordBatch>> partitions{{make_batch({9, -2, 4})}};
    PrimaryKeyIndex index;
    REQUIRE_FALSE(index.build(partitions, 1U));

    std::vector<PrimaryKey> keys;
    index.for_each([&keys](PrimaryKey key, const BatchRowLocator&) { keys.push_back(key); });
    CHECK(keys == std::vector<PrimaryKey>{-2, 4, 9});
}

TEST_CASE("PrimaryKeyIndex rejects duplicate keys and keeps prior contents")
{
    PrimaryKeyIndex index;
    CHECK(index.empty());

    const std::vector<std::vector<RecordBatch>> duplicated{{make_batch({1, 2})}, {make_batch({2})}};
    CHECK(index.build(duplicated, 1U) == quarry::storage::make_error_code(StorageErrc::DuplicateKey));
    CHECK(index.empty());

    const std::vector<std::vector<RecordBatch>> valid{{make_batch({8})}};
    REQUIRE_FALSE(index.build(valid, 1U));
    CHECK(index.build(duplicated, 1U) == quarry::storage::make_error_code(StorageErrc::DuplicateKey));
    CHECK(index.size() == 1U);
    CHECK(index.contains(8));
}

TEST_CASE("PrimaryKeyIndex rejects null keys and unknown key columns")
{
    RecordBatchBuilder builder{make_schema(true)};
    const std::array<ColumnValue, 2> null_key{ColumnValue{}, ColumnValue{}};
    REQUIRE_FALSE(builder.append_row(null_key));
    const std::vector<std::vector<RecordBatch>> partitions{{builder.finish()}};

    PrimaryKeyIndex index;
    CHECK(index.build(partitions, 1U) == quarry::storage::make_error_code(StorageErrc::SchemaMismatch));

    const std::vector<std::vector<RecordBatch>> keyed{{make_batch({1})}};
    CHECK(index.build(keyed, 5U) == quarry::storage::make_error_code(StorageErrc::SchemaMismatch));
    CHECK(index.empty());
}
