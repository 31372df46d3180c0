#include "quarry/storage/partitioned_batch_store.hpp"
#include "quarry/storage/storage_errors.hpp"

#include <catch2/catch.hpp>

#include <algorithm>
#include <array>
#include <memory>
#include <vector>

using quarry::storage::ColumnDefinition;
using quarry::storage::ColumnValue;
using quarry::storage::PartitionBatches;
using quarry::storage::PartitionedBatchStore;
using quarry::storage::PrimaryKey;
using quarry::storage::RecordBatch;
using quarry::storage::RecordBatchBuilder;
using quarry::storage::StorageErrc;
using quarry::storage::TableSchema;

namespace {

std::shared_ptr<const TableSchema> make_schema()
{
    return std::make_shared<const TableSchema>(TableSchema{{ColumnDefinition{"id", 8U, false}}, "id"});
}

RecordBatch make_batch(const std::shared_ptr<const TableSchema>& schema, PrimaryKey first_key, std::size_t rows)
{
    RecordBatchBuilder builder{schema};
    for (std::size_t row = 0U; row < rows; ++row) {
        const std::array<ColumnValue, 1> values{
            quarry::storage::encode_integer(first_key + static_cast<PrimaryKey>(row), 8U)};
        REQUIRE_FALSE(builder.append_row(values));
    }
    return builder.finish();
}

std::vector<RecordBatch> make_groups(const std::shared_ptr<const TableSchema>& schema, std::size_t count)
{
    std::vector<RecordBatch> groups;
    for (std::size_t index = 0U; index < count; ++index) {
        groups.push_back(make_batch(schema, static_cast<PrimaryKey>(index * 100U), index + 1U));
    }
    return groups;
}

PrimaryKey first_key(const RecordBatch& batch)
{
    return quarry::storage::decode_integer(batch.value(0U, 0U));
}

std::unique_ptr<PartitionedBatchStore> make_empty_store(std::size_t partitions)
{
    std::unique_ptr<PartitionedBatchStore> store;
    REQUIRE_FALSE(PartitionedBatchStore::create(make_schema(), PartitionBatches(partitions), {}, store));
    return store;
}

}  // namespace

TEST_CASE("Round-robin distribution keeps arrival order per partition")
{
    const auto buffers = quarry::storage::distribute_round_robin(make_groups(make_schema(), 7U), 3U);
    REQUIRE(buffers.size() == 3U);
    REQUIRE(buffers[0].size() == 3U);
    REQUIRE(buffers[1].size() == 2U);
    REQUIRE(buffers[2].size() == 2U);

    CHECK(first_key(buffers[0][0]) == 0);
    CHECK(first_key(buffers[0][1]) == 300);
    CHECK(first_key(buffers[0][2]) == 600);
    CHECK(first_key(buffers[1][0]) == 100);
    CHECK(first_key(buffers[1][1]) == 400);
    CHECK(first_key(buffers[2][0]) == 200);
    CHECK(first_key(buffers[2][1]) == 500);
}

TEST_CASE("Round-robin distribution balances within one group")
{
    for (std::size_t groups = 0U; groups < 12U; ++groups) {
        const auto buffers = quarry::storage::distribute_round_robin(make_groups(make_schema(), groups), 5U);
        REQUIRE(buffers.size() == 5U);
        std::size_t smallest = groups;
        std::size_t largest = 0U;
        for (const auto& buffer : buffers) {
            smallest = std::min(smallest, buffer.size());
            largest = std::max(largest, buffer.size());
        }
        CHECK(largest - smallest <= 1U);
    }

    CHECK(quarry::storage::distribute_round_robin(make_groups(make_schema(), 3U), 0U).empty());
}

TEST_CASE("Append writes report the total row count")
{
    auto store = make_empty_store(3U);
    std::uint64_t rows = 0U;
    REQUIRE_FALSE(store->write(make_groups(store->schema(), 4U), PartitionedBatchStore::WriteMode::Append, rows));
    CHECK(rows == 10U);
    CHECK(store->row_count() == 10U);
    CHECK(store->partition_snapshot(0U).size() == 2U);
    CHECK(store->partition_snapshot(1U).size() == 1U);
    CHECK(store->partition_snapshot(2U).size() == 1U);

    REQUIRE_FALSE(store->write({}, PartitionedBatchStore::WriteMode::Append, rows));
    CHECK(rows == 0U);
    CHECK(store->row_count() == 10U);
}

TEST_CASE("Overwrite writes are not supported and leave data untouched")
{
    auto store = make_empty_store(2U);
    std::uint64_t rows = 7U;
    CHECK(store->write(make_groups(store->schema(), 2U), PartitionedBatchStore::WriteMode::Overwrite, rows) ==
          quarry::storage::make_error_code(StorageErrc::Unimplemented));
    CHECK(rows == 7U);
    CHECK(store->row_count() == 0U);
}

TEST_CASE("Writes with a foreign schema append nothing")
{
    auto store = make_empty_store(2U);
    auto groups = make_groups(store->schema(), 2U);
    auto foreign = std::make_shared<const TableSchema>(
        TableSchema{{ColumnDefinition{"id", 8U, false}, ColumnDefinition{"extra", 1U}}, "id"});
    RecordBatchBuilder builder{foreign};
    const std::array<ColumnValue, 2> values{quarry::storage::encode_integer(1, 8U), ColumnValue{}};
    REQUIRE_FALSE(builder.append_row(values));
    groups.push_back(builder.finish());

    std::uint64_t rows = 0U;
    CHECK(store->write(std::move(groups), PartitionedBatchStore::WriteMode::Append, rows) ==
          quarry::storage::make_error_code(StorageErrc::SchemaMismatch));
    CHECK(store->row_count() == 0U);
    CHECK(store->partition_snapshot(0U).empty());
}
