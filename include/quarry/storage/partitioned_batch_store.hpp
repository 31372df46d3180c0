#pragma once

#include "quarry/storage/primary_key_index.hpp"
#include "quarry/storage/record_batch.hpp"
#include "quarry/storage/scan_predicate.hpp"
#include "quarry/storage/store_event_log.hpp"
#include "quarry/storage/store_telemetry.hpp"
#include "quarry/storage/table_schema.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <system_error>
#include <vector>

namespace quarry::storage {

using PartitionBatches = std::vector<std::vector<RecordBatch>>;

// Group i lands in partition i % partition_count, keeping arrival order
// within each partition.
[[nodiscard]] PartitionBatches distribute_round_robin(std::vector<RecordBatch> groups, std::size_t partition_count);

// Record batches split into independently locked partitions, with a primary
// key index built once over the initial data. The index is not maintained by
// later writes: keys appended through write() are reachable by full scans but
// not by point lookups.
class PartitionedBatchStore final {
public:
    struct Config final {
        std::string identifier{"batch_store"};
        StoreTelemetry* telemetry = nullptr;
        std::function<void(const StoreEvent&)> event_logger{};
    };

    enum class WriteMode : std::uint8_t {
        Append = 0,
        Overwrite
    };

    struct ScanRequest final {
        std::optional<std::vector<std::size_t>> projection{};
        std::vector<ScanExpression> filters{};
    };

    struct ScanResult final {
        bool point_lookup = false;
        std::shared_ptr<const TableSchema> schema{};
        PartitionBatches partitions{};

        [[nodiscard]] std::size_t row_count() const noexcept;
    };

    // SchemaMismatch for an invalid schema, no partitions, or a batch the
    // schema does not accept; DuplicateKey when the initial data repeats a key.
    [[nodiscard]] static std::error_code create(std::shared_ptr<const TableSchema> schema,
                                                PartitionBatches partitions,
                                                Config config,
                                                std::unique_ptr<PartitionedBatchStore>& out);

    // Materializes `source` and, when output_partitions is set, redistributes
    // its batches round-robin over that many partitions.
    [[nodiscard]] static std::error_code load(const PartitionedBatchStore& source,
                                              std::optional<std::size_t> output_partitions,
                                              Config config,
                                              std::unique_ptr<PartitionedBatchStore>& out);

private:
    struct ConstructionTag final {
        explicit ConstructionTag() = default;
    };

public:
    // Reachable only through create() and load().
    PartitionedBatchStore(ConstructionTag, std::shared_ptr<const TableSchema> schema, Config config);

    PartitionedBatchStore(const PartitionedBatchStore&) = delete;
    PartitionedBatchStore& operator=(const PartitionedBatchStore&) = delete;
    PartitionedBatchStore(PartitionedBatchStore&&) = delete;
    PartitionedBatchStore& operator=(PartitionedBatchStore&&) = delete;

    // A primary-key equality filter turns the scan into a point lookup: one
    // single-row batch on a hit, an empty result on a miss. Anything else
    // copies every partition under its shared lock.
    [[nodiscard]] std::error_code scan(const ScanRequest& request, ScanResult& out_result) const;

    // Appends groups round-robin with one exclusive lock per partition. Not
    // atomic across partitions.
    [[nodiscard]] std::error_code write(std::vector<RecordBatch> groups, WriteMode mode, std::uint64_t& out_rows);

    [[nodiscard]] std::size_t partition_count() const noexcept
    {
        return partitions_.size();
    }

    [[nodiscard]] std::vector<RecordBatch> partition_snapshot(std::size_t partition) const;
    [[nodiscard]] std::size_t row_count() const;

    [[nodiscard]] const std::shared_ptr<const TableSchema>& schema() const noexcept
    {
        return schema_;
    }

    [[nodiscard]] const PrimaryKeyIndex& primary_key_index() const noexcept
    {
        return index_;
    }

    [[nodiscard]] std::size_t index_size() const
    {
        return index_.size();
    }

    [[nodiscard]] StoreTelemetry* telemetry() const noexcept
    {
        return config_.telemetry;
    }

    [[nodiscard]] const Config& config() const noexcept
    {
        return config_;
    }

private:
    struct Partition final {
        mutable std::shared_mutex mutex{};
        std::vector<RecordBatch> batches{};
    };

    [[nodiscard]] std::error_code point_lookup(PrimaryKey key,
                                               const std::optional<std::vector<std::size_t>>& projection,
                                               ScanResult& out_result) const;
    [[nodiscard]] std::error_code full_scan(const std::optional<std::vector<std::size_t>>& projection,
                                            ScanResult& out_result) const;
    [[nodiscard]] std::error_code validate_projection(const std::optional<std::vector<std::size_t>>& projection) const;

    void emit_event(StoreEvent event) const;

    std::shared_ptr<const TableSchema> schema_{};
    std::size_t key_column_ = 0U;
    Config config_{};
    std::vector<std::unique_ptr<Partition>> partitions_{};
    PrimaryKeyIndex index_{};
};

}  // namespace quarry::storage
