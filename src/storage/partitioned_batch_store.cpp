#include "quarry/storage/partitioned_batch_store.hpp"

#include "quarry/storage/storage_errors.hpp"

#include <chrono>
#include <iterator>
#include <mutex>
#include <utility>

namespace quarry::storage {

namespace {

struct EventTimer final {
    std::chrono::system_clock::time_point started_at = std::chrono::system_clock::now();
    std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();
};

[[nodiscard]] StoreEvent make_event(StoreOperation operation,
                                    const std::string& identifier,
                                    const EventTimer& timer,
                                    std::error_code ec)
{
    StoreEvent event{};
    event.operation = operation;
    event.identifier = identifier;
    event.success = !ec;
    event.status = ec ? ec.message() : std::string{"ok"};
    event.started_at = timer.started_at;
    event.finished_at = std::chrono::system_clock::now();
    const auto elapsed = std::chrono::steady_clock::now() - timer.start;
    event.duration_ms = std::chrono::duration<double, std::milli>(elapsed).count();
    return event;
}

void emit(const PartitionedBatchStore::Config& config, StoreEvent event)
{
    if (config.event_logger) {
        config.event_logger(event);
    }
}

[[nodiscard]] std::size_t count_rows(const std::vector<RecordBatch>& batches) noexcept
{
    std::size_t rows = 0U;
    for (const auto& batch : batches) {
        rows += batch.num_rows();
    }
    return rows;
}

[[nodiscard]] RecordBatch apply_projection(const RecordBatch& batch,
                                           const std::optional<std::vector<std::size_t>>& projection)
{
    if (!projection) {
        return batch;
    }
    return batch.project(*projection);
}

}  // namespace

PartitionBatches distribute_round_robin(std::vector<RecordBatch> groups, std::size_t partition_count)
{
    PartitionBatches buffers(partition_count);
    if (partition_count == 0U) {
        return buffers;
    }
    for (std::size_t index = 0U; index < groups.size(); ++index) {
        buffers[index % partition_count].push_back(std::move(groups[index]));
    }
    return buffers;
}

std::size_t PartitionedBatchStore::ScanResult::row_count() const noexcept
{
    std::size_t rows = 0U;
    for (const auto& partition : partitions) {
        rows += count_rows(partition);
    }
    return rows;
}

PartitionedBatchStore::PartitionedBatchStore(ConstructionTag, std::shared_ptr<const TableSchema> schema, Config config)
    : schema_{std::move(schema)}
    , config_{std::move(config)}
{
}

std::error_code PartitionedBatchStore::create(std::shared_ptr<const TableSchema> schema,
                                              PartitionBatches partitions,
                                              Config config,
                                              std::unique_ptr<PartitionedBatchStore>& out)
{
    const EventTimer timer{};
    auto fail = [&](std::error_code ec) {
        auto event = make_event(StoreOperation::Create, config.identifier, timer, ec);
        event.partitions = partitions.size();
        emit(config, std::move(event));
        return ec;
    };

    if (!schema) {
        return fail(make_error_code(StorageErrc::SchemaMismatch));
    }
    if (auto ec = schema->validate(); ec) {
        return fail(ec);
    }
    if (partitions.empty()) {
        return fail(make_error_code(StorageErrc::SchemaMismatch));
    }
    for (const auto& batches : partitions) {
        for (const auto& batch : batches) {
            if (!batch.schema() || !schema->accepts(*batch.schema())) {
                return fail(make_error_code(StorageErrc::SchemaMismatch));
            }
        }
    }

    auto store = std::make_unique<PartitionedBatchStore>(ConstructionTag{}, std::move(schema), std::move(config));
    store->key_column_ = *store->schema_->primary_key_index();
    if (auto ec = store->index_.build(partitions, store->key_column_); ec) {
        auto event = make_event(StoreOperation::Create, store->config_.identifier, timer, ec);
        event.partitions = partitions.size();
        emit(store->config_, std::move(event));
        return ec;
    }

    std::size_t rows = 0U;
    store->partitions_.reserve(partitions.size());
    for (auto& batches : partitions) {
        auto partition = std::make_unique<Partition>();
        rows += count_rows(batches);
        partition->batches = std::move(batches);
        store->partitions_.push_back(std::move(partition));
    }

    auto event = make_event(StoreOperation::Create, store->config_.identifier, timer, {});
    event.rows = rows;
    event.partitions = store->partitions_.size();
    store->emit_event(std::move(event));

    out = std::move(store);
    return {};
}

std::error_code PartitionedBatchStore::load(const PartitionedBatchStore& source,
                                            std::optional<std::size_t> output_partitions,
                                            Config config,
                                            std::unique_ptr<PartitionedBatchStore>& out)
{
    ScanResult materialized{};
    if (auto ec = source.scan(ScanRequest{}, materialized); ec) {
        return ec;
    }

    if (!output_partitions) {
        return create(source.schema(), std::move(materialized.partitions), std::move(config), out);
    }

    std::vector<RecordBatch> batches;
    for (auto& partition : materialized.partitions) {
        for (auto& batch : partition) {
            batches.push_back(std::move(batch));
        }
    }
    return create(source.schema(),
                  distribute_round_robin(std::move(batches), *output_partitions),
                  std::move(config),
                  out);
}

std::error_code PartitionedBatchStore::scan(const ScanRequest& request, ScanResult& out_result) const
{
    if (auto ec = validate_projection(request.projection); ec) {
        if (config_.telemetry != nullptr) {
            config_.telemetry->record_scan_failure();
        }
        const EventTimer timer{};
        emit_event(make_event(StoreOperation::Scan, config_.identifier, timer, ec));
        return ec;
    }

    for (const auto& filter : request.filters) {
        if (const auto key = extract_primary_key_equality(filter, schema_->primary_key_column())) {
            return point_lookup(*key, request.projection, out_result);
        }
    }
    return full_scan(request.projection, out_result);
}

std::error_code PartitionedBatchStore::point_lookup(PrimaryKey key,
                                                    const std::optional<std::vector<std::size_t>>& projection,
                                                    ScanResult& out_result) const
{
    const EventTimer timer{};
    StoreTelemetry::LatencyScope latency{config_.telemetry, StoreTelemetry::Operation::PointLookup};

    ScanResult result{};
    result.point_lookup = true;
    result.schema = projection ? std::make_shared<const TableSchema>(schema_->project(*projection)) : schema_;

    const auto locator = index_.find(key);
    if (locator && locator->partition < partitions_.size()) {
        const auto& partition = *partitions_[locator->partition];
        std::shared_lock lock{partition.mutex};
        if (locator->batch < partition.batches.size()) {
            const auto& batch = partition.batches[locator->batch];
            result.partitions.push_back({apply_projection(batch.slice(locator->row, 1U), projection)});
        }
    }

    const bool hit = !result.partitions.empty();
    if (config_.telemetry != nullptr) {
        config_.telemetry->record_point_lookup(hit);
    }

    auto event = make_event(StoreOperation::PointLookup, config_.identifier, timer, {});
    event.rows = hit ? 1U : 0U;
    event.partitions = result.partitions.size();
    emit_event(std::move(event));

    out_result = std::move(result);
    return {};
}

std::error_code PartitionedBatchStore::full_scan(const std::optional<std::vector<std::size_t>>& projection,
                                                 ScanResult& out_result) const
{
    const EventTimer timer{};
    StoreTelemetry::LatencyScope latency{config_.telemetry, StoreTelemetry::Operation::FullScan};

    ScanResult result{};
    result.schema = projection ? std::make_shared<const TableSchema>(schema_->project(*projection)) : schema_;
    result.partitions.reserve(partitions_.size());
    for (const auto& partition : partitions_) {
        std::shared_lock lock{partition->mutex};
        std::vector<RecordBatch> copied;
        copied.reserve(partition->batches.size());
        for (const auto& batch : partition->batches) {
            copied.push_back(apply_projection(batch, projection));
        }
        result.partitions.push_back(std::move(copied));
    }

    const auto rows = result.row_count();
    if (config_.telemetry != nullptr) {
        config_.telemetry->record_full_scan(rows);
    }

    auto event = make_event(StoreOperation::Scan, config_.identifier, timer, {});
    event.rows = rows;
    event.partitions = result.partitions.size();
    emit_event(std::move(event));

    out_result = std::move(result);
    return {};
}

std::error_code PartitionedBatchStore::write(std::vector<RecordBatch> groups, WriteMode mode, std::uint64_t& out_rows)
{
    const EventTimer timer{};
    StoreTelemetry::LatencyScope latency{config_.telemetry, StoreTelemetry::Operation::Write};

    auto fail = [&](std::error_code ec) {
        if (config_.telemetry != nullptr) {
            config_.telemetry->record_write_failure();
        }
        auto event = make_event(StoreOperation::Write, config_.identifier, timer, ec);
        event.groups = groups.size();
        emit_event(std::move(event));
        return ec;
    };

    if (mode == WriteMode::Overwrite) {
        return fail(make_error_code(StorageErrc::Unimplemented));
    }

    std::size_t rows = 0U;
    for (const auto& group : groups) {
        if (!group.schema() || !schema_->accepts(*group.schema())) {
            return fail(make_error_code(StorageErrc::SchemaMismatch));
        }
        rows += group.num_rows();
    }

    const auto group_count = groups.size();
    auto buffers = distribute_round_robin(std::move(groups), partitions_.size());
    for (std::size_t index = 0U; index < buffers.size(); ++index) {
        auto& pending = buffers[index];
        if (pending.empty()) {
            continue;
        }
        auto& partition = *partitions_[index];
        std::unique_lock lock{partition.mutex};
        partition.batches.insert(partition.batches.end(),
                                 std::make_move_iterator(pending.begin()),
                                 std::make_move_iterator(pending.end()));
        if (config_.telemetry != nullptr) {
            config_.telemetry->record_partition_append();
        }
    }

    if (config_.telemetry != nullptr) {
        config_.telemetry->record_write(group_count, rows);
    }

    auto event = make_event(StoreOperation::Write, config_.identifier, timer, {});
    event.rows = rows;
    event.groups = group_count;
    event.partitions = partitions_.size();
    emit_event(std::move(event));

    out_rows = static_cast<std::uint64_t>(rows);
    return {};
}

std::vector<RecordBatch> PartitionedBatchStore::partition_snapshot(std::size_t partition) const
{
    if (partition >= partitions_.size()) {
        return {};
    }
    const auto& target = *partitions_[partition];
    std::shared_lock lock{target.mutex};
    return target.batches;
}

std::size_t PartitionedBatchStore::row_count() const
{
    std::size_t rows = 0U;
    for (const auto& partition : partitions_) {
        std::shared_lock lock{partition->mutex};
        rows += count_rows(partition->batches);
    }
    return rows;
}

std::error_code PartitionedBatchStore::validate_projection(const std::optional<std::vector<std::size_t>>& projection) const
{
    if (!projection) {
        return {};
    }
    for (const auto index : *projection) {
        if (index >= schema_->column_count()) {
            return make_error_code(StorageErrc::InvalidProjection);
        }
    }
    return {};
}

void PartitionedBatchStore::emit_event(StoreEvent event) const
{
    emit(config_, std::move(event));
}

}  // namespace quarry::storage
