#include "quarry/storage/primary_key_index.hpp"

#include "quarry/storage/storage_errors.hpp"

#include <mutex>

namespace quarry::storage {

PrimaryKeyIndex::PrimaryKeyIndex() = default;

std::error_code PrimaryKeyIndex::build(std::span<const std::vector<RecordBatch>> partitions, std::size_t key_column)
{
    std::unique_lock lock{mutex_};
    std::map<PrimaryKey, BatchRowLocator> entries;
    for (std::size_t partition = 0U; partition < partitions.size(); ++partition) {
        const auto& batches = partitions[partition];
        for (std::size_t batch = 0U; batch < batches.size(); ++batch) {
            const auto& record_batch = batches[batch];
            if (key_column >= record_batch.num_columns()) {
                return make_error_code(StorageErrc::SchemaMismatch);
            }
            for (std::size_t row = 0U; row < record_batch.num_rows(); ++row) {
                if (record_batch.is_null(key_column, row)) {
                    return make_error_code(StorageErrc::SchemaMismatch);
                }
                const auto key = decode_integer(record_batch.value(key_column, row));
                if (!entries.emplace(key, BatchRowLocator{partition, batch, row}).second) {
                    return make_error_code(StorageErrc::DuplicateKey);
                }
            }
        }
    }

    entries_.swap(entries);
    return {};
}

std::optional<BatchRowLocator> PrimaryKeyIndex::find(PrimaryKey key) const
{
    std::shared_lock lock{mutex_};
    const auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool PrimaryKeyIndex::contains(PrimaryKey key) const
{
    std::shared_lock lock{mutex_};
    return entries_.contains(key);
}

std::size_t PrimaryKeyIndex::size() const
{
    std::shared_lock lock{mutex_};
    return entries_.size();
}

bool PrimaryKeyIndex::empty() const
{
    std::shared_lock lock{mutex_};
    return entries_.empty();
}

void PrimaryKeyIndex::for_each(const Visitor& visitor) const
{
    if (!visitor) {
        return;
    }
    std::shared_lock lock{mutex_};
    for (const auto& [key, locator] : entries_) {
        visitor(key, locator);
    }
}

}  // namespace quarry::storage
