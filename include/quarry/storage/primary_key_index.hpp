#pragma once

#include "quarry/storage/record_batch.hpp"
#include "quarry/storage/table_schema.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <shared_mutex>
#include <span>
#include <system_error>
#include <vector>

namespace quarry::storage {

struct BatchRowLocator final {
    std::size_t partition = 0U;
    std::size_t batch = 0U;
    std::size_t row = 0U;

    friend bool operator==(const BatchRowLocator&, const BatchRowLocator&) = default;
};

class PrimaryKeyIndex final {
public:
    using Visitor = std::function<void(PrimaryKey, const BatchRowLocator&)>;

    PrimaryKeyIndex();

    PrimaryKeyIndex(const PrimaryKeyIndex&) = delete;
    PrimaryKeyIndex& operator=(const PrimaryKeyIndex&) = delete;
    PrimaryKeyIndex(PrimaryKeyIndex&&) = delete;
    PrimaryKeyIndex& operator=(PrimaryKeyIndex&&) = delete;

    // Walks partitions, then batches, then rows. The first repeated key fails
    // with DuplicateKey and a null key with SchemaMismatch; on failure the
    // index keeps its previous contents.
    [[nodiscard]] std::error_code build(std::span<const std::vector<RecordBatch>> partitions, std::size_t key_column);

    [[nodiscard]] std::optional<BatchRowLocator> find(PrimaryKey key) const;
    [[nodiscard]] bool contains(PrimaryKey key) const;
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] bool empty() const;

    // Ascending key order, under the shared lock.
    void for_each(const Visitor& visitor) const;

private:
    mutable std::shared_mutex mutex_{};
    std::map<PrimaryKey, BatchRowLocator> entries_{};
};

}  // namespace quarry::storage
