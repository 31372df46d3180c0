#pragma once

#include <system_error>

namespace quarry::storage {

enum class StorageErrc {
    Success = 0,
    CapacityExceeded,
    NoSuchRecord,
    SchemaMismatch,
    DuplicateKey,
    Unimplemented,
    InvalidProjection
};

const std::error_category& storage_error_category() noexcept;
std::error_code make_error_code(StorageErrc value) noexcept;

}  // namespace quarry::storage

namespace std {

template <>
struct is_error_code_enum<quarry::storage::StorageErrc> : true_type {
};

}  // namespace std
