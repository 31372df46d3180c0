#include "quarry/storage/storage_errors.hpp"

#include <string>

namespace quarry::storage {

namespace {

class StorageErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override
    {
        return "quarry.storage";
    }

    std::string message(int condition) const override
    {
        switch (static_cast<StorageErrc>(condition)) {
        case StorageErrc::Success:
            return "success";
        case StorageErrc::CapacityExceeded:
            return "cannot add a row to a full block or batch";
        case StorageErrc::NoSuchRecord:
            return "record does not exist";
        case StorageErrc::SchemaMismatch:
            return "mismatch between schema and batches";
        case StorageErrc::DuplicateKey:
            return "duplicate primary key value";
        case StorageErrc::Unimplemented:
            return "operation not implemented";
        case StorageErrc::InvalidProjection:
            return "projection index out of bounds";
        default:
            return "unknown storage error";
        }
    }
};

const StorageErrorCategory kCategory{};

}  // namespace

const std::error_category& storage_error_category() noexcept
{
    return kCategory;
}

std::error_code make_error_code(StorageErrc value) noexcept
{
    return {static_cast<int>(value), storage_error_category()};
}

}  // namespace quarry::storage
