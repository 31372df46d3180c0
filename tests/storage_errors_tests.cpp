#include "quarry/storage/storage_errors.hpp"

#include <catch2/catch.hpp>

#include <string>

using quarry::storage::StorageErrc;

TEST_CASE("StorageErrc converts to error codes in the storage category")
{
    const std::error_code ec = StorageErrc::DuplicateKey;
    CHECK(ec);
    CHECK(ec.category() == quarry::storage::storage_error_category());
    CHECK(std::string{ec.category().name()} == "quarry.storage");
    CHECK(ec == quarry::storage::make_error_code(StorageErrc::DuplicateKey));
    CHECK_FALSE(ec == quarry::storage::make_error_code(StorageErrc::SchemaMismatch));
}

TEST_CASE("StorageErrc messages describe each failure")
{
    CHECK(quarry::storage::make_error_code(StorageErrc::CapacityExceeded).message() == "cannot add a row to a full block or batch");
    CHECK(quarry::storage::make_error_code(StorageErrc::NoSuchRecord).message() == "record does not exist");
    CHECK(quarry::storage::make_error_code(StorageErrc::SchemaMismatch).message() == "mismatch between schema and batches");
    CHECK(quarry::storage::make_error_code(StorageErrc::DuplicateKey).message() == "duplicate primary key value");
    CHECK(quarry::storage::make_error_code(StorageErrc::Unimplemented).message() == "operation not implemented");
    CHECK(quarry::storage::make_error_code(StorageErrc::InvalidProjection).message() == "projection index out of bounds");
    CHECK_FALSE(quarry::storage::make_error_code(StorageErrc::Success));
}
