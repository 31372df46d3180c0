#include "quarry/storage/validity_bitmap.hpp"

#include <catch2/catch.hpp>

#include <cstdint>
#include <vector>

using quarry::storage::ValidityBitmap;

TEST_CASE("ValidityBitmap tracks membership")
{
    ValidityBitmap bitmap{1000U};
    CHECK(bitmap.empty());

    bitmap.insert(0U);
    bitmap.insert(63U);
    bitmap.insert(64U);
    bitmap.insert(999U);

    CHECK(bitmap.count() == 4U);
    CHECK(bitmap.contains(0U));
    CHECK(bitmap.contains(63U));
    CHECK(bitmap.contains(64U));
    CHECK(bitmap.contains(999U));
    CHECK_FALSE(bitmap.contains(1U));
    CHECK_FALSE(bitmap.contains(5000U));
}

TEST_CASE("ValidityBitmap insert and remove are idempotent")
{
    ValidityBitmap bitmap;
    bitmap.insert(7U);
    bitmap.insert(7U);
    CHECK(bitmap.count() == 1U);

    bitmap.remove(7U);
    bitmap.remove(7U);
    bitmap.remove(12345U);
    CHECK(bitmap.count() == 0U);
    CHECK_FALSE(bitmap.contains(7U));
}

TEST_CASE("ValidityBitmap iterates in ascending order")
{
    ValidityBitmap bitmap;
    for (std::uint32_t index : {300U, 2U, 65U, 64U, 128U}) {
        bitmap.insert(index);
    }

    CHECK(bitmap.to_vector() == std::vector<std::uint32_t>{2U, 64U, 65U, 128U, 300U});

    std::vector<std::uint32_t> visited;
    bitmap.for_each([&visited](std::uint32_t index) {
        visited.push_back(index);
    });
    CHECK(visited == bitmap.to_vector());
}

TEST_CASE("ValidityBitmap equality ignores trailing capacity")
{
    ValidityBitmap small;
    ValidityBitmap large{4096U};
    small.insert(3U);
    large.insert(3U);
    CHECK(small == large);

    large.insert(4000U);
    CHECK_FALSE(small == large);

    large.clear();
    CHECK(large.empty());
    CHECK_FALSE(large.contains(3U));
}
