#pragma once

#include <cstddef>

namespace quarry::storage {

// Home block and in-block position of a row. Stays valid only while the block
// keeps its layout; rows never move between blocks.
struct TupleLocator final {
    std::size_t block_index = 0U;
    std::size_t row_index = 0U;

    friend bool operator==(const TupleLocator&, const TupleLocator&) = default;
};

}  // namespace quarry::storage
