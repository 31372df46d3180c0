#include "quarry/storage/validity_bitmap.hpp"

#include <algorithm>
#include <bit>

namespace quarry::storage {

ValidityBitmap::ValidityBitmap() = default;

ValidityBitmap::ValidityBitmap(std::size_t capacity)
    : words_((capacity + kWordBits - 1U) / kWordBits, 0U)
{
}

void ValidityBitmap::insert(std::uint32_t index)
{
    const auto word = static_cast<std::size_t>(index) / kWordBits;
    const auto mask = std::uint64_t{1} << (index % kWordBits);
    if (word >= words_.size()) {
        words_.resize(word + 1U, 0U);
    }
    if ((words_[word] & mask) == 0U) {
        words_[word] |= mask;
        ++count_;
    }
}

void ValidityBitmap::remove(std::uint32_t index) noexcept
{
    const auto word = static_cast<std::size_t>(index) / kWordBits;
    if (word >= words_.size()) {
        return;
    }
    const auto mask = std::uint64_t{1} << (index % kWordBits);
    if ((words_[word] & mask) != 0U) {
        words_[word] &= ~mask;
        --count_;
    }
}

bool ValidityBitmap::contains(std::uint32_t index) const noexcept
{
    const auto word = static_cast<std::size_t>(index) / kWordBits;
    if (word >= words_.size()) {
        return false;
    }
    return (words_[word] & (std::uint64_t{1} << (index % kWordBits))) != 0U;
}

std::size_t ValidityBitmap::count() const noexcept
{
    return count_;
}

bool ValidityBitmap::empty() const noexcept
{
    return count_ == 0U;
}

void ValidityBitmap::clear() noexcept
{
    std::fill(words_.begin(), words_.end(), 0U);
    count_ = 0U;
}

void ValidityBitmap::for_each(const std::function<void(std::uint32_t)>& visitor) const
{
    if (!visitor) {
        return;
    }
    for (std::size_t word = 0; word < words_.size(); ++word) {
        auto bits = words_[word];
        while (bits != 0U) {
            const auto bit = static_cast<std::size_t>(std::countr_zero(bits));
            visitor(static_cast<std::uint32_t>(word * kWordBits + bit));
            bits &= bits - 1U;
        }
    }
}

std::vector<std::uint32_t> ValidityBitmap::to_vector() const
{
    std::vector<std::uint32_t> result;
    result.reserve(count_);
    for_each([&result](std::uint32_t index) {
        result.push_back(index);
    });
    return result;
}

bool operator==(const ValidityBitmap& lhs, const ValidityBitmap& rhs) noexcept
{
    if (lhs.count_ != rhs.count_) {
        return false;
    }
    const auto common = std::min(lhs.words_.size(), rhs.words_.size());
    if (!std::equal(lhs.words_.begin(), lhs.words_.begin() + static_cast<std::ptrdiff_t>(common), rhs.words_.begin())) {
        return false;
    }
    const auto& longer = lhs.words_.size() > rhs.words_.size() ? lhs.words_ : rhs.words_;
    return std::all_of(longer.begin() + static_cast<std::ptrdiff_t>(common), longer.end(), [](std::uint64_t word) {
        return word == 0U;
    });
}

}  // namespace quarry::storage
