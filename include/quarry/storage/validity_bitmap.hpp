#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace quarry::storage {

// Ordered set of row positions backed by 64-bit words. Grows on insert.
class ValidityBitmap final {
public:
    ValidityBitmap();
    explicit ValidityBitmap(std::size_t capacity);

    void insert(std::uint32_t index);
    void remove(std::uint32_t index) noexcept;
    [[nodiscard]] bool contains(std::uint32_t index) const noexcept;

    [[nodiscard]] std::size_t count() const noexcept;
    [[nodiscard]] bool empty() const noexcept;
    void clear() noexcept;

    void for_each(const std::function<void(std::uint32_t)>& visitor) const;
    [[nodiscard]] std::vector<std::uint32_t> to_vector() const;

    friend bool operator==(const ValidityBitmap& lhs, const ValidityBitmap& rhs) noexcept;

private:
    static constexpr std::size_t kWordBits = 64U;

    std::vector<std::uint64_t> words_{};
    std::size_t count_ = 0U;
};

}  // namespace quarry::storage
