#include "gtin/codec/checksum.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>

namespace gtin::codec {

gtin::core::digit compute_check_digit(gtin::core::digits_view digits) noexcept {
    // 最多 17 位 * 9 * 3，uint32 不会溢出。
    std::uint32_t sum = 0;
    std::size_t index_from_right = 0;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it, ++index_from_right) {
        const auto value = static_cast<std::uint32_t>(*it);
        sum += (index_from_right % 2 == 0) ? value * 3u : value;
    }
    return static_cast<gtin::core::digit>((10u - (sum % 10u)) % 10u);
}

bool validate(gtin::core::digits_view digits) noexcept {
    if (digits.size() < gtin::core::kMinLength || digits.size() > gtin::core::kMaxLength) {
        return false;
    }
    // 元素必须是 0..9 的数值；否则 mod-10 求和可能“碰巧”通过。
    if (std::any_of(digits.begin(), digits.end(), [](gtin::core::digit d) { return d > 9; })) {
        return false;
    }
    const auto body = digits.first(digits.size() - 1);
    return digits.back() == compute_check_digit(body);
}

} // namespace gtin::codec
