#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace gtin::core {

// 单个十进制数字（取值 0..9，不是 ASCII 字符）。
using digit = std::uint8_t;
using digits_view = std::span<const digit>;

// 可以承载校验位的 GTIN 长度范围（EAN-8 .. GTIN-14）。
inline constexpr std::size_t kMinLength = 8;
inline constexpr std::size_t kMaxLength = 14;

}  // namespace gtin::core
