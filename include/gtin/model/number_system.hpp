#pragma once

#include "gtin/model/gtin.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace gtin::model {

/**
 * @brief 由 GS1 前缀推导出的号码用途分类（不存储，每次重新计算）。
 */
enum class NumberSystem : std::uint8_t {
  general = 0,
  store_use = 1,
  coupon = 2,
  drug = 3,
  issn = 4,
  isbn = 5,
  refund = 6,
  unknown = 7,
};

[[nodiscard]] std::string_view to_string(NumberSystem ns) noexcept;

using Gs1Prefix = std::array<digit, 3>;

/**
 * @brief 提取 3 位 GS1 前缀。
 *
 * - EAN-13/EAN-8：前 3 位；
 * - UPC-A：[0, d0, d1]（UPC-A 等价于前补 0 的 EAN-13）；
 * - UPC-E：先展开为 UPC-A 再取 [0, d0, d1]，展开失败返回 nullopt；
 * - GTIN-14：跳过首位包装指示符，取第 1..3 位。
 */
[[nodiscard]] std::optional<Gs1Prefix> gs1_prefix(const Gtin& value) noexcept;

// 前缀数值 p0*100 + p1*10 + p2。
[[nodiscard]] constexpr unsigned prefix_value(const Gs1Prefix& prefix) noexcept {
  return static_cast<unsigned>(prefix[0]) * 100u + static_cast<unsigned>(prefix[1]) * 10u +
         static_cast<unsigned>(prefix[2]);
}

/**
 * @brief 按前缀数值分类；prefix 长度不为 3 时返回 unknown。
 */
[[nodiscard]] NumberSystem number_system_from_prefix(digits_view prefix) noexcept;
[[nodiscard]] NumberSystem number_system_from_value(unsigned prefix) noexcept;

[[nodiscard]] NumberSystem number_system(const Gtin& value) noexcept;

/**
 * @brief 按国家范围表查找 ISO 3166-1 alpha-2 国家码（近似，不是 GS1 权威注册表）。
 *
 * 仅做范围表查找，不考虑 NumberSystem；未命中返回 nullopt。
 * 例外：390（科索沃）没有 ISO 3166-1 代码，返回的 "KOSOVO" 不是 alpha-2 代码，
 * 调用方不能假设返回值总是两个字母。
 */
[[nodiscard]] std::optional<std::string_view> country_for_prefix(unsigned prefix) noexcept;

/**
 * @brief GTIN 的国家码。
 *
 * - drug：固定 "US"（NDC 号段）；
 * - store_use/coupon/isbn/issn/refund：nullopt；
 * - 其余按国家范围表查找；无前缀或未命中返回 nullopt。
 */
[[nodiscard]] std::optional<std::string_view> country_code(const Gtin& value) noexcept;

}  // namespace gtin::model
