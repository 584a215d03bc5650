#pragma once

#include "gtin/model/gtin.hpp"

#include <optional>
#include <system_error>

namespace gtin::convert {

/**
 * @brief 将 UPC-E 压缩编码展开为 12 位 UPC-A。
 *
 * 输入长度（只关心中间 6 位“核心”）：
 * - 8 位：丢弃首位号码系统位，取第 1..6 位；
 * - 7 位：取前 6 位（丢弃末尾校验位）；
 * - 6 位：原样使用；
 * - 其它长度：errc::conversion_failed。
 *
 * 核心 d0..d5 中 d5 决定压缩方式：
 *
 *   d5      厂商码(5)           商品码(5)
 *   0/1/2   d0 d1 d5 0  0       0 0 d2 d3 d4
 *   3       d0 d1 d2 0  0       0 0 0  d3 d4
 *   4       d0 d1 d2 d3 0       0 0 0  0  d4
 *   5..9    d0 d1 d2 d3 d4      0 0 0  0  d5
 *
 * 结果为 [0] + 厂商码 + 商品码 + 重新计算的校验位。
 *
 * 注意：8 位输入的号码系统位与校验位都不参与展开，结果恒以 0 开头。
 */
std::error_code expand_upce(gtin::core::digits_view digits, gtin::model::UpcA& out) noexcept;
std::error_code expand_upce(const gtin::model::UpcE& upce, gtin::model::UpcA& out) noexcept;

/**
 * @brief 转换为 EAN-13 表示。
 *
 * - EAN-13：原样返回；
 * - UPC-A：前补 0；
 * - UPC-E：先展开为 UPC-A 再前补 0；
 * - EAN-8/GTIN-14：结构不兼容，返回 nullopt。
 */
[[nodiscard]] std::optional<gtin::model::Gtin> as_ean13(const gtin::model::Gtin& value) noexcept;

}  // namespace gtin::convert
