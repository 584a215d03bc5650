#pragma once

#include "gtin/core/common.hpp"

namespace gtin::codec {

/**
 * @brief 计算 GS1 mod-10 校验位。
 *
 * 输入为“去掉校验位”的数字序列。从最右侧开始，位置 0、2、4... 权重为 3，
 * 位置 1、3、5... 权重为 1；校验位 = (10 - sum % 10) % 10。
 *
 * 该算法与长度无关：UPC-A/EAN-13/GTIN-14 等不同长度的结果都与 GS1 一致。
 */
[[nodiscard]] gtin::core::digit compute_check_digit(gtin::core::digits_view digits) noexcept;

/**
 * @brief 校验一个完整（含校验位）的 GTIN 数字序列。
 *
 * - 长度必须在 [8, 14]，否则返回 false；
 * - 任一元素大于 9 返回 false；
 * - 最后一位必须等于其余数字的 compute_check_digit()。
 */
[[nodiscard]] bool validate(gtin::core::digits_view digits) noexcept;

} // namespace gtin::codec
