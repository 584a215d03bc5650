#pragma once

#include "gtin/core/common.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace gtin::codec {

using digit = gtin::core::digit;
using digits_view = gtin::core::digits_view;

/**
 * @brief 从任意文本中按顺序提取 ASCII 十进制数字。
 *
 * 说明：
 * - 空格、连字符、冒号、字母等一律丢弃，只保留 '0'..'9'；
 * - 返回值为数值 0..9（不是字符）；
 * - 不做长度校验：空结果或超长结果都是合法输出，由下游校验。
 */
[[nodiscard]] std::vector<digit> extract_digits(std::string_view text);

/**
 * @brief 统计文本中的 ASCII 十进制数字个数（不分配内存）。
 */
[[nodiscard]] std::size_t count_digits(std::string_view text) noexcept;

/**
 * @brief 将数字序列格式化为无分隔符的规范文本（例如 "071720539774"）。
 *
 * 超出 0..9 的元素不会出现在合法 GTIN 中，这里按 '?' 输出以便排查。
 */
[[nodiscard]] std::string digits_to_string(digits_view digits);

} // namespace gtin::codec
