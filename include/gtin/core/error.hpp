#pragma once

#include <system_error>

namespace gtin::core {

/**
 * @brief 本库通用错误码（跨模块复用）。
 *
 * 约定：
 * - 所有可失败接口返回 std::error_code（或携带 error_code 的结果结构），不抛异常；
 * - invalid_length 的具体位数由调用方结果结构（如 ParseResult::digit_count）携带；
 * - 计算是纯函数，同样输入重试必然得到同样错误。
 */
enum class errc : int {
  ok = 0,
  invalid_length = 1,
  invalid_checksum = 2,
  conversion_failed = 3,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

}  // namespace gtin::core

namespace std {
template <>
struct is_error_code_enum<gtin::core::errc> : true_type {};
}  // namespace std
