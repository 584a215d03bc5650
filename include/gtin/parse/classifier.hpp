#pragma once

#include "gtin/model/gtin.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace gtin::parse {

/**
 * @brief 8 位输入（UPC-E 与 EAN-8 无结构差异）的默认判定方向。
 *
 * 两种约定都在实际数据中出现过，这只是启发式规则；需要确定结果时请直接
 * 调用 parse_as_upce() / parse_as_ean8()。
 */
enum class EightDigitPolicy : std::uint8_t {
  // 首位为 0 判为 UPC-E（号码系统 0），否则判为 EAN-8。默认值。
  leading_zero_is_upce = 0,
  // 首位为 0 判为 EAN-8，否则判为 UPC-E。
  leading_zero_is_ean8 = 1,
};

struct ParseOptions final {
  EightDigitPolicy eight_digit_policy{EightDigitPolicy::leading_zero_is_upce};

  // 11 位输入视为被外部系统去掉前导 0 的 UPC-A，补 0 后按 UPC-A 处理。
  // 关闭后 11 位输入返回 invalid_length。
  bool repair_stripped_upca{true};

  // 以 0 开头的 13 位输入视为补 0 的 UPC-A，去掉前导 0 后按 UPC-A 处理。
  // 关闭后按 EAN-13 处理。
  bool collapse_zero_padded_ean13{true};
};

/**
 * @brief 解析结果。
 *
 * - ec 为空时 value 有值；
 * - digit_count 始终为提取出的数字个数（invalid_length 时即“出错的位数”）。
 */
struct ParseResult final {
  std::error_code ec{};
  std::size_t digit_count{0};
  std::optional<gtin::model::Gtin> value{};

  [[nodiscard]] bool ok() const noexcept { return !ec && value.has_value(); }

  // 面向最终用户的描述，例如 "unsupported GTIN length: 5"。
  [[nodiscard]] std::string message() const;
};

/**
 * @brief 从任意文本识别并校验 GTIN。
 *
 * 流程：
 * 1) 提取数字（丢弃空格、连字符等所有非数字字符）；
 * 2) 位数不在 [8, 14]：invalid_length；校验位不符：invalid_checksum；
 * 3) 按位数选择变体：
 *    - 8：UPC-E 或 EAN-8，见 EightDigitPolicy；
 *    - 11：补前导 0 后为 UPC-A；
 *    - 12：UPC-A；
 *    - 13：首位为 0 时去掉后为 UPC-A，否则 EAN-13；
 *    - 14：GTIN-14。
 *
 * 注意：11 位输入的校验是在补 0 之前完成的；前导 0 不影响 mod-10 结果。
 */
[[nodiscard]] ParseResult classify(std::string_view text, const ParseOptions& options = {});

/**
 * @brief 强制按 EAN-8 解析：必须恰好 8 位且校验通过，不看首位。
 */
[[nodiscard]] ParseResult parse_as_ean8(std::string_view text);

/**
 * @brief 强制按 UPC-E 解析：必须恰好 8 位且校验通过，不看首位。
 */
[[nodiscard]] ParseResult parse_as_upce(std::string_view text);

/**
 * @brief classify() 的 error_code 风格包装：成功时写入 out，失败时 out 不变。
 */
std::error_code parse(std::string_view text,
                      std::optional<gtin::model::Gtin>& out,
                      const ParseOptions& options = {});

}  // namespace gtin::parse
