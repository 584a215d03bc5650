#pragma once

#include "gtin/core/common.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <variant>

namespace gtin::model {

using digit = gtin::core::digit;
using digits_view = gtin::core::digits_view;

enum class Format : std::uint8_t {
  upc_e = 0,
  upc_a = 1,
  ean8 = 2,
  ean13 = 3,
  gtin14 = 4,
};

struct UpcE final {
  static constexpr std::size_t kLength = 8;
  static constexpr Format kFormat = Format::upc_e;
  std::array<digit, kLength> digits{};
  friend bool operator==(const UpcE&, const UpcE&) = default;
};

struct UpcA final {
  static constexpr std::size_t kLength = 12;
  static constexpr Format kFormat = Format::upc_a;
  std::array<digit, kLength> digits{};
  friend bool operator==(const UpcA&, const UpcA&) = default;
};

struct Ean8 final {
  static constexpr std::size_t kLength = 8;
  static constexpr Format kFormat = Format::ean8;
  std::array<digit, kLength> digits{};
  friend bool operator==(const Ean8&, const Ean8&) = default;
};

struct Ean13 final {
  static constexpr std::size_t kLength = 13;
  static constexpr Format kFormat = Format::ean13;
  std::array<digit, kLength> digits{};
  friend bool operator==(const Ean13&, const Ean13&) = default;
};

struct Gtin14 final {
  static constexpr std::size_t kLength = 14;
  static constexpr Format kFormat = Format::gtin14;
  std::array<digit, kLength> digits{};
  friend bool operator==(const Gtin14&, const Gtin14&) = default;
};

/**
 * @brief 格式名（"UPC-E"/"UPC-A"/"EAN-8"/"EAN-13"/"GTIN-14"）。
 */
[[nodiscard]] std::string_view format_name(Format format) noexcept;

/**
 * @brief 该格式的固定位数。
 */
[[nodiscard]] std::size_t format_length(Format format) noexcept;

/**
 * @brief GTIN 值（UPC-E/UPC-A/EAN-8/EAN-13/GTIN-14 五选一，不可变）。
 *
 * 约定：
 * - 每个变体持有固定长度的数字数组（0..9），最后一位为 GS1 校验位；
 * - 显式构造函数信任调用方已经校验过数字（“预校验数组”），不再重复计算；
 *   来源不可信时请使用 from_digits() 或 parse 模块；
 * - 相等性 = 变体相同且数字相同（UPC-A 与补零后的 EAN-13 不相等）。
 */
class Gtin final {
 public:
  using storage_type = std::variant<UpcE, UpcA, Ean8, Ean13, Gtin14>;

  Gtin() = delete;

  explicit Gtin(UpcE v) noexcept;
  explicit Gtin(UpcA v) noexcept;
  explicit Gtin(Ean8 v) noexcept;
  explicit Gtin(Ean13 v) noexcept;
  explicit Gtin(Gtin14 v) noexcept;

  /**
   * @brief 以指定变体从数字数组构造（带校验）。
   *
   * - digits.size() 与该格式长度不一致：errc::invalid_length；
   * - 含有大于 9 的元素或校验位不匹配：errc::invalid_checksum；
   * - 成功时 out 被赋值，失败时 out 保持不变。
   */
  static std::error_code from_digits(Format format,
                                     digits_view digits,
                                     std::optional<Gtin>& out) noexcept;

  [[nodiscard]] const storage_type& storage() const noexcept { return storage_; }

  template <class T>
  [[nodiscard]] const T* get_if() const noexcept {
    return std::get_if<T>(&storage_);
  }

  template <class T>
  [[nodiscard]] bool is() const noexcept {
    return std::holds_alternative<T>(storage_);
  }

  [[nodiscard]] Format format() const noexcept;
  [[nodiscard]] std::string_view format_name() const noexcept;

  // 数字视图，生命周期与本对象一致。
  [[nodiscard]] digits_view digits() const noexcept;
  [[nodiscard]] std::size_t size() const noexcept { return digits().size(); }
  [[nodiscard]] digit check_digit() const noexcept { return digits().back(); }

  [[nodiscard]] bool has_valid_check_digit() const noexcept;

  // 规范文本形式：数字直接拼接，无分隔符。
  [[nodiscard]] std::string to_string() const;

  friend bool operator==(const Gtin& lhs, const Gtin& rhs) noexcept {
    return lhs.storage_ == rhs.storage_;
  }
  friend bool operator!=(const Gtin& lhs, const Gtin& rhs) noexcept { return !(lhs == rhs); }

 private:
  storage_type storage_;
};

}  // namespace gtin::model

namespace std {
template <>
struct hash<gtin::model::Gtin> {
  std::size_t operator()(const gtin::model::Gtin& value) const noexcept;
};
}  // namespace std
