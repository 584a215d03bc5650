#include "gtin/convert/conversion.hpp"

#include "gtin/codec/checksum.hpp"
#include "gtin/core/error.hpp"

#include <algorithm>
#include <array>
#include <cstddef>

namespace gtin::convert {
namespace {

using gtin::core::digit;

constexpr std::size_t kCoreLength = 6;
constexpr std::size_t kFieldLength = 5;

struct Expansion final {
  std::array<digit, kFieldLength> manufacturer{};
  std::array<digit, kFieldLength> item{};
};

[[nodiscard]] Expansion expand_core_(const std::array<digit, kCoreLength>& d) noexcept {
  switch (d[5]) {
    case 0:
    case 1:
    case 2:
      return {{d[0], d[1], d[5], 0, 0}, {0, 0, d[2], d[3], d[4]}};
    case 3:
      return {{d[0], d[1], d[2], 0, 0}, {0, 0, 0, d[3], d[4]}};
    case 4:
      return {{d[0], d[1], d[2], d[3], 0}, {0, 0, 0, 0, d[4]}};
    default:
      return {{d[0], d[1], d[2], d[3], d[4]}, {0, 0, 0, 0, d[5]}};
  }
}

[[nodiscard]] gtin::model::Gtin pad_to_ean13_(const gtin::model::UpcA& upca) noexcept {
  gtin::model::Ean13 ean13{};
  std::copy(upca.digits.begin(), upca.digits.end(), ean13.digits.begin() + 1);
  return gtin::model::Gtin{ean13};
}

}  // namespace

std::error_code expand_upce(gtin::core::digits_view digits, gtin::model::UpcA& out) noexcept {
  gtin::core::digits_view core_digits;
  switch (digits.size()) {
    case 8:
      core_digits = digits.subspan(1, kCoreLength);
      break;
    case 7:
    case 6:
      core_digits = digits.first(kCoreLength);
      break;
    default:
      return gtin::core::make_error_code(gtin::core::errc::conversion_failed);
  }

  std::array<digit, kCoreLength> core{};
  std::copy(core_digits.begin(), core_digits.end(), core.begin());
  if (std::any_of(core.begin(), core.end(), [](digit d) { return d > 9; })) {
    return gtin::core::make_error_code(gtin::core::errc::conversion_failed);
  }

  const auto expansion = expand_core_(core);

  gtin::model::UpcA upca{};
  auto it = upca.digits.begin();
  *it++ = 0;
  it = std::copy(expansion.manufacturer.begin(), expansion.manufacturer.end(), it);
  it = std::copy(expansion.item.begin(), expansion.item.end(), it);

  const auto body_length = static_cast<std::size_t>(it - upca.digits.begin());
  if (body_length + 1 != gtin::model::UpcA::kLength) {
    return gtin::core::make_error_code(gtin::core::errc::conversion_failed);
  }
  *it = gtin::codec::compute_check_digit(gtin::core::digits_view{upca.digits.data(), body_length});

  out = upca;
  return {};
}

std::error_code expand_upce(const gtin::model::UpcE& upce, gtin::model::UpcA& out) noexcept {
  return expand_upce(gtin::core::digits_view{upce.digits.data(), upce.digits.size()}, out);
}

std::optional<gtin::model::Gtin> as_ean13(const gtin::model::Gtin& value) noexcept {
  if (value.is<gtin::model::Ean13>()) {
    return value;
  }
  if (const auto* upca = value.get_if<gtin::model::UpcA>()) {
    return pad_to_ean13_(*upca);
  }
  if (const auto* upce = value.get_if<gtin::model::UpcE>()) {
    gtin::model::UpcA upca{};
    if (expand_upce(*upce, upca)) {
      return std::nullopt;
    }
    return pad_to_ean13_(upca);
  }
  return std::nullopt;
}

}  // namespace gtin::convert
