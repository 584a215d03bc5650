#include "gtin/model/number_system.hpp"

#include "gtin/convert/conversion.hpp"

#include <algorithm>
#include <cstddef>
#include <iterator>

namespace gtin::model {
namespace {

struct NumberSystemRange final {
  unsigned first;
  unsigned last;
  NumberSystem ns;
};

// 未命中的前缀一律视为 general。
constexpr std::array<NumberSystemRange, 10> kNumberSystemRanges{{
    {20, 29, NumberSystem::store_use},
    {30, 39, NumberSystem::drug},
    {40, 49, NumberSystem::store_use},
    {50, 59, NumberSystem::coupon},
    {200, 299, NumberSystem::store_use},
    {977, 977, NumberSystem::issn},
    {978, 979, NumberSystem::isbn},
    {980, 980, NumberSystem::refund},
    {981, 984, NumberSystem::coupon},
    {990, 999, NumberSystem::coupon},
}};

struct CountryRange final {
  unsigned first;
  unsigned last;
  std::string_view code;
};

// 按 first 升序排列且互不重叠（二分查找依赖这一点）。
constexpr std::array<CountryRange, 45> kCountryRanges{{
    {0, 139, "US"},
    {300, 379, "FR"},
    {380, 380, "BG"},
    {383, 383, "SI"},
    {385, 385, "HR"},
    {387, 387, "BA"},
    {389, 389, "ME"},
    {390, 390, "KOSOVO"},
    {400, 440, "DE"},
    {450, 459, "JP"},
    {460, 469, "RU"},
    {470, 470, "KG"},
    {471, 471, "TW"},
    {474, 474, "EE"},
    {490, 499, "JP"},
    {500, 509, "GB"},
    {520, 521, "GR"},
    {539, 539, "IE"},
    {540, 549, "BE"},
    {570, 579, "DK"},
    {590, 590, "PL"},
    {599, 599, "HU"},
    {618, 618, "CI"},
    {619, 619, "TN"},
    {640, 649, "FI"},
    {700, 709, "NO"},
    {730, 739, "SE"},
    {742, 742, "HN"},
    {750, 750, "MX"},
    {754, 755, "CA"},
    {759, 759, "VE"},
    {760, 769, "CH"},
    {773, 773, "UY"},
    {789, 790, "BR"},
    {800, 839, "IT"},
    {840, 849, "ES"},
    {858, 858, "SK"},
    {859, 859, "CZ"},
    {860, 860, "RS"},
    {870, 879, "NL"},
    {885, 885, "TH"},
    {888, 888, "SG"},
    {900, 919, "AT"},
    {930, 939, "AU"},
    {940, 949, "NZ"},
}};

constexpr bool country_ranges_sorted_() noexcept {
  for (std::size_t i = 1; i < kCountryRanges.size(); ++i) {
    if (kCountryRanges[i].first <= kCountryRanges[i - 1].last) {
      return false;
    }
  }
  return true;
}
static_assert(country_ranges_sorted_(), "country ranges must be sorted and disjoint");

}  // namespace

std::string_view to_string(NumberSystem ns) noexcept {
  switch (ns) {
    case NumberSystem::general:
      return "general";
    case NumberSystem::store_use:
      return "store_use";
    case NumberSystem::coupon:
      return "coupon";
    case NumberSystem::drug:
      return "drug";
    case NumberSystem::issn:
      return "issn";
    case NumberSystem::isbn:
      return "isbn";
    case NumberSystem::refund:
      return "refund";
    case NumberSystem::unknown:
      return "unknown";
  }
  return "unknown";
}

std::optional<Gs1Prefix> gs1_prefix(const Gtin& value) noexcept {
  if (const auto* upce = value.get_if<UpcE>()) {
    UpcA upca{};
    if (gtin::convert::expand_upce(*upce, upca)) {
      return std::nullopt;
    }
    return Gs1Prefix{0, upca.digits[0], upca.digits[1]};
  }
  if (const auto* upca = value.get_if<UpcA>()) {
    return Gs1Prefix{0, upca->digits[0], upca->digits[1]};
  }
  if (const auto* gtin14 = value.get_if<Gtin14>()) {
    return Gs1Prefix{gtin14->digits[1], gtin14->digits[2], gtin14->digits[3]};
  }
  // EAN-8 / EAN-13
  const auto d = value.digits();
  return Gs1Prefix{d[0], d[1], d[2]};
}

NumberSystem number_system_from_value(unsigned prefix) noexcept {
  for (const auto& range : kNumberSystemRanges) {
    if (prefix >= range.first && prefix <= range.last) {
      return range.ns;
    }
  }
  return NumberSystem::general;
}

NumberSystem number_system_from_prefix(digits_view prefix) noexcept {
  if (prefix.size() != 3) {
    return NumberSystem::unknown;
  }
  return number_system_from_value(prefix_value(Gs1Prefix{prefix[0], prefix[1], prefix[2]}));
}

NumberSystem number_system(const Gtin& value) noexcept {
  const auto prefix = gs1_prefix(value);
  if (!prefix) {
    return NumberSystem::unknown;
  }
  return number_system_from_value(prefix_value(*prefix));
}

std::optional<std::string_view> country_for_prefix(unsigned prefix) noexcept {
  // 找到第一个 first > prefix 的区间，前一个区间才可能包含 prefix。
  const auto it = std::upper_bound(
      kCountryRanges.begin(), kCountryRanges.end(), prefix,
      [](unsigned value, const CountryRange& range) { return value < range.first; });
  if (it == kCountryRanges.begin()) {
    return std::nullopt;
  }
  const auto& range = *std::prev(it);
  if (prefix > range.last) {
    return std::nullopt;
  }
  return range.code;
}

std::optional<std::string_view> country_code(const Gtin& value) noexcept {
  switch (number_system(value)) {
    case NumberSystem::drug:
      return std::string_view{"US"};
    case NumberSystem::store_use:
    case NumberSystem::coupon:
    case NumberSystem::isbn:
    case NumberSystem::issn:
    case NumberSystem::refund:
      return std::nullopt;
    case NumberSystem::unknown:
      // 无法推导前缀（UPC-E 展开失败）。
      return std::nullopt;
    case NumberSystem::general:
      break;
  }
  const auto prefix = gs1_prefix(value);
  if (!prefix) {
    return std::nullopt;
  }
  return country_for_prefix(prefix_value(*prefix));
}

}  // namespace gtin::model
