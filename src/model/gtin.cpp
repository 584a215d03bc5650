#include "gtin/model/gtin.hpp"

#include "gtin/codec/checksum.hpp"
#include "gtin/codec/digits.hpp"
#include "gtin/core/error.hpp"

#include <algorithm>
#include <cstdint>
#include <type_traits>

namespace gtin::model {
namespace {

template <class T>
[[nodiscard]] Gtin make_variant_(digits_view digits) noexcept {
  T value{};
  std::copy_n(digits.begin(), T::kLength, value.digits.begin());
  return Gtin{value};
}

}  // namespace

std::string_view format_name(Format format) noexcept {
  switch (format) {
    case Format::upc_e:
      return "UPC-E";
    case Format::upc_a:
      return "UPC-A";
    case Format::ean8:
      return "EAN-8";
    case Format::ean13:
      return "EAN-13";
    case Format::gtin14:
      return "GTIN-14";
  }
  return "unknown";
}

std::size_t format_length(Format format) noexcept {
  switch (format) {
    case Format::upc_e:
      return UpcE::kLength;
    case Format::upc_a:
      return UpcA::kLength;
    case Format::ean8:
      return Ean8::kLength;
    case Format::ean13:
      return Ean13::kLength;
    case Format::gtin14:
      return Gtin14::kLength;
  }
  return 0;
}

Gtin::Gtin(UpcE v) noexcept : storage_(v) {}
Gtin::Gtin(UpcA v) noexcept : storage_(v) {}
Gtin::Gtin(Ean8 v) noexcept : storage_(v) {}
Gtin::Gtin(Ean13 v) noexcept : storage_(v) {}
Gtin::Gtin(Gtin14 v) noexcept : storage_(v) {}

std::error_code Gtin::from_digits(Format format,
                                  digits_view digits,
                                  std::optional<Gtin>& out) noexcept {
  if (digits.size() != format_length(format)) {
    return gtin::core::make_error_code(gtin::core::errc::invalid_length);
  }
  if (!gtin::codec::validate(digits)) {
    return gtin::core::make_error_code(gtin::core::errc::invalid_checksum);
  }

  switch (format) {
    case Format::upc_e:
      out.emplace(make_variant_<UpcE>(digits));
      break;
    case Format::upc_a:
      out.emplace(make_variant_<UpcA>(digits));
      break;
    case Format::ean8:
      out.emplace(make_variant_<Ean8>(digits));
      break;
    case Format::ean13:
      out.emplace(make_variant_<Ean13>(digits));
      break;
    case Format::gtin14:
      out.emplace(make_variant_<Gtin14>(digits));
      break;
  }
  return {};
}

Format Gtin::format() const noexcept {
  return std::visit([](const auto& v) noexcept { return std::decay_t<decltype(v)>::kFormat; },
                    storage_);
}

std::string_view Gtin::format_name() const noexcept { return model::format_name(format()); }

digits_view Gtin::digits() const noexcept {
  return std::visit([](const auto& v) noexcept { return digits_view{v.digits.data(), v.digits.size()}; },
                    storage_);
}

bool Gtin::has_valid_check_digit() const noexcept { return gtin::codec::validate(digits()); }

std::string Gtin::to_string() const { return gtin::codec::digits_to_string(digits()); }

}  // namespace gtin::model

namespace std {

size_t hash<gtin::model::Gtin>::operator()(const gtin::model::Gtin& value) const noexcept {
  // 最多 14 位十进制数，连同格式一起折叠为一个整数（格式作为最高位）。
  std::uint64_t h = static_cast<std::uint64_t>(value.format());
  for (const auto d : value.digits()) {
    h = h * 10u + d;
  }
  return std::hash<std::uint64_t>{}(h);
}

}  // namespace std
