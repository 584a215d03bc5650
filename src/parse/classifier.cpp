#include "gtin/parse/classifier.hpp"

#include "gtin/codec/checksum.hpp"
#include "gtin/codec/digits.hpp"
#include "gtin/core/error.hpp"

#include "core/logger.hpp"

#include <utility>
#include <vector>

namespace gtin::parse {
namespace {

using gtin::core::digit;
using gtin::core::digits_view;
using gtin::core::errc;
using gtin::core::make_error_code;
using gtin::model::Format;
using gtin::model::Gtin;

[[nodiscard]] ParseResult fail_(errc e, std::size_t digit_count) {
  ParseResult result;
  result.ec = make_error_code(e);
  result.digit_count = digit_count;
  return result;
}

[[nodiscard]] ParseResult succeed_(Format format, digits_view digits, std::size_t digit_count) {
  ParseResult result;
  result.digit_count = digit_count;
  // 校验已在调用方完成，这里只会因为长度与格式不匹配而失败（内部逻辑错误）。
  result.ec = Gtin::from_digits(format, digits, result.value);
  return result;
}

[[nodiscard]] bool length_supported_(std::size_t digit_count) noexcept {
  return digit_count >= gtin::core::kMinLength && digit_count <= gtin::core::kMaxLength;
}

[[nodiscard]] ParseResult reject_length_(std::string_view text, std::size_t digit_count) {
  gtin::core::library_logger().debug("rejected input '{}': unsupported length {}", text, digit_count);
  return fail_(errc::invalid_length, digit_count);
}

[[nodiscard]] ParseResult reject_checksum_(std::string_view text, std::size_t digit_count) {
  gtin::core::library_logger().debug("rejected input '{}': check digit mismatch", text);
  return fail_(errc::invalid_checksum, digit_count);
}

[[nodiscard]] Format resolve_eight_digits_(digit leading, EightDigitPolicy policy) noexcept {
  const bool leading_zero = (leading == 0);
  switch (policy) {
    case EightDigitPolicy::leading_zero_is_ean8:
      return leading_zero ? Format::ean8 : Format::upc_e;
    case EightDigitPolicy::leading_zero_is_upce:
      break;
  }
  return leading_zero ? Format::upc_e : Format::ean8;
}

[[nodiscard]] ParseResult parse_forced_eight_(std::string_view text, Format format) {
  const std::size_t count = gtin::codec::count_digits(text);
  if (count != 8) {
    gtin::core::library_logger().debug("{} requires 8 digits, got {}", gtin::model::format_name(format), count);
    return fail_(errc::invalid_length, count);
  }
  const auto digits = gtin::codec::extract_digits(text);
  if (!gtin::codec::validate(digits)) {
    gtin::core::library_logger().debug("rejected {} input '{}': check digit mismatch", gtin::model::format_name(format), text);
    return fail_(errc::invalid_checksum, digits.size());
  }
  return succeed_(format, digits, digits.size());
}

}  // namespace

std::string ParseResult::message() const {
  if (!ec) {
    return "ok";
  }
  if (ec == errc::invalid_length) {
    return ec.message() + ": " + std::to_string(digit_count);
  }
  return ec.message();
}

ParseResult classify(std::string_view text, const ParseOptions& options) {
  // 先计数：长度不合法的输入不必分配数字缓冲区。
  const std::size_t count = gtin::codec::count_digits(text);
  if (!length_supported_(count)) {
    return reject_length_(text, count);
  }

  std::vector<digit> digits = gtin::codec::extract_digits(text);
  if (!gtin::codec::validate(digits)) {
    return reject_checksum_(text, count);
  }

  switch (count) {
    case 8: {
      const auto format = resolve_eight_digits_(digits.front(), options.eight_digit_policy);
      gtin::core::library_logger().trace("8-digit input resolved as {}", gtin::model::format_name(format));
      return succeed_(format, digits, count);
    }
    case 11:
      if (!options.repair_stripped_upca) {
        gtin::core::library_logger().debug("rejected 11-digit input '{}' (stripped UPC-A repair disabled)", text);
        return fail_(errc::invalid_length, count);
      }
      gtin::core::library_logger().trace("re-inserting stripped leading zero of UPC-A");
      digits.insert(digits.begin(), digit{0});
      return succeed_(Format::upc_a, digits, count);
    case 12:
      return succeed_(Format::upc_a, digits, count);
    case 13:
      if (digits.front() == 0 && options.collapse_zero_padded_ean13) {
        gtin::core::library_logger().trace("zero-padded EAN-13 collapsed to UPC-A");
        return succeed_(Format::upc_a, digits_view{digits}.subspan(1), count);
      }
      return succeed_(Format::ean13, digits, count);
    case 14:
      return succeed_(Format::gtin14, digits, count);
    default:
      // 9/10 位：长度在 [8, 14] 内且校验位正确，但没有对应的 GTIN 变体。
      gtin::core::library_logger().debug("rejected input '{}': no format with {} digits", text, count);
      return fail_(errc::invalid_length, count);
  }
}

ParseResult parse_as_ean8(std::string_view text) { return parse_forced_eight_(text, Format::ean8); }

ParseResult parse_as_upce(std::string_view text) { return parse_forced_eight_(text, Format::upc_e); }

std::error_code parse(std::string_view text,
                      std::optional<gtin::model::Gtin>& out,
                      const ParseOptions& options) {
  auto result = classify(text, options);
  if (result.ec) {
    return result.ec;
  }
  out = std::move(result.value);
  return {};
}

}  // namespace gtin::parse
