#include "gtin/codec/digits.hpp"

#include <algorithm>

namespace gtin::codec {
namespace {

[[nodiscard]] constexpr bool is_ascii_digit_(char c) noexcept {
    return c >= '0' && c <= '9';
}

} // namespace

std::vector<digit> extract_digits(std::string_view text) {
    std::vector<digit> out;
    out.reserve(std::min(text.size(), gtin::core::kMaxLength + 1));

    for (const char c : text) {
        if (!is_ascii_digit_(c)) {
            continue;
        }
        out.push_back(static_cast<digit>(c - '0'));
    }
    return out;
}

std::size_t count_digits(std::string_view text) noexcept {
    return static_cast<std::size_t>(
        std::count_if(text.begin(), text.end(), is_ascii_digit_));
}

std::string digits_to_string(digits_view digits) {
    std::string out;
    out.reserve(digits.size());
    for (const auto d : digits) {
        out.push_back(d <= 9 ? static_cast<char>('0' + d) : '?');
    }
    return out;
}

} // namespace gtin::codec
