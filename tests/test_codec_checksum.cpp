#include "gtin/codec/checksum.hpp"
#include "gtin/codec/digits.hpp"

#include "test_main.hpp"

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace {

using gtin::codec::compute_check_digit;
using gtin::codec::digit;
using gtin::codec::extract_digits;
using gtin::codec::validate;

bool validate_text(std::string_view text) { return validate(extract_digits(text)); }

void test_known_check_digits() {
    TEST_EXPECT_EQ(compute_check_digit(extract_digits("07172053977")), digit{4});
    TEST_EXPECT_EQ(compute_check_digit(extract_digits("859570153052")), digit{6});
    TEST_EXPECT_EQ(compute_check_digit(extract_digits("0001234567890")), digit{5});
    TEST_EXPECT_EQ(compute_check_digit(extract_digits("5201348")), digit{5});

    // 全 0 与空输入：sum=0，校验位为 0。
    TEST_EXPECT_EQ(compute_check_digit(extract_digits("0000000")), digit{0});
    TEST_EXPECT_EQ(compute_check_digit({}), digit{0});
}

void test_validate_known_codes() {
    TEST_EXPECT(validate_text("8595701 530526"));
    TEST_EXPECT(validate_text("8595701 542376"));
    TEST_EXPECT(validate_text("8 595682 148871"));
    TEST_EXPECT(!validate_text("8595701 542377"));
    TEST_EXPECT(validate_text("0 71720 53977 4"));
    TEST_EXPECT(validate_text("0 41420 06785 3"));
    TEST_EXPECT(!validate_text("0 71720 53977 5"));
    TEST_EXPECT(validate_text("5201 3485"));
    TEST_EXPECT(!validate_text("5201 3486"));
    TEST_EXPECT(validate_text("00012345678905"));
}

void test_validate_rejects_out_of_range_lengths() {
    // 全 0 序列的校验位恒为 0，这里只因长度不在 [8, 14] 而失败。
    TEST_EXPECT(!validate_text("0000000"));
    TEST_EXPECT(!validate_text("000000000000000"));
    TEST_EXPECT(!validate_text(""));
}

void test_compute_long_bodies() {
    // 14..17 位主体（SSCC 等 18 位编码的前 17 位）。
    TEST_EXPECT_EQ(compute_check_digit(extract_digits("12345678901234")), digit{3});
    TEST_EXPECT_EQ(compute_check_digit(extract_digits("123456789012345")), digit{2});
    TEST_EXPECT_EQ(compute_check_digit(extract_digits("0061414112345678")), digit{1});
    TEST_EXPECT_EQ(compute_check_digit(extract_digits("9876543210987654")), digit{0});
    TEST_EXPECT_EQ(compute_check_digit(extract_digits("00614141123456789")), digit{0});
}

void test_validate_rejects_non_decimal_elements() {
    // 17 与 7 在权重 1 的位置上 mod-10 相同。
    const std::vector<digit> smuggled{0, 7, 1, 7, 2, 0, 5, 3, 9, 7, 17, 4};
    TEST_EXPECT(!validate(smuggled));
}

void test_validate_matches_compute_for_all_lengths() {
    // 简单 LCG 生成确定性的数字序列，覆盖 8..14 位。
    std::uint32_t state = 12345u;
    const auto next_digit = [&state]() {
        state = state * 1103515245u + 12345u;
        return static_cast<digit>((state >> 16) % 10u);
    };

    for (std::size_t length = 8; length <= 14; ++length) {
        for (int round = 0; round < 50; ++round) {
            std::vector<digit> digits;
            for (std::size_t i = 0; i + 1 < length; ++i) {
                digits.push_back(next_digit());
            }
            const auto check = compute_check_digit(digits);
            digits.push_back(check);
            TEST_EXPECT(validate(digits));

            digits.back() = static_cast<digit>((check + 1) % 10);
            TEST_EXPECT(!validate(digits));
        }
    }
}

} // namespace

int main() {
    test_known_check_digits();
    test_validate_known_codes();
    test_validate_rejects_out_of_range_lengths();
    test_compute_long_bodies();
    test_validate_rejects_non_decimal_elements();
    test_validate_matches_compute_for_all_lengths();
    return ::gtin::tests::run_and_report();
}
