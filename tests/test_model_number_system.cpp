#include "gtin/convert/conversion.hpp"
#include "gtin/model/number_system.hpp"
#include "gtin/parse/classifier.hpp"

#include "test_main.hpp"

#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace {

using gtin::model::country_code;
using gtin::model::country_for_prefix;
using gtin::model::Ean13;
using gtin::model::Ean8;
using gtin::model::Gs1Prefix;
using gtin::model::Gtin;
using gtin::model::Gtin14;
using gtin::model::NumberSystem;
using gtin::model::number_system;
using gtin::model::number_system_from_value;
using gtin::model::UpcA;
using gtin::model::UpcE;

using OptCountry = std::optional<std::string_view>;

Gtin parse_ok(std::string_view text) {
  auto result = gtin::parse::classify(text);
  TEST_EXPECT_OK(result.ec);
  if (!result.value) {
    return Gtin{UpcA{}};
  }
  return *result.value;
}

void test_number_system_of_codes() {
  const std::vector<std::pair<std::string_view, NumberSystem>> cases{
      {"8595701 530526", NumberSystem::general},
      {"8595701 542376", NumberSystem::general},
      {"8 595682 148871", NumberSystem::general},
      {"0 71720 53977 4", NumberSystem::general},
      {"0 41420 06785 3", NumberSystem::general},
      {"5201 3485", NumberSystem::general},
      {"9783161484100", NumberSystem::isbn},
      {"9772434561006", NumberSystem::issn},
      {"02 45678 1 0543 9", NumberSystem::store_use},
      {"2012345678903", NumberSystem::store_use},
      {"301234567896", NumberSystem::drug},
      {"512345678900", NumberSystem::coupon},
      {"9900000000004", NumberSystem::coupon},
      {"9801234567892", NumberSystem::refund},
  };
  for (const auto& [text, expected] : cases) {
    TEST_EXPECT(number_system(parse_ok(text)) == expected);
  }
}

void test_country_of_codes() {
  const std::vector<std::pair<std::string_view, OptCountry>> cases{
      {"8595701 530526", "CZ"},
      {"8595701 542376", "CZ"},
      {"8 595682 148871", "CZ"},
      {"8 410175 086501", "ES"},
      {"0 71720 53977 4", "US"},
      {"0 41420 06785 3", "US"},
      {"0 123450 3", "US"},
      {"5201 3485", "GR"},
      {"4006381333931", "DE"},
      {"3901234567895", "KOSOVO"},
      {"00012345678905", "US"},
      {"10012345678902", "US"},
      // drug 号段固定为 US
      {"301234567896", "US"},
      {"02 45678 1 0543 9", std::nullopt},
      {"2012345678903", std::nullopt},
      {"9783161484100", std::nullopt},
      {"9772434561006", std::nullopt},
      {"512345678900", std::nullopt},
      {"9801234567892", std::nullopt},
      // 620 不在国家表中
      {"6201234567893", std::nullopt},
  };
  for (const auto& [text, expected] : cases) {
    TEST_EXPECT(country_code(parse_ok(text)) == expected);
  }
}

void test_gs1_prefix_per_variant() {
  TEST_EXPECT(gtin::model::gs1_prefix(parse_ok("071720539774")) == (Gs1Prefix{0, 0, 7}));
  TEST_EXPECT(gtin::model::gs1_prefix(parse_ok("04182634")) == (Gs1Prefix{0, 0, 4}));
  TEST_EXPECT(gtin::model::gs1_prefix(parse_ok("52013485")) == (Gs1Prefix{5, 2, 0}));
  TEST_EXPECT(gtin::model::gs1_prefix(parse_ok("8595701530526")) == (Gs1Prefix{8, 5, 9}));
  // GTIN-14 跳过首位包装指示符。
  TEST_EXPECT(gtin::model::gs1_prefix(parse_ok("10012345678902")) == (Gs1Prefix{0, 0, 1}));
}

void test_unknown_when_prefix_not_derivable() {
  const Gtin broken{UpcE{{0, 1, 2, 13, 4, 5, 6, 7}}};
  TEST_EXPECT(!gtin::model::gs1_prefix(broken).has_value());
  TEST_EXPECT(number_system(broken) == NumberSystem::unknown);
  TEST_EXPECT(!country_code(broken).has_value());
}

void test_number_system_boundaries() {
  TEST_EXPECT(number_system_from_value(0) == NumberSystem::general);
  TEST_EXPECT(number_system_from_value(19) == NumberSystem::general);
  TEST_EXPECT(number_system_from_value(20) == NumberSystem::store_use);
  TEST_EXPECT(number_system_from_value(29) == NumberSystem::store_use);
  TEST_EXPECT(number_system_from_value(30) == NumberSystem::drug);
  TEST_EXPECT(number_system_from_value(39) == NumberSystem::drug);
  TEST_EXPECT(number_system_from_value(40) == NumberSystem::store_use);
  TEST_EXPECT(number_system_from_value(49) == NumberSystem::store_use);
  TEST_EXPECT(number_system_from_value(50) == NumberSystem::coupon);
  TEST_EXPECT(number_system_from_value(59) == NumberSystem::coupon);
  TEST_EXPECT(number_system_from_value(60) == NumberSystem::general);
  TEST_EXPECT(number_system_from_value(199) == NumberSystem::general);
  TEST_EXPECT(number_system_from_value(200) == NumberSystem::store_use);
  TEST_EXPECT(number_system_from_value(299) == NumberSystem::store_use);
  TEST_EXPECT(number_system_from_value(300) == NumberSystem::general);
  TEST_EXPECT(number_system_from_value(976) == NumberSystem::general);
  TEST_EXPECT(number_system_from_value(977) == NumberSystem::issn);
  TEST_EXPECT(number_system_from_value(978) == NumberSystem::isbn);
  TEST_EXPECT(number_system_from_value(979) == NumberSystem::isbn);
  TEST_EXPECT(number_system_from_value(980) == NumberSystem::refund);
  TEST_EXPECT(number_system_from_value(981) == NumberSystem::coupon);
  TEST_EXPECT(number_system_from_value(984) == NumberSystem::coupon);
  TEST_EXPECT(number_system_from_value(985) == NumberSystem::general);
  TEST_EXPECT(number_system_from_value(989) == NumberSystem::general);
  TEST_EXPECT(number_system_from_value(990) == NumberSystem::coupon);
  TEST_EXPECT(number_system_from_value(999) == NumberSystem::coupon);

  const std::vector<gtin::model::digit> isbn{9, 7, 8};
  const std::vector<gtin::model::digit> too_short{9, 7};
  TEST_EXPECT(gtin::model::number_system_from_prefix(isbn) == NumberSystem::isbn);
  TEST_EXPECT(gtin::model::number_system_from_prefix(too_short) == NumberSystem::unknown);

  TEST_EXPECT_EQ(gtin::model::to_string(NumberSystem::store_use), std::string_view{"store_use"});
  TEST_EXPECT_EQ(gtin::model::to_string(NumberSystem::unknown), std::string_view{"unknown"});
}

void test_country_table_boundaries() {
  TEST_EXPECT(country_for_prefix(0) == OptCountry{"US"});
  TEST_EXPECT(country_for_prefix(139) == OptCountry{"US"});
  TEST_EXPECT(!country_for_prefix(140).has_value());
  TEST_EXPECT(!country_for_prefix(299).has_value());
  TEST_EXPECT(country_for_prefix(300) == OptCountry{"FR"});
  TEST_EXPECT(country_for_prefix(379) == OptCountry{"FR"});
  TEST_EXPECT(!country_for_prefix(381).has_value());
  TEST_EXPECT(country_for_prefix(440) == OptCountry{"DE"});
  TEST_EXPECT(!country_for_prefix(441).has_value());
  TEST_EXPECT(country_for_prefix(455) == OptCountry{"JP"});
  TEST_EXPECT(country_for_prefix(495) == OptCountry{"JP"});
  TEST_EXPECT(country_for_prefix(755) == OptCountry{"CA"});
  TEST_EXPECT(country_for_prefix(859) == OptCountry{"CZ"});
  TEST_EXPECT(country_for_prefix(949) == OptCountry{"NZ"});
  TEST_EXPECT(!country_for_prefix(950).has_value());
  TEST_EXPECT(!country_for_prefix(999).has_value());
}

void test_as_ean13() {
  const auto from_upca = gtin::convert::as_ean13(parse_ok("071720539774"));
  TEST_EXPECT(from_upca.has_value() && from_upca->is<Ean13>());
  TEST_EXPECT_EQ(from_upca->to_string(), "0071720539774");

  const auto from_upce = gtin::convert::as_ean13(parse_ok("04182634"));
  TEST_EXPECT(from_upce.has_value() && from_upce->is<Ean13>());
  TEST_EXPECT_EQ(from_upce->to_string(), "0041800000265");
  TEST_EXPECT(from_upce->has_valid_check_digit());

  const auto ean13 = parse_ok("8595701530526");
  TEST_EXPECT(gtin::convert::as_ean13(ean13) == ean13);

  TEST_EXPECT(!gtin::convert::as_ean13(Gtin{Ean8{{5, 2, 0, 1, 3, 4, 8, 5}}}).has_value());
  TEST_EXPECT(!gtin::convert::as_ean13(parse_ok("00012345678905")).has_value());
}

}  // namespace

int main() {
  test_number_system_of_codes();
  test_country_of_codes();
  test_gs1_prefix_per_variant();
  test_unknown_when_prefix_not_derivable();
  test_number_system_boundaries();
  test_country_table_boundaries();
  test_as_ean13();
  return ::gtin::tests::run_and_report();
}
