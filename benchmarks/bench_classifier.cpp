#include "bench_main.hpp"

#include "gtin/codec/checksum.hpp"
#include "gtin/codec/digits.hpp"
#include "gtin/convert/conversion.hpp"
#include "gtin/model/number_system.hpp"
#include "gtin/parse/classifier.hpp"

#include <array>
#include <iostream>
#include <string_view>
#include <vector>

using namespace gtin;

namespace {

// 覆盖每条分支：8/11/12/13(前导 0)/13/14 位、带分隔符、校验失败、长度错误。
constexpr std::array<std::string_view, 10> kInputs{
    "071720539774",
    "0 71720 53977 4",
    "71720 53977 4",
    "0041303073414",
    "04182634",
    "52013485",
    "8595701530526",
    "00012345678905",
    "071720539775",
    "12345",
};

constexpr std::size_t kRounds = 100000;

} // namespace

static void bench_classify_mixed() {
    std::size_t accepted = 0;
    BENCH_RUN("Classify: mixed inputs (1M)", kRounds * kInputs.size(), 3, {
        accepted = 0;
        for (std::size_t round = 0; round < kRounds; ++round) {
            for (const auto text : kInputs) {
                if (parse::classify(text).ok()) {
                    ++accepted;
                }
            }
        }
    });
    if (accepted != kRounds * 8) {
        std::cerr << "Unexpected accepted count: " << accepted << "\n";
    }
}

static void bench_checksum_validate() {
    const auto digits = codec::extract_digits("00012345678905");
    std::size_t valid = 0;
    BENCH_RUN("Checksum: validate GTIN-14 (1M)", kRounds * 10, 3, {
        valid = 0;
        for (std::size_t i = 0; i < kRounds * 10; ++i) {
            valid += codec::validate(digits) ? 1u : 0u;
        }
    });
    if (valid != kRounds * 10) {
        std::cerr << "Checksum validation failed\n";
    }
}

static void bench_country_lookup() {
    std::vector<model::Gtin> values;
    for (const auto text : kInputs) {
        auto result = parse::classify(text);
        if (result.ok()) {
            values.push_back(*result.value);
        }
    }

    std::size_t with_country = 0;
    BENCH_RUN("Country: lookup incl. UPC-E expansion (800K)", kRounds * values.size(), 3, {
        with_country = 0;
        for (std::size_t round = 0; round < kRounds; ++round) {
            for (const auto &value : values) {
                if (model::country_code(value)) {
                    ++with_country;
                }
            }
        }
    });
    (void)with_country;
}

int main() {
    bench_classify_mixed();
    bench_checksum_validate();
    bench_country_lookup();

    gtin::benchmarks::print_results();
    return 0;
}
