#include "gtin/utils/gtin_dump.hpp"

#include "gtin/codec/digits.hpp"
#include "gtin/model/number_system.hpp"

#include <sstream>
#include <string_view>

namespace gtin::utils {
namespace {

struct Ansi final {
    static constexpr const char *reset = "\033[0m";
    static constexpr const char *format = "\033[1;35m";
    static constexpr const char *digits = "\033[1;33m";
    static constexpr const char *dim = "\033[2m";
};

[[nodiscard]] const char *ansi_(bool enable, const char *code) noexcept {
    return enable ? code : "";
}

} // namespace

std::string dump_gtin(const gtin::model::Gtin &value, GtinDumpOptions options) {
    const bool enable_color = options.enable_color;
    const auto *reset = ansi_(enable_color, Ansi::reset);
    const auto *dim = ansi_(enable_color, Ansi::dim);

    std::ostringstream oss;
    oss << ansi_(enable_color, Ansi::format) << value.format_name() << reset << ' '
        << ansi_(enable_color, Ansi::digits) << value.to_string() << reset;

    if (options.show_prefix) {
        oss << ' ' << dim << "prefix=" << reset;
        if (const auto prefix = gtin::model::gs1_prefix(value)) {
            oss << gtin::codec::digits_to_string(*prefix);
        } else {
            oss << '-';
        }
    }

    if (options.show_number_system) {
        oss << ' ' << dim << "ns=" << reset
            << gtin::model::to_string(gtin::model::number_system(value));
    }

    if (options.show_country) {
        oss << ' ' << dim << "country=" << reset;
        const auto country = gtin::model::country_code(value);
        oss << (country ? *country : std::string_view{"-"});
    }

    return oss.str();
}

} // namespace gtin::utils
