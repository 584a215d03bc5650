#include <gtin/core/log.hpp>
#include <gtin/parse/classifier.hpp>
#include <gtin/utils/gtin_dump.hpp>

#include <iostream>
#include <string_view>

using namespace gtin;

// 用法：gtin_inspect [--ean8|--upce] [-v] <code>...
//   --ean8 / --upce：8 位输入强制按指定格式解析
//   -v：输出 debug 日志（被拒绝的原因）
int main(int argc, char **argv) {
    enum class Mode { automatic, ean8, upce };
    Mode mode = Mode::automatic;
    core::set_log_level(core::LogLevel::warn);

    int failures = 0;
    int inspected = 0;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg{argv[i]};
        if (arg == "--ean8") {
            mode = Mode::ean8;
            continue;
        }
        if (arg == "--upce") {
            mode = Mode::upce;
            continue;
        }
        if (arg == "-v") {
            core::set_log_level(core::LogLevel::trace);
            continue;
        }

        ++inspected;
        parse::ParseResult result;
        switch (mode) {
        case Mode::ean8:
            result = parse::parse_as_ean8(arg);
            break;
        case Mode::upce:
            result = parse::parse_as_upce(arg);
            break;
        case Mode::automatic:
            result = parse::classify(arg);
            break;
        }

        if (!result.ok()) {
            std::cerr << "\"" << arg << "\": " << result.message() << "\n";
            ++failures;
            continue;
        }

        utils::GtinDumpOptions options;
        options.enable_color = true;
        std::cout << utils::dump_gtin(*result.value, options) << "\n";
    }

    if (inspected == 0) {
        std::cerr << "usage: " << argv[0] << " [--ean8|--upce] [-v] <code>...\n";
        return 2;
    }
    return failures == 0 ? 0 : 1;
}
