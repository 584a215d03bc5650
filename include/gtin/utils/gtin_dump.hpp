#pragma once

#include "gtin/model/gtin.hpp"

#include <string>

namespace gtin::utils {

/**
 * @brief GTIN 的可读化输出（调试/日志用途）。
 *
 * 示例：`UPC-A 071720539774 prefix=007 ns=general country=US`
 */
struct GtinDumpOptions final {
    // 是否输出 3 位 GS1 前缀。
    bool show_prefix{true};

    // 是否输出号码用途分类。
    bool show_number_system{true};

    // 是否输出国家码（无法判定时输出 "-"）。
    bool show_country{true};

    // 是否输出 ANSI 颜色控制码（终端更易读；写入日志/文件时建议关闭）。
    bool enable_color{false};
};

[[nodiscard]] std::string dump_gtin(const gtin::model::Gtin &value,
                                    GtinDumpOptions options = {});

} // namespace gtin::utils
