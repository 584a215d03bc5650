#pragma once

#include <cstdint>
#include <string_view>

namespace gtin::core {

/**
 * @brief 本库日志使用的 spdlog logger 名称。
 *
 * 本库只通过名为 "gtin" 的 logger 输出，不触碰业务侧的默认 logger。
 * 若业务侧在首次使用本库之前用同名注册了自己的 logger（自定义 sink/pattern），
 * 本库会直接复用它；否则首次使用时创建一个输出到 stderr 的 logger。
 */
inline constexpr std::string_view kLoggerName = "gtin";

/**
 * @brief 日志级别。
 *
 * 说明：
 * - spdlog 类型不暴露到 public headers；
 * - 分类器在 debug 级别记录被拒绝的输入，在 trace 级别记录长度修复与 8 位判定；
 * - JSON 解码在 debug 级别记录非字符串输入。
 */
enum class LogLevel : std::uint8_t {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    critical = 5,
    off = 6,
};

// 只调整 "gtin" logger 的级别，全局默认级别保持不变。
void set_log_level(LogLevel level);
[[nodiscard]] LogLevel log_level();

} // namespace gtin::core
