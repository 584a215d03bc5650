#pragma once

#include <spdlog/logger.h>

namespace gtin::core {

// 库内部统一入口：返回名为 kLoggerName 的 logger（首次调用时创建或复用已注册的同名 logger）。
spdlog::logger& library_logger();

} // namespace gtin::core
