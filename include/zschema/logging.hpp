#pragma once

#include <memory>
#include <string>

#include <spdlog/fmt/fmt.h>
#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

namespace zschema {

using Logger    = spdlog::logger;
using LoggerPtr = std::shared_ptr<Logger>;

inline constexpr const char* LoggerName = "zschema";

/*
 * Named logger of the library. Cloned from spdlog's default logger on first
 * use, so sinks and levels follow whatever the application configured
 * (including SPDLOG_LEVEL=zschema=trace style settings).
 */
LoggerPtr get_logger(const std::string& name = LoggerName);

} // namespace zschema
