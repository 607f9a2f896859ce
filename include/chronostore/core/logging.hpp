/**
 *  @file       logging.hpp
 *
 *  Library logger for Chronostore.
 *
 *  All Chronostore components log through a single named spdlog logger so
 *  that a host application can locate it in the spdlog registry and attach
 *  its own sinks or change its level.
 */

#ifndef CHRONOSTORE_CORE_LOGGING_HPP_
#define CHRONOSTORE_CORE_LOGGING_HPP_

#include <spdlog/common.h>
#include <spdlog/logger.h>

#include <memory>
#include <string_view>

namespace chronostore::core
{

/**
 *  Name under which the library logger is registered with spdlog.
 */
inline constexpr std::string_view kLoggerName = "chronostore";

/**
 *  Level the library logger starts at.
 */
inline constexpr auto kDefaultLogLevel = spdlog::level::warn;

/**
 *  Returns the library logger, creating it on first use.
 *
 *  If a logger named kLoggerName is already registered (for example by the
 *  host application), that logger is returned instead.
 *
 *  @return     Shared pointer to the library logger. Never null.
 */
[[nodiscard]] auto logger() -> std::shared_ptr<spdlog::logger>;

/**
 *  Sets the level of the library logger.
 *
 *  @param      level  The new minimum level.
 */
void setLogLevel(spdlog::level::level_enum level);

}  // namespace chronostore::core

#endif  // CHRONOSTORE_CORE_LOGGING_HPP_
