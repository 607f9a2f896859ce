/**
 *  @file       logging.cpp
 *
 *  Implementation of the library logger.
 */

#include "chronostore/core/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <mutex>
#include <string>

namespace chronostore::core
{

auto logger() -> std::shared_ptr<spdlog::logger>
{
    static std::mutex creation_mutex;
    std::lock_guard lock(creation_mutex);

    const std::string name{kLoggerName};
    if (auto existing = spdlog::get(name))
    {
        return existing;
    }

    auto created = spdlog::stderr_color_mt(name);
    created->set_level(kDefaultLogLevel);
    return created;
}

void setLogLevel(spdlog::level::level_enum level)
{
    logger()->set_level(level);
}

}  // namespace chronostore::core
