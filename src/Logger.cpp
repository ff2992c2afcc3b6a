// Logger.cpp

#include "quicsock/Logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace quicsock::log
{

namespace
{

constexpr const char* LoggerName = "quicsock";

std::shared_ptr<spdlog::logger> createLogger()
{
    if (auto existing = spdlog::get(LoggerName))
        return existing;
    return spdlog::stderr_color_mt(LoggerName);
}

} // namespace

spdlog::logger& logger()
{
    static const std::shared_ptr<spdlog::logger> instance = createLogger();
    return *instance;
}

void setLevel(const spdlog::level::level_enum level)
{
    logger().set_level(level);
}

} // namespace quicsock::log
