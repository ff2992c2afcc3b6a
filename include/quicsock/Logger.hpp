/**
 * @file Logger.hpp
 * @brief Library-wide diagnostic logger for quicsock, built on spdlog.
 */

#pragma once

#include <spdlog/spdlog.h>

namespace quicsock::log
{

/**
 * @brief The `"quicsock"` logger, created on first use with a colored stderr sink.
 *
 * If the application already registered a logger named `"quicsock"` with spdlog, that logger
 * is used instead, so output can be redirected by registering one before the first socket is
 * created.
 */
spdlog::logger& logger();

/**
 * @brief Adjust the verbosity of the `"quicsock"` logger.
 */
void setLevel(spdlog::level::level_enum level);

} // namespace quicsock::log

/**
 * @brief Log through the quicsock logger if @p LEVEL is enabled.
 *
 * The level is compared before the arguments are formatted, so expensive arguments cost nothing
 * when the level is filtered out.
 *
 * @code
 * QUICSOCK_LOG(warn, "fd {}: offload disabled ({})", fd, SocketErrorMessage(err));
 * @endcode
 */
#define QUICSOCK_LOG(LEVEL, ...)                                                                                   \
    do                                                                                                             \
    {                                                                                                              \
        auto& quicsockLogger_ = ::quicsock::log::logger();                                                         \
        if (quicsockLogger_.should_log(::spdlog::level::LEVEL))                                                    \
            quicsockLogger_.log(::spdlog::level::LEVEL, __VA_ARGS__);                                              \
    } while (0)
