/**
 * @file SocketArgumentException.hpp
 * @brief Exception class for caller precondition violations.
 */

#pragma once

#include "SocketException.hpp"

#include <string>

namespace quicsock
{

/**
 * @class SocketArgumentException
 * @ingroup exceptions
 * @brief Thrown when a caller violates an operation's preconditions.
 *
 * Examples: an empty or non-uniform batch, a batch over the configured limits, a non-positive
 * buffer capacity, or an operation on a closed socket. The input is never silently corrected.
 * The error code is always 0 because no syscall was issued.
 */
class SocketArgumentException final : public SocketException
{
  public:
    explicit SocketArgumentException(const std::string& message) : SocketException(message) {}
};

} // namespace quicsock
