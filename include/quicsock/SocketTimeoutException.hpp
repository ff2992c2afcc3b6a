/**
 * @file SocketTimeoutException.hpp
 * @brief Exception class for socket operation timeouts in quicsock.
 */

#pragma once

#include "SocketException.hpp"
#include "common.hpp"

namespace quicsock
{

/**
 * @class SocketTimeoutException
 * @ingroup exceptions
 * @brief Thrown when a send or receive does not complete before the socket's deadline.
 *
 * On POSIX an expired `SO_RCVTIMEO`/`SO_SNDTIMEO` surfaces as `EAGAIN`/`EWOULDBLOCK`, the same code
 * a non-blocking socket reports when no data is queued. Both are retryable: nothing was lost and
 * the operation may simply be reissued.
 *
 * ### Example
 * @code
 * try {
 *     for (const auto& dgram : socket.receiveBatch(32)) { ... }
 * } catch (const SocketTimeoutException&) {
 *     // nothing arrived within the receive deadline
 * }
 * @endcode
 */
class SocketTimeoutException final : public SocketException
{
  public:
    /**
     * @brief Construct a new SocketTimeoutException.
     * @param errorCode The timeout code (default: `ETIMEDOUT`).
     * @param message Optional error message. If omitted, it is generated from the error code.
     */
    explicit SocketTimeoutException(const int errorCode = ETIMEDOUT, std::string message = "")
        : SocketException(errorCode, message.empty() ? SocketErrorMessage(errorCode) : std::move(message))
    {
    }
};

} // namespace quicsock
