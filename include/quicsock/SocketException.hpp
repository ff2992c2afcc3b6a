/**
 * @file SocketException.hpp
 * @brief Base exception class for socket-related errors in quicsock.
 */

#pragma once

#include <exception>
#include <sstream>
#include <stdexcept>
#include <string>

namespace quicsock
{

/**
 * @class SocketException
 * @ingroup exceptions
 * @brief Represents socket-related errors in the quicsock library.
 *
 * SocketException is thrown whenever a socket operation fails (bind, sendmsg, recvmmsg,
 * setsockopt, ...). It carries the `errno` value reported by the kernel, or 0 for
 * library-level failures, together with a message naming the failed operation and the
 * socket descriptor it was issued on.
 *
 * Failures that are not covered by a more specific subclass are ordinary transient I/O
 * errors: the caller owns the retry policy.
 *
 * | Subclass                    | Meaning                                                     |
 * |-----------------------------|-------------------------------------------------------------|
 * | SocketTimeoutException      | Deadline expired or the call would block; retryable.        |
 * | SocketPermissionException   | Privileged override rejected, or send not permitted.        |
 * | SocketArgumentException     | Caller precondition violated; never retried or corrected.   |
 *
 * Exception chaining is supported through an optional `std::exception_ptr`.
 *
 * ### Example
 * @code
 * try {
 *     socket.sendBatch(peer, payloads);
 * } catch (const quicsock::SocketTimeoutException&) {
 *     // back off and try again later
 * } catch (const quicsock::SocketException& ex) {
 *     std::cerr << "send failed (" << ex.getErrorCode() << "): " << ex.what() << '\n';
 * }
 * @endcode
 */
class SocketException : public std::runtime_error
{
  public:
    /**
     * @brief Constructs a SocketException with a message and no associated error code.
     * @param message A human-readable description of the error context.
     */
    explicit SocketException(const std::string& message = "SocketException")
        : std::runtime_error(message), _errorCode(0)
    {
    }

    /**
     * @brief Constructs a SocketException with an OS error code and a message.
     *
     * The final message has the form `"message (error code 5)"`.
     *
     * @param code    `errno` value reported by the failed call.
     * @param message Descriptive error message describing the failure context.
     */
    explicit SocketException(int code, const std::string& message = "SocketException")
        : std::runtime_error(buildErrorMessage(message, code)), _errorCode(code)
    {
    }

    /**
     * @brief Constructs a SocketException with a message and a nested exception.
     *
     * @param message Descriptive message for the higher-level socket failure.
     * @param nested  Exception pointer representing the original cause.
     */
    SocketException(const std::string& message, std::exception_ptr nested)
        : std::runtime_error(message), _errorCode(0), _nested(std::move(nested))
    {
    }

    /**
     * @brief The OS error code associated with this exception, or 0 for library-level errors.
     */
    [[nodiscard]] int getErrorCode() const noexcept { return _errorCode; }

    /**
     * @brief The nested exception captured at construction time, if any.
     *
     * Rethrow with `std::rethrow_if_nested(getNestedException())`.
     */
    [[nodiscard]] std::exception_ptr getNestedException() const noexcept { return _nested; }

    ~SocketException() override = default;

  private:
    int _errorCode;             ///< errno value, or 0.
    std::exception_ptr _nested; ///< Captured nested exception for chaining, if any.

    static std::string buildErrorMessage(const std::string& msg, const int code)
    {
        std::ostringstream oss;
        oss << msg << " (error code " << code << ")";
        return oss.str();
    }
};

} // namespace quicsock
