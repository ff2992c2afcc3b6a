/**
 * @file SocketPermissionException.hpp
 * @brief Exception class for operations rejected by a privilege or policy restriction.
 */

#pragma once

#include "SocketException.hpp"
#include "common.hpp"

namespace quicsock
{

/**
 * @class SocketPermissionException
 * @ingroup exceptions
 * @brief Thrown when the kernel refuses an operation for lack of privilege.
 *
 * Raised in two situations:
 * - The privileged buffer override (`SO_RCVBUFFORCE` / `SO_SNDBUFFORCE`) was rejected, typically
 *   because the process lacks `CAP_NET_ADMIN`, or the platform has no override at all.
 * - A send failed with `EPERM`/`EACCES`, e.g. a firewall rule dropping the packet.
 *
 * This is never the same thing as an offload rejection: a permission failure is surfaced to the
 * caller and not retried internally.
 */
class SocketPermissionException final : public SocketException
{
  public:
    /**
     * @param errorCode `EPERM`, `EACCES`, or another code describing the refusal.
     * @param message   Optional error message. If omitted, it is generated from the error code.
     */
    explicit SocketPermissionException(const int errorCode = EPERM, std::string message = "")
        : SocketException(errorCode, message.empty() ? SocketErrorMessage(errorCode) : std::move(message))
    {
    }
};

} // namespace quicsock
