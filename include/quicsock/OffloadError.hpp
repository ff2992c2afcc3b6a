/**
 * @file OffloadError.hpp
 * @brief Classification of send failures caused by rejected segmentation offload.
 */

#pragma once

#include "SocketException.hpp"

#include <exception>

namespace quicsock
{

/**
 * @brief Whether an errno value means the kernel, driver or path rejected segmentation offload.
 * @ingroup udp
 *
 * Only `EIO` qualifies: the kernel returns it from the UDP transmit path when the device cannot
 * checksum a segmented super-packet, which UDP_SEGMENT requires. Everything else, including
 * `EPERM`, `EMSGSIZE` and ordinary transmission errors, is not an offload rejection.
 *
 * @param errorCode errno value; 0 means "no error".
 */
[[nodiscard]] bool isOffloadUnsupported(int errorCode) noexcept;

/**
 * @brief Classify a SocketException by its error code.
 * @ingroup udp
 */
[[nodiscard]] bool isOffloadUnsupported(const SocketException& error) noexcept;

/**
 * @brief Classify an arbitrary captured exception.
 * @ingroup udp
 *
 * Returns `false` for a null pointer, for exceptions that are not SocketException, and for
 * SocketException instances whose code is not the offload-rejection code. Exceptions that do not
 * derive from `std::exception` propagate.
 */
[[nodiscard]] bool isOffloadUnsupported(const std::exception_ptr& error);

} // namespace quicsock
