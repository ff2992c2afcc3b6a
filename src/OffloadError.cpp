// OffloadError.cpp

#include "quicsock/OffloadError.hpp"

#include <cerrno>

namespace quicsock
{

bool isOffloadUnsupported(const int errorCode) noexcept
{
    return errorCode == EIO;
}

bool isOffloadUnsupported(const SocketException& error) noexcept
{
    return isOffloadUnsupported(error.getErrorCode());
}

bool isOffloadUnsupported(const std::exception_ptr& error)
{
    if (!error)
        return false;

    try
    {
        std::rethrow_exception(error);
    }
    catch (const SocketException& e)
    {
        return isOffloadUnsupported(e);
    }
    catch (const std::exception&)
    {
        return false;
    }
}

} // namespace quicsock
