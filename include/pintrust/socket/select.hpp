#pragma once
#include <chrono>
#include <system_error>
#include <pintrust/socket/types.hpp>

namespace pintrust::socket
{

/// @brief Waits until @p socket is readable (@p read) or writable.
///
/// Sets `timed_out` in @p ec when nothing happened within @p timeout.
void WaitSocket(SocketType socket, bool read, std::chrono::milliseconds timeout, std::error_code& ec);

} // namespace pintrust::socket
