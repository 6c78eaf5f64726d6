#include <cerrno>
#include <climits>
#include <poll.h>

#include <casket/utils/error_code.hpp>
#include <pintrust/socket/select.hpp>

namespace pintrust::socket
{

void WaitSocket(SocketType socket, bool read, std::chrono::milliseconds timeout, std::error_code& ec)
{
    if (socket == InvalidSocket)
    {
        ec = std::make_error_code(std::errc::invalid_argument);
        return;
    }

    struct pollfd pfd{};
    pfd.fd = socket;
    pfd.events = read ? POLLIN : POLLOUT;

    // poll() takes an int, a negative value would wait forever
    int waitMs{0};
    if (timeout.count() > INT_MAX)
    {
        waitMs = INT_MAX;
    }
    else if (timeout.count() > 0)
    {
        waitMs = static_cast<int>(timeout.count());
    }

    int ret{0};
    do
    {
        ret = ::poll(&pfd, 1, waitMs);
    } while (ret < 0 && errno == EINTR);

    if (ret == 0)
    {
        ec = std::make_error_code(std::errc::timed_out);
    }
    else if (ret < 0)
    {
        ec = casket::GetLastSystemError();
    }
}

} // namespace pintrust::socket
