#include <cstdint>
#include <system_error>

#include <fcntl.h>
#include <sys/socket.h>
#include <unistd.h>

#include <pintrust/socket/socket_ops.hpp>
#include <casket/utils/error_code.hpp>

using namespace casket;

namespace pintrust::socket
{

SocketType CreateSocket(int domain, int socktype, int protocol, std::error_code& ec)
{
    SocketType sock = ::socket(domain, socktype | SOCK_CLOEXEC, protocol);
    if (sock == InvalidSocket)
    {
        ec = GetLastSystemError();
    }

    return sock;
}

void CloseSocket(SocketType sock)
{
    if (sock != InvalidSocket)
    {
        ::close(sock);
    }
}

void Connect(SocketType sock, const SocketAddrType* addr, SocketLengthType addrlen, std::error_code& ec)
{
    if (sock == InvalidSocket)
    {
        ec = std::make_error_code(std::errc::invalid_argument);
        return;
    }

    int ret = ::connect(sock, addr, addrlen);
    if (ret < 0)
    {
        ec = GetLastSystemError();
    }
}

int GetSocketOption(SocketType s, int level, int optname, void* optval, std::size_t* optlen,
                    std::error_code& ec)
{
    if (optlen == nullptr)
    {
        ec = std::make_error_code(std::errc::invalid_argument);
        return -1;
    }

    SocketLengthType tmpOptlen = static_cast<SocketLengthType>(*optlen);
    int ret = ::getsockopt(s, level, optname, optval, &tmpOptlen);
    if (ret < 0)
    {
        ec = GetLastSystemError();
    }
    *optlen = static_cast<std::size_t>(tmpOptlen);
    return ret;
}

std::error_code GetSocketError(SocketType s)
{
    std::error_code ec;
    int sockError{};
    std::size_t sockErrorLen = sizeof(sockError);

    int ret = GetSocketOption(s, SOL_SOCKET, SO_ERROR, &sockError, &sockErrorLen, ec);
    if (ret < 0)
    {
        return ec;
    }
    return std::error_code(sockError, std::system_category());
}

void SetNonBlocking(SocketType s, bool value, std::error_code& ec)
{
    if (s == InvalidSocket)
    {
        ec = std::make_error_code(std::errc::invalid_argument);
        return;
    }

    int ret = ::fcntl(s, F_GETFL, 0);
    if (ret < 0)
    {
        ec = GetLastSystemError();
    }
    else
    {
        int flag = (value ? (ret | O_NONBLOCK) : (ret & ~O_NONBLOCK));
        ret = ::fcntl(s, F_SETFL, flag);
        if (ret < 0)
        {
            ec = GetLastSystemError();
        }
    }
}

} // namespace pintrust::socket
