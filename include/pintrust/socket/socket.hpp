#pragma once
#include <pintrust/socket/types.hpp>
#include <pintrust/socket/socket_ops.hpp>
#include <pintrust/socket/endpoint.hpp>
#include <casket/utils/exception.hpp>
#include <casket/utils/noncopyable.hpp>

namespace pintrust::socket
{

/// @brief Owns a socket descriptor and closes it on destruction.
class Socket final : public casket::NonCopyable
{
public:
    Socket()
        : sock_(InvalidSocket)
    {
    }

    ~Socket() noexcept
    {
        close();
    }

    template <typename Protocol> void open(const Protocol& protocol)
    {
        close();

        std::error_code ec;
        sock_ = CreateSocket(protocol, ec);
        casket::ThrowIfError(ec);
    }

    void close() noexcept
    {
        if (sock_ != InvalidSocket)
        {
            CloseSocket(sock_);
            sock_ = InvalidSocket;
        }
    }

    void setNonBlocking(bool value)
    {
        std::error_code ec;
        SetNonBlocking(sock_, value, ec);
        casket::ThrowIfError(ec);
    }

    void connect(const Endpoint& peer, std::error_code& ec) noexcept
    {
        Connect(sock_, peer.data(), peer.size(), ec);
    }

    SocketType get() const noexcept
    {
        return sock_;
    }

private:
    SocketType sock_;
};

} // namespace pintrust::socket
