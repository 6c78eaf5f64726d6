#pragma once
#include <pintrust/socket/types.hpp>

namespace pintrust::socket
{

class Tcp
{
public:
    /// Construct to represent the IPv4 TCP protocol.
    static Tcp v4() noexcept
    {
        return Tcp(AF_INET);
    }

    /// Construct to represent the IPv6 TCP protocol.
    static Tcp v6() noexcept
    {
        return Tcp(AF_INET6);
    }

    /// Obtain an identifier for the type of the protocol.
    int type() const noexcept
    {
        return SOCK_STREAM;
    }

    /// Obtain an identifier for the protocol.
    int protocol() const noexcept
    {
        return IPPROTO_TCP;
    }

    /// Obtain an identifier for the protocol family.
    int family() const noexcept
    {
        return family_;
    }

private:
    explicit Tcp(int protocol_family) noexcept
        : family_(protocol_family)
    {
    }

    int family_;
};

} // namespace pintrust::socket
