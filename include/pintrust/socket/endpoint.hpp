#pragma once
#include <cstdint>
#include <string>
#include <pintrust/socket/types.hpp>

namespace pintrust::socket
{

// IPv4 or IPv6 address with a port, stored in the native socket address form.
class Endpoint
{
public:
    Endpoint() noexcept;

    // Copy the native address pointed by @p addr.
    Endpoint(const SocketAddrType* addr, SocketLengthType length) noexcept;

    int family() const noexcept;

    const SocketAddrType* data() const noexcept;

    SocketLengthType size() const noexcept;

    std::uint16_t port() const noexcept;

    void port(std::uint16_t port) noexcept;

    bool isIPv4() const noexcept;

    // "1.2.3.4:443" or "[::1]:443".
    std::string toString() const;

private:
    union data_union
    {
        SocketAddrType base;
        SockAddrIn4Type v4;
        SockAddrIn6Type v6;
    } data_;
};

} // namespace pintrust::socket
