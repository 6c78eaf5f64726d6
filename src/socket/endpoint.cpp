#include <algorithm>
#include <cstring>
#include <pintrust/socket/endpoint.hpp>

namespace pintrust::socket
{

Endpoint::Endpoint() noexcept
    : data_{}
{
    data_.v4.sin_family = AF_INET;
    data_.v4.sin_port = 0;
    data_.v4.sin_addr.s_addr = INADDR_ANY;
}

Endpoint::Endpoint(const SocketAddrType* addr, SocketLengthType length) noexcept
    : data_{}
{
    std::memcpy(&data_, addr, std::min<std::size_t>(length, sizeof(data_)));
}

int Endpoint::family() const noexcept
{
    return data_.base.sa_family;
}

const SocketAddrType* Endpoint::data() const noexcept
{
    return &data_.base;
}

SocketLengthType Endpoint::size() const noexcept
{
    if (isIPv4())
        return sizeof(SockAddrIn4Type);
    else
        return sizeof(SockAddrIn6Type);
}

std::uint16_t Endpoint::port() const noexcept
{
    if (isIPv4())
    {
        return ntohs(data_.v4.sin_port);
    }
    else
    {
        return ntohs(data_.v6.sin6_port);
    }
}

void Endpoint::port(std::uint16_t port) noexcept
{
    if (isIPv4())
    {
        data_.v4.sin_port = htons(port);
    }
    else
    {
        data_.v6.sin6_port = htons(port);
    }
}

bool Endpoint::isIPv4() const noexcept
{
    return data_.base.sa_family == AF_INET;
}

std::string Endpoint::toString() const
{
    char buffer[INET6_ADDRSTRLEN]{};
    if (isIPv4())
    {
        ::inet_ntop(AF_INET, &data_.v4.sin_addr, buffer, sizeof(buffer));
        return std::string(buffer) + ":" + std::to_string(port());
    }

    ::inet_ntop(AF_INET6, &data_.v6.sin6_addr, buffer, sizeof(buffer));
    return "[" + std::string(buffer) + "]:" + std::to_string(port());
}

} // namespace pintrust::socket
