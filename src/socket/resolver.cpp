#include <cstring>
#include <string>

#include <netdb.h>
#include <sys/types.h>

#include <pintrust/socket/resolver.hpp>
#include <casket/utils/exception.hpp>
#include <casket/utils/format.hpp>

using namespace casket;

namespace pintrust::socket
{

Resolver::ConstIterator Resolver::resolve(const std::string& host, std::uint16_t port)
{
    hosts_.clear();

    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    struct addrinfo* result = nullptr;
    int error = ::getaddrinfo(host.c_str(), nullptr, &hints, &result);
    if (error != 0)
    {
        throw RuntimeError("unable to resolve '{}': {}", host, ::gai_strerror(error));
    }

    for (auto ptr = result; ptr != nullptr; ptr = ptr->ai_next)
    {
        if (ptr->ai_family != AF_INET && ptr->ai_family != AF_INET6)
        {
            continue;
        }
        Endpoint ep(ptr->ai_addr, ptr->ai_addrlen);
        ep.port(port);
        hosts_.emplace_back(ep);
    }
    ::freeaddrinfo(result);

    ThrowIfTrue(hosts_.empty(), format("no usable address for '{}'", host));
    return hosts_.begin();
}

Resolver::ConstIterator Resolver::begin() const
{
    return hosts_.begin();
}

Resolver::ConstIterator Resolver::end() const
{
    return hosts_.end();
}

} // namespace pintrust::socket
