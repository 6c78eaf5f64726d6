#pragma once
#include <cstdint>
#include <list>
#include <string>
#include <pintrust/socket/endpoint.hpp>

namespace pintrust::socket
{

/// @brief Resolves a host name or address literal into TCP endpoints.
class Resolver
{
public:
    using Container = std::list<Endpoint>;
    using ConstIterator = Container::const_iterator;

    Resolver() = default;
    ~Resolver() = default;

    /// @brief Looks up @p host for both address families.
    ///
    /// @throw casket::RuntimeError when the name cannot be resolved.
    ConstIterator resolve(const std::string& host, std::uint16_t port);

    ConstIterator begin() const;

    ConstIterator end() const;

private:
    Container hosts_;
};

} // namespace pintrust::socket
