/// @file
/// @brief Entries of the trust store.

#pragma once
#include <string>
#include <variant>

namespace pintrust::trust
{

/// @brief Certificate that is the only one accepted for a URL.
struct Pinned
{
    std::string pem;

    bool operator==(const Pinned& other) const
    {
        return pem == other.pem;
    }
};

/// @brief URL is accessed without establishing any trust.
struct TrustDisabled
{
    bool operator==(const TrustDisabled&) const
    {
        return true;
    }
};

using TrustEntry = std::variant<Pinned, TrustDisabled>;

} // namespace pintrust::trust
