#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace pintrust::trust
{

/// @brief Parts of a URL needed to reach its host.
///
/// Accepted form is `scheme://[userinfo@]host[:port][/path][?query][#fragment]`.
/// IPv6 addresses are written in brackets. Scheme and host are stored lower-cased,
/// the host without brackets.
class Url final
{
public:
    /// @throw pintrust::Exception with Error::UrlParseError.
    static Url parse(std::string_view text);

    const std::string& scheme() const noexcept
    {
        return scheme_;
    }

    const std::string& host() const noexcept
    {
        return host_;
    }

    std::optional<std::uint16_t> port() const noexcept
    {
        return port_;
    }

    std::uint16_t portOr(std::uint16_t defaultPort) const noexcept
    {
        return port_.value_or(defaultPort);
    }

private:
    Url() = default;

    std::string scheme_;
    std::string host_;
    std::optional<std::uint16_t> port_;
};

} // namespace pintrust::trust
