#include <algorithm>
#include <cctype>

#include <casket/utils/to_number.hpp>

#include <pintrust/exception.hpp>
#include <pintrust/trust/url.hpp>

namespace pintrust::trust
{

static constexpr std::string_view kSchemeDelimiter{"://"};

static std::string ToLower(std::string_view str)
{
    std::string result(str);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return result;
}

static bool IsDecimal(std::string_view str)
{
    return std::all_of(str.begin(), str.end(),
                       [](unsigned char ch) { return std::isdigit(ch) != 0; });
}

Url Url::parse(std::string_view text)
{
    const std::string quoted = "'" + std::string(text) + "'";

    auto delimiter = text.find(kSchemeDelimiter);
    ThrowIfTrue(delimiter == std::string_view::npos || delimiter == 0, Error::UrlParseError,
                "no scheme in URL " + quoted);

    Url url;
    url.scheme_ = ToLower(text.substr(0, delimiter));

    auto authority = text.substr(delimiter + kSchemeDelimiter.size());
    authority = authority.substr(0, authority.find_first_of("/?#"));

    auto userInfo = authority.rfind('@');
    if (userInfo != std::string_view::npos)
    {
        authority = authority.substr(userInfo + 1);
    }

    std::string_view host;
    std::string_view port;

    if (!authority.empty() && authority.front() == '[')
    {
        auto closing = authority.find(']');
        ThrowIfTrue(closing == std::string_view::npos, Error::UrlParseError,
                    "unterminated IPv6 address in URL " + quoted);
        host = authority.substr(1, closing - 1);

        auto rest = authority.substr(closing + 1);
        if (!rest.empty())
        {
            ThrowIfTrue(rest.front() != ':', Error::UrlParseError,
                        "unexpected characters after host in URL " + quoted);
            port = rest.substr(1);
        }
    }
    else
    {
        auto colon = authority.find(':');
        host = authority.substr(0, colon);
        if (colon != std::string_view::npos)
        {
            port = authority.substr(colon + 1);
        }
    }

    ThrowIfTrue(host.empty(), Error::UrlParseError, "no host in URL " + quoted);
    url.host_ = ToLower(host);

    if (!port.empty())
    {
        std::uint16_t value{0};
        std::error_code ec;
        if (IsDecimal(port))
        {
            casket::to_number(port, value, ec);
        }
        else
        {
            ec = std::make_error_code(std::errc::invalid_argument);
        }
        ThrowIfTrue(static_cast<bool>(ec), Error::UrlParseError,
                    "invalid port '" + std::string(port) + "' in URL " + quoted);
        url.port_ = value;
    }

    return url;
}

} // namespace pintrust::trust
