#include <pintrust/error_code.hpp>
#include <pintrust/error_category.hpp>

namespace pintrust
{

const char* ErrorCategory::name() const noexcept
{
    return "pintrust";
}

std::string ErrorCategory::message(int value) const
{
    switch (static_cast<Error>(value))
    {
    case Error::No:
        return "success";
    case Error::SchemeNotSecure:
        return "URL doesn't require trust";
    case Error::UrlParseError:
        return "invalid URL";
    case Error::NetworkError:
        return "network error";
    case Error::TlsHandshakeError:
        return "TLS handshake error";
    case Error::UserDeclined:
        return "declined by user";
    case Error::StoreReadError:
        return "unable to read trust store";
    case Error::StoreWriteError:
        return "unable to write trust store";
    default:
        break;
    }
    return "unknown error";
}

} // namespace pintrust
