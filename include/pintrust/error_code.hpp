/// @file
/// @brief Error codes reported by trust store operations.

#pragma once
#include <system_error>

namespace pintrust
{

enum class Error
{
    No = 0,
    SchemeNotSecure,   ///< URL doesn't use https, nothing to pin (informational).
    UrlParseError,     ///< URL has no usable host or port.
    NetworkError,      ///< Name resolution, connection or timeout failure.
    TlsHandshakeError, ///< TLS handshake failed or no peer certificate.
    UserDeclined,      ///< Confirmation answer was not "y".
    StoreReadError,    ///< Trust file is unreadable or malformed.
    StoreWriteError,   ///< Trust file couldn't be written.
};

std::error_code MakeErrorCode(Error e);

} // namespace pintrust
