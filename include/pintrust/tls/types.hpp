#pragma once
#include <cstdint>
#include <openssl/ssl.h>
#include <pintrust/utils/custom_unique_ptr.hpp>

namespace pintrust::tls
{

/// @brief Enum representing the side (client or server).
enum class Side : uint8_t
{
    Client = 0,
    Server
};

/// @brief Enum representing the verify mode.
enum class VerifyMode
{
    None = SSL_VERIFY_NONE,
    Peer = SSL_VERIFY_PEER,
    FailIfNoPeerCert = SSL_VERIFY_FAIL_IF_NO_PEER_CERT,
};

/// @brief Type alias for the verify callback function.
using VerifyCallback = int (*)(int, X509_STORE_CTX*);

PINTRUST_DEFINE_UNIQUE_PTR(SslPtr, SSL, SSL_free);
PINTRUST_DEFINE_UNIQUE_PTR(SslCtxPtr, SSL_CTX, SSL_CTX_free);

} // namespace pintrust::tls
