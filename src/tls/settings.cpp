#include <pintrust/tls/settings.hpp>
#include <pintrust/crypto/exception.hpp>

namespace pintrust::tls
{

static inline const SSL_METHOD* GetMethod(Side side)
{
    switch (side)
    {
    case Side::Client:
        return TLS_client_method();
    case Side::Server:
        return TLS_server_method();
    default:
        break;
    }
    return nullptr;
}

Settings::Settings(Side side)
    : ctx_(SSL_CTX_new(GetMethod(side)))
{
    crypto::ThrowIfFalse(ctx_ != nullptr);
}

Settings::~Settings() noexcept
{
}

void Settings::setVerifyCallback(VerifyMode mode, VerifyCallback callback) noexcept
{
    SSL_CTX_set_verify(ctx_, static_cast<int>(mode), callback);
}

void Settings::usePrivateKey(Key* privateKey)
{
    crypto::ThrowIfFalse(0 < SSL_CTX_use_PrivateKey(ctx_, privateKey));
}

void Settings::useCertificate(X509Cert* certificate)
{
    crypto::ThrowIfFalse(0 < SSL_CTX_use_certificate(ctx_, certificate));
}

Connection Settings::createConnection() const
{
    return Connection(SSL_new(ctx_));
}

} // namespace pintrust::tls
