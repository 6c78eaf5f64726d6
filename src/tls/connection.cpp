#include <string>

#include <pintrust/crypto/exception.hpp>
#include <pintrust/tls/connection.hpp>

namespace pintrust::tls
{

Connection::Connection(SSL* ssl)
    : ssl_(ssl)
{
    crypto::ThrowIfTrue(ssl_ == nullptr, "Unable to create TLS connection");
}

Connection::~Connection() noexcept
{
}

Connection::Connection(Connection&& other) noexcept
    : ssl_(std::move(other.ssl_))
{
}

Connection& Connection::operator=(Connection&& other) noexcept
{
    if (this != &other)
    {
        ssl_ = std::move(other.ssl_);
    }
    return *this;
}

int Connection::getError(int ret) const noexcept
{
    return SSL_get_error(ssl_, ret);
}

void Connection::setSocket(int fd)
{
    crypto::ThrowIfFalse(0 < SSL_set_fd(ssl_, fd));
}

void Connection::setExtHostName(std::string_view hostname)
{
    const std::string name(hostname);
    crypto::ThrowIfFalse(0 < SSL_set_tlsext_host_name(ssl_, name.c_str()));
}

std::string_view Connection::getExtHostName() const noexcept
{
    const char* name = SSL_get_servername(ssl_, TLSEXT_NAMETYPE_host_name);
    return name ? std::string_view(name) : std::string_view();
}

int Connection::doHandshake() noexcept
{
    return SSL_do_handshake(ssl_);
}

crypto::X509CertPtr Connection::getPeerCertificate() const
{
#if (OPENSSL_VERSION_NUMBER >= 0x30000000L)
    return crypto::X509CertPtr{SSL_get1_peer_certificate(ssl_)};
#else
    return crypto::X509CertPtr{SSL_get_peer_certificate(ssl_)};
#endif
}

} // namespace pintrust::tls
