/// @file
/// @brief Declaration of the TLS connection class.

#pragma once
#include <string_view>
#include <pintrust/tls/types.hpp>
#include <pintrust/crypto/pointers.hpp>

namespace pintrust::tls
{

/// @brief Class representing a TLS connection.
class Connection
{
public:
    friend class Settings;

    /// @brief Destructor.
    virtual ~Connection() noexcept;

    Connection(Connection&& other) noexcept;
    Connection& operator=(Connection&& other) noexcept;

    int getError(int ret) const noexcept;

    /// @brief Sets the socket file descriptor.
    /// @param fd The socket file descriptor.
    void setSocket(int fd);

    /// @brief Sets the SNI host name.
    /// @param hostname The external host name.
    void setExtHostName(std::string_view hostname);

    /// @brief Gets the SNI host name sent by the client.
    /// @return Host name, or empty string if none was sent.
    std::string_view getExtHostName() const noexcept;

    /// @brief Performs the handshake operation.
    /// @return The result of the handshake operation.
    int doHandshake() noexcept;

    /// @brief Gets the certificate presented by the peer.
    /// @return Leaf certificate, or null when the peer sent none.
    crypto::X509CertPtr getPeerCertificate() const;

protected:
    explicit Connection(SSL* ssl);

protected:
    SslPtr ssl_;
};

} // namespace pintrust::tls
