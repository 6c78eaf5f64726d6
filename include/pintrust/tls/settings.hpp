/// @file
/// @brief Declaration of the TLS settings classes.

#pragma once
#include <casket/utils/noncopyable.hpp>
#include <pintrust/crypto/typedefs.hpp>
#include <pintrust/tls/types.hpp>
#include <pintrust/tls/connection.hpp>

namespace pintrust::tls
{

/// @brief Class for managing TLS settings.
class Settings : public casket::NonCopyable
{
public:
    /// @brief Constructor with side.
    /// @param side The side (client or server).
    explicit Settings(Side side);

    /// @brief Destructor.
    virtual ~Settings() noexcept;

    /// @brief Gets the side (client or server).
    /// @return The side.
    virtual Side side() const = 0;

    /// @brief Sets the verify callback.
    /// @param mode The verify mode.
    /// @param callback The verify callback.
    void setVerifyCallback(VerifyMode mode, VerifyCallback callback) noexcept;

    /// @brief Sets the private key matching the certificate.
    /// @param privateKey The private key.
    void usePrivateKey(Key* privateKey);

    /// @brief Sets the certificate presented to the peer.
    /// @param certificate The certificate.
    void useCertificate(X509Cert* certificate);

    /// @brief Creates a new connection sharing these settings.
    Connection createConnection() const;

private:
    SslCtxPtr ctx_;
};

/// @brief Class for managing client TLS settings.
class ClientSettings final : public Settings
{
public:
    ClientSettings()
        : Settings(Side::Client)
    {
    }

    ~ClientSettings() = default;

    Side side() const override
    {
        return Side::Client;
    }
};

/// @brief Class for managing server TLS settings.
class ServerSettings final : public Settings
{
public:
    ServerSettings()
        : Settings(Side::Server)
    {
    }

    ~ServerSettings() = default;

    Side side() const override
    {
        return Side::Server;
    }
};

} // namespace pintrust::tls
