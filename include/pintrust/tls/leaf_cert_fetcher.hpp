/// @file
/// @brief Trust-on-first-use retrieval of a server's leaf certificate.

#pragma once
#include <chrono>
#include <cstdint>
#include <string>

#include <pintrust/config.hpp>

namespace pintrust::tls
{

/// @brief Connects to @p hostname:@p port and returns the leaf certificate
/// the server presents, PEM encoded.
///
/// @warning The handshake is performed WITHOUT chain verification and
/// WITHOUT host name verification so that any certificate, including
/// self-signed, expired or misnamed ones, can be harvested for pinning.
/// The connection is closed right after the handshake and nothing is ever
/// sent over it. Never use this for communication that needs a validated
/// peer.
///
/// @param hostname Host name or address literal (IPv6 without brackets).
/// @param port TCP port.
/// @param timeout Bound for the connection and, separately, the handshake.
///
/// @throw pintrust::Exception with Error::NetworkError when the host can't be
/// resolved, connected to or doesn't answer within @p timeout, and with
/// Error::TlsHandshakeError when the handshake fails or no certificate is sent.
std::string FetchLeafCertificate(const std::string& hostname,
                                 std::uint16_t port = config::kDefaultHttpsPort,
                                 std::chrono::seconds timeout = config::kFetchTimeout);

/// @brief Source of server certificates used by the trust operations.
class CertificateFetcher
{
public:
    virtual ~CertificateFetcher() = default;

    /// @brief Returns the PEM leaf certificate of @p hostname:@p port.
    virtual std::string fetch(const std::string& hostname, std::uint16_t port,
                              std::chrono::seconds timeout) = 0;
};

/// @brief Fetches certificates over the network with FetchLeafCertificate.
class TlsCertificateFetcher final : public CertificateFetcher
{
public:
    std::string fetch(const std::string& hostname, std::uint16_t port,
                      std::chrono::seconds timeout) override
    {
        return FetchLeafCertificate(hostname, port, timeout);
    }
};

} // namespace pintrust::tls
