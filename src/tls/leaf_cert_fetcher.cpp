#include <arpa/inet.h>
#include <netinet/in.h>
#include <openssl/err.h>

#include <casket/utils/format.hpp>

#include <pintrust/crypto/cert.hpp>
#include <pintrust/crypto/error_code.hpp>
#include <pintrust/exception.hpp>
#include <pintrust/socket/resolver.hpp>
#include <pintrust/socket/select.hpp>
#include <pintrust/socket/socket.hpp>
#include <pintrust/socket/tcp.hpp>
#include <pintrust/tls/leaf_cert_fetcher.hpp>
#include <pintrust/tls/settings.hpp>

using namespace std::chrono;
using namespace pintrust::socket;

namespace pintrust::tls
{

namespace
{

bool IsAddressLiteral(const std::string& hostname)
{
    in6_addr buffer{};
    return ::inet_pton(AF_INET, hostname.c_str(), &buffer) == 1 ||
           ::inet_pton(AF_INET6, hostname.c_str(), &buffer) == 1;
}

std::error_code ConnectWithTimeout(Socket& socket, const Endpoint& peer, milliseconds timeout)
{
    std::error_code ec;

    try
    {
        socket.open(peer.isIPv4() ? Tcp::v4() : Tcp::v6());
        socket.setNonBlocking(true);
    }
    catch (const std::system_error& e)
    {
        return e.code();
    }

    socket.connect(peer, ec);
    if (ec == std::errc::operation_in_progress)
    {
        ec.clear();
        WaitSocket(socket.get(), false, timeout, ec);
        if (!ec)
        {
            ec = GetSocketError(socket.get());
        }
    }

    if (ec)
    {
        socket.close();
    }
    return ec;
}

void Handshake(Connection& conn, SocketType sock, const std::string& peer, milliseconds timeout)
{
    const auto deadline = steady_clock::now() + timeout;

    for (;;)
    {
        ERR_clear_error();

        int ret = conn.doHandshake();
        if (ret == 1)
        {
            return;
        }

        bool wantRead{false};
        switch (conn.getError(ret))
        {
        case SSL_ERROR_WANT_READ:
            wantRead = true;
            break;
        case SSL_ERROR_WANT_WRITE:
            wantRead = false;
            break;
        default:
            throw Exception(Error::TlsHandshakeError,
                            casket::format("TLS handshake with {} failed: {}", peer,
                                          crypto::GetLastError().message()));
        }

        const auto now = steady_clock::now();
        std::error_code ec;
        if (now >= deadline)
        {
            ec = std::make_error_code(std::errc::timed_out);
        }
        else
        {
            WaitSocket(sock, wantRead, duration_cast<milliseconds>(deadline - now), ec);
        }

        if (ec)
        {
            throw Exception(Error::NetworkError,
                            casket::format("TLS handshake with {} failed: {}", peer, ec.message()));
        }
    }
}

} // namespace

std::string FetchLeafCertificate(const std::string& hostname, std::uint16_t port, seconds timeout)
{
    const std::string peer = casket::format("{}:{}", hostname, port);

    Resolver resolver;
    try
    {
        resolver.resolve(hostname, port);
    }
    catch (const std::exception& e)
    {
        throw Exception(Error::NetworkError, e.what());
    }

    Socket socket;
    std::error_code ec = std::make_error_code(std::errc::host_unreachable);
    std::string address;
    for (const auto& endpoint : resolver)
    {
        address = endpoint.toString();
        ec = ConnectWithTimeout(socket, endpoint, timeout);
        if (!ec)
        {
            break;
        }
    }
    ThrowIfTrue(static_cast<bool>(ec), Error::NetworkError,
                casket::format("unable to connect to {} ({}): {}", peer, address, ec.message()));

    ClientSettings settings;
    settings.setVerifyCallback(VerifyMode::None, nullptr);

    auto conn = settings.createConnection();
    conn.setSocket(socket.get());
    if (!IsAddressLiteral(hostname))
    {
        conn.setExtHostName(hostname);
    }

    Handshake(conn, socket.get(), peer, timeout);

    auto cert = conn.getPeerCertificate();
    ThrowIfTrue(cert == nullptr, Error::TlsHandshakeError,
                casket::format("{} did not present a certificate", peer));

    return crypto::Cert::derToPem(crypto::Cert::toBuffer(cert));
}

} // namespace pintrust::tls
