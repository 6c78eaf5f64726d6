#include <chrono>
#include <string>
#include <thread>

#include <csignal>

#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <gtest/gtest.h>

#include <pintrust/crypto/cert.hpp>
#include <pintrust/exception.hpp>
#include <pintrust/tls/leaf_cert_fetcher.hpp>
#include <pintrust/tls/settings.hpp>

#include "../common/test_certificate.hpp"

using namespace pintrust;
using namespace pintrust::tls;
using namespace std::chrono_literals;

namespace
{

// Listening TCP socket on 127.0.0.1 with a kernel chosen port.
class Listener final
{
public:
    Listener()
        : fd_(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0))
        , port_(0)
    {
        // Writes to a peer that has already gone must not kill the test
        std::signal(SIGPIPE, SIG_IGN);

        if (fd_ < 0)
        {
            throw std::runtime_error("socket failed");
        }

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;

        socklen_t length = sizeof(addr);
        if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 ||
            ::listen(fd_, 4) < 0 ||
            ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &length) < 0)
        {
            ::close(fd_);
            throw std::runtime_error("unable to listen");
        }
        port_ = ntohs(addr.sin_port);
    }

    ~Listener()
    {
        close();
    }

    void close()
    {
        if (fd_ >= 0)
        {
            ::close(fd_);
            fd_ = -1;
        }
    }

    // Returns the accepted descriptor or -1 when nobody connects in time.
    int accept(std::chrono::milliseconds timeout)
    {
        pollfd pfd{};
        pfd.fd = fd_;
        pfd.events = POLLIN;
        if (::poll(&pfd, 1, static_cast<int>(timeout.count())) <= 0)
        {
            return -1;
        }
        return ::accept4(fd_, nullptr, nullptr, SOCK_CLOEXEC);
    }

    std::uint16_t port() const
    {
        return port_;
    }

private:
    int fd_;
    std::uint16_t port_;
};

// Serves a single TLS handshake with a self-signed certificate.
class TlsServer final
{
public:
    explicit TlsServer(const std::string& commonName)
    {
        key_ = test::GenerateRsaKey();
        cert_ = test::GenerateSelfSignedCert(key_, commonName);

        settings_.useCertificate(cert_);
        settings_.usePrivateKey(key_);

        thread_ = std::thread([this]() { serve(); });
    }

    ~TlsServer()
    {
        if (thread_.joinable())
        {
            thread_.join();
        }
    }

    void wait()
    {
        if (thread_.joinable())
        {
            thread_.join();
        }
    }

    std::uint16_t port() const
    {
        return listener_.port();
    }

    X509Cert* cert() const
    {
        return cert_;
    }

    const std::string& serverName() const
    {
        return serverName_;
    }

private:
    void serve()
    {
        int fd = listener_.accept(5s);
        if (fd < 0)
        {
            return;
        }

        try
        {
            auto conn = settings_.createConnection();
            conn.setSocket(fd);
            conn.doHandshake();
            serverName_ = std::string(conn.getExtHostName());
        }
        catch (const std::exception& e)
        {
            ADD_FAILURE() << e.what();
        }
        ::close(fd);
    }

    Listener listener_;
    crypto::KeyPtr key_;
    crypto::X509CertPtr cert_;
    ServerSettings settings_;
    std::thread thread_;
    std::string serverName_;
};

Error FetchError(const std::string& host, std::uint16_t port, std::chrono::seconds timeout)
{
    try
    {
        FetchLeafCertificate(host, port, timeout);
    }
    catch (const Exception& e)
    {
        return static_cast<Error>(e.code().value());
    }
    return Error::No;
}

} // namespace

TEST(LeafCertFetcherTest, FetchSelfSigned)
{
    TlsServer server("untrusted.example");

    std::string pem;
    ASSERT_NO_THROW(pem = FetchLeafCertificate("127.0.0.1", server.port(), 5s));
    server.wait();

    ASSERT_TRUE(server.serverName().empty());

    ASSERT_EQ(pem.rfind("-----BEGIN CERTIFICATE-----\n", 0), 0U);
    ASSERT_EQ(pem, crypto::Cert::toPem(server.cert()));
    ASSERT_TRUE(crypto::Cert::isEqual(crypto::Cert::fromPem(pem), server.cert()));
}

TEST(LeafCertFetcherTest, SendsServerName)
{
    TlsServer server("other-name.example");

    std::string pem;
    ASSERT_NO_THROW(pem = FetchLeafCertificate("localhost", server.port(), 5s));
    server.wait();

    ASSERT_EQ(server.serverName(), "localhost");
    ASSERT_EQ(pem, crypto::Cert::toPem(server.cert()));
}

TEST(LeafCertFetcherTest, ConnectionRefused)
{
    std::uint16_t port{0};
    {
        Listener listener;
        port = listener.port();
    }
    ASSERT_EQ(FetchError("127.0.0.1", port, 2s), Error::NetworkError);
}

TEST(LeafCertFetcherTest, UnknownHost)
{
    ASSERT_EQ(FetchError("no-such-host.invalid", 443, 2s), Error::NetworkError);
}

TEST(LeafCertFetcherTest, SilentPeerTimesOut)
{
    // Connection is queued by the kernel but never served
    Listener listener;

    auto start = std::chrono::steady_clock::now();
    ASSERT_EQ(FetchError("127.0.0.1", listener.port(), 1s), Error::NetworkError);
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_GE(elapsed, 900ms);
    ASSERT_LT(elapsed, 5s);
}

TEST(LeafCertFetcherTest, NonTlsPeer)
{
    Listener listener;
    std::thread peer([&listener]() {
        int fd = listener.accept(5s);
        if (fd < 0)
        {
            return;
        }
        char buffer[512];
        [[maybe_unused]] auto received = ::recv(fd, buffer, sizeof(buffer), 0);
        const std::string reply = "HTTP/1.1 400 Bad Request\r\nContent-Length: 0\r\n\r\n";
        [[maybe_unused]] auto sent = ::send(fd, reply.data(), reply.size(), MSG_NOSIGNAL);
        ::close(fd);
    });

    auto error = FetchError("127.0.0.1", listener.port(), 5s);
    peer.join();

    ASSERT_EQ(error, Error::TlsHandshakeError);
}

TEST(LeafCertFetcherTest, PeerClosesImmediately)
{
    Listener listener;
    std::thread peer([&listener]() {
        int fd = listener.accept(5s);
        if (fd >= 0)
        {
            ::close(fd);
        }
    });

    auto error = FetchError("127.0.0.1", listener.port(), 5s);
    peer.join();

    ASSERT_EQ(error, Error::TlsHandshakeError);
}
