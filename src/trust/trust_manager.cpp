#include <ctime>
#include <iomanip>
#include <sstream>

#include <casket/log/log_manager.hpp>
#include <casket/utils/string.hpp>

#include <pintrust/crypto/cert.hpp>
#include <pintrust/exception.hpp>
#include <pintrust/trust/trust_manager.hpp>
#include <pintrust/trust/url.hpp>

namespace pintrust::trust
{

static constexpr std::string_view kConfirmQuestion{
    "Do you want associate(pin) this certificate to this URL as trust"
    "(enter \"y\" to confirm): "};

static std::string TimeToString(std::time_t time)
{
    std::tm tm{};
    ::gmtime_r(&time, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S UTC");
    return oss.str();
}

TrustManager::TrustManager(TrustFile& file, tls::CertificateFetcher& fetcher,
                           ConfirmationPrompt& prompt)
    : file_(file)
    , fetcher_(fetcher)
    , prompt_(prompt)
{
}

bool TrustManager::requiresTrust(const std::string& url)
{
    const auto scheme = std::string_view(url).substr(0, config::kSecureScheme.size());
    if (casket::iequals(scheme, config::kSecureScheme))
    {
        return true;
    }
    casket::info("URL \"{}\" doesn't require trust to access. Ignoring command", url);
    return false;
}

bool TrustManager::confirm(const std::string& pem)
{
    try
    {
        auto cert = crypto::Cert::fromPem(pem);
        casket::info("Subject: {}", crypto::Cert::subjectName(cert));
        casket::info("Issuer: {}", crypto::Cert::issuerName(cert));
        casket::info("Validity: {} - {}", TimeToString(crypto::Cert::notBefore(cert)),
                     TimeToString(crypto::Cert::notAfter(cert)));
        casket::info("SHA-256 fingerprint: {}", crypto::Cert::fingerprint(cert, "SHA256"));
    }
    catch (const std::exception& e)
    {
        casket::debug("Unable to decode certificate details: {}", e.what());
    }

    auto answer = prompt_.ask(kConfirmQuestion);
    while (!answer.empty() && answer.back() == '\r')
    {
        answer.pop_back();
    }
    return casket::iequals(answer, "y");
}

int TrustManager::installCert(const std::string& url, bool autoAccept,
                              std::chrono::seconds timeout)
{
    if (!requiresTrust(url))
    {
        return 0;
    }

    std::string pem;
    try
    {
        auto parsed = Url::parse(url);
        auto port = parsed.portOr(config::kDefaultHttpsPort);

        casket::debug("Fetching certificate from {}:{}", parsed.host(), port);
        pem = fetcher_.fetch(parsed.host(), port, timeout);
    }
    catch (const Exception& e)
    {
        if (e.code() == MakeErrorCode(Error::UrlParseError))
        {
            casket::warning("Couldn't parse the provided URL {}: {}", url, e.what());
        }
        else
        {
            casket::warning("Unable to obtain the certificate from {}: {}", url, e.what());
        }
        return 1;
    }
    catch (const std::exception& e)
    {
        casket::warning("Unable to obtain the certificate from {}: {}", url, e.what());
        return 1;
    }

    if (!autoAccept)
    {
        casket::info("PEM encoding of certificate behind URL \"{}\":\n{}", url, pem);
        if (!confirm(pem))
        {
            casket::info("User did not agree, stopping the operation");
            return 1;
        }
    }

    try
    {
        auto store = file_.load();
        store.pin(url, pem);
        file_.save(store);
    }
    catch (const std::exception& e)
    {
        casket::warning("Unable to read or modify trust at {}: {}", file_.path(), e.what());
        return 1;
    }

    casket::info("Pinned certificate for URL \"{}\"", url);
    return 0;
}

int TrustManager::uninstallCert(const std::string& url)
{
    try
    {
        auto store = file_.load();
        if (store.isPinned(url))
        {
            casket::info("Removing certificate pinning for URL {} trust", url);
            store.erase(url);
            file_.save(store);
        }
        else
        {
            casket::info("URL \"{}\" doesn't have a pinned trust certificate. Ignoring command",
                         url);
        }
    }
    catch (const std::exception& e)
    {
        casket::warning("Unable to read or modify trust at {}: {}", file_.path(), e.what());
        return 1;
    }
    return 0;
}

int TrustManager::disableTrust(const std::string& url)
{
    if (!requiresTrust(url))
    {
        return 0;
    }

    try
    {
        auto store = file_.load();
        if (store.isDisabled(url))
        {
            casket::info("URL \"{}\" already with disabled trust. Ignoring command", url);
        }
        else
        {
            casket::info("Allowing URL \"{}\" access without establishing trust", url);
            store.disable(url);
            file_.save(store);
        }
    }
    catch (const std::exception& e)
    {
        casket::warning("Unable to read or modify trust at {}: {}", file_.path(), e.what());
        return 1;
    }
    return 0;
}

int TrustManager::enableTrust(const std::string& url)
{
    try
    {
        auto store = file_.load();
        if (store.isDisabled(url))
        {
            casket::info("Removing permission to access URL {} without establishing trust", url);
            store.erase(url);
            file_.save(store);
        }
        else
        {
            casket::info("URL \"{}\" is not with disabled trust. Ignoring command", url);
        }
    }
    catch (const std::exception& e)
    {
        casket::warning("Unable to read or modify trust at {}: {}", file_.path(), e.what());
        return 1;
    }
    return 0;
}

int TrustManager::clearTrust()
{
    if (!file_.exists())
    {
        casket::info("Trust not found at {}. Ignoring command", file_.path());
        return 0;
    }

    casket::info("Clearing trust.");
    try
    {
        file_.save(TrustStore());
    }
    catch (const std::exception& e)
    {
        casket::warning("Unable to read or modify trust at {}: {}", file_.path(), e.what());
        return 1;
    }
    return 0;
}

} // namespace pintrust::trust
