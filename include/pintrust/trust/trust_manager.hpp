/// @file
/// @brief Trust store operations.

#pragma once
#include <chrono>
#include <string>

#include <pintrust/config.hpp>
#include <pintrust/tls/leaf_cert_fetcher.hpp>
#include <pintrust/trust/confirmation_prompt.hpp>
#include <pintrust/trust/trust_file.hpp>

namespace pintrust::trust
{

/// @brief Runs trust store operations against a trust file.
///
/// Every operation returns 0 on success or when nothing had to be done and 1
/// on failure. Failures are logged as a warning and never thrown. The file is
/// either fully updated or left untouched.
class TrustManager final
{
public:
    TrustManager(TrustFile& file, tls::CertificateFetcher& fetcher, ConfirmationPrompt& prompt);

    ~TrustManager() = default;

    /// @brief Pins the certificate currently served for @p url.
    ///
    /// Only `https://` URLs are handled, others are skipped. Unless
    /// @p autoAccept is set, the certificate is shown and the user has to
    /// answer "y" or "Y".
    int installCert(const std::string& url, bool autoAccept = false,
                    std::chrono::seconds timeout = config::kFetchTimeout);

    /// @brief Removes the pinned certificate for @p url.
    int uninstallCert(const std::string& url);

    /// @brief Lets @p url be accessed without establishing trust.
    int disableTrust(const std::string& url);

    /// @brief Removes the no-trust marking of @p url.
    int enableTrust(const std::string& url);

    /// @brief Empties the trust file if it exists.
    int clearTrust();

private:
    bool requiresTrust(const std::string& url);

    bool confirm(const std::string& pem);

    TrustFile& file_;
    tls::CertificateFetcher& fetcher_;
    ConfirmationPrompt& prompt_;
};

} // namespace pintrust::trust
