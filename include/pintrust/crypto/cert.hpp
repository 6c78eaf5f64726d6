#pragma once
#include <ctime>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <pintrust/crypto/pointers.hpp>

namespace pintrust::crypto
{

class Cert final
{
public:
    static bool isEqual(const X509Cert* op1, const X509Cert* op2);

    /// @brief One-line RFC 2253 rendering of the subject name.
    static std::string subjectName(X509Cert* cert);

    /// @brief One-line RFC 2253 rendering of the issuer name.
    static std::string issuerName(X509Cert* cert);

    static std::time_t notBefore(X509Cert* cert);

    static std::time_t notAfter(X509Cert* cert);

    /// @brief Colon separated upper-case hex digest of the DER encoding.
    ///
    /// @param[in] cert Certificate.
    /// @param[in] digestName OpenSSL digest name, e.g. "SHA256".
    static std::string fingerprint(X509Cert* cert, std::string_view digestName = "SHA256");

    /// @brief Reads a PEM encoded certificate from @p bio.
    static X509CertPtr fromBio(Bio* bio);

    /// @brief Writes @p cert to @p bio in PEM form.
    static void toBio(X509Cert* cert, Bio* bio);

    /// @brief Decodes a DER encoded certificate, throws on malformed input.
    static X509CertPtr fromBuffer(const std::vector<uint8_t>& input);

    static std::vector<uint8_t> toBuffer(PINTRUST_OSSL_CONST_COMPAT X509Cert* cert);

    static X509CertPtr fromPem(std::string_view pem);

    static std::string toPem(X509Cert* cert);

    /// @brief Re-encodes a DER certificate as PEM text.
    static std::string derToPem(const std::vector<uint8_t>& der);
};

} // namespace pintrust::crypto
