#include <cstring>
#include <iomanip>
#include <sstream>

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/x509.h>

#include <pintrust/crypto/bio.hpp>
#include <pintrust/crypto/cert.hpp>
#include <pintrust/crypto/exception.hpp>
#include <pintrust/crypto/error_code.hpp>

using namespace pintrust::crypto;

namespace
{

std::time_t asn1TimeToEpoch(const ASN1_TIME* asn1Time)
{
    std::tm tmTime;
    std::memset(&tmTime, 0, sizeof(tmTime));
    ThrowIfFalse(ASN1_TIME_to_tm(asn1Time, &tmTime));

    std::time_t result = ::timegm(&tmTime);
    if (result == static_cast<std::time_t>(-1))
    {
        throw CryptoException(TranslateError(ERR_R_OPERATION_FAIL), "Cannot convert ASN1_TIME to epoch");
    }

    return result;
}

std::string nameToString(const X509_NAME* name)
{
    auto bio = BioTraits::createMemoryBuffer();
    ThrowIfFalse(0 <= X509_NAME_print_ex(bio, name, 0, XN_FLAG_RFC2253));
    return BioTraits::getMemoryDataAsString(bio);
}

} // namespace

namespace pintrust::crypto
{

bool Cert::isEqual(const X509Cert* a, const X509Cert* b)
{
    int res = X509_cmp(a, b);
    ThrowIfTrue(res == -2, "X509_cmp returned error");
    return res == 0;
}

std::string Cert::subjectName(X509Cert* cert)
{
    auto name = X509_get_subject_name(cert);
    ThrowIfTrue(name == nullptr);
    return nameToString(name);
}

std::string Cert::issuerName(X509Cert* cert)
{
    auto name = X509_get_issuer_name(cert);
    ThrowIfTrue(name == nullptr);
    return nameToString(name);
}

std::time_t Cert::notBefore(X509Cert* cert)
{
    const ASN1_TIME* asn1Time = X509_get0_notBefore(cert);
    ThrowIfTrue(asn1Time == nullptr);

    return asn1TimeToEpoch(asn1Time);
}

std::time_t Cert::notAfter(X509Cert* cert)
{
    const ASN1_TIME* asn1Time = X509_get0_notAfter(cert);
    ThrowIfTrue(asn1Time == nullptr);

    return asn1TimeToEpoch(asn1Time);
}

std::string Cert::fingerprint(X509Cert* cert, std::string_view digestName)
{
    const std::string name(digestName);
    const EVP_MD* digest = EVP_get_digestbyname(name.c_str());
    ThrowIfTrue(digest == nullptr, "Unknown digest: " + name);

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int mdLength{0};
    ThrowIfFalse(X509_digest(cert, digest, md, &mdLength));

    std::ostringstream oss;
    oss << std::hex << std::uppercase << std::setfill('0');
    for (unsigned int i = 0; i < mdLength; ++i)
    {
        if (i > 0)
        {
            oss << ':';
        }
        oss << std::setw(2) << static_cast<unsigned>(md[i]);
    }
    return oss.str();
}

X509CertPtr Cert::fromBio(Bio* bio)
{
    X509CertPtr result{PEM_read_bio_X509(bio, nullptr, nullptr, nullptr)};
    if (!result)
    {
        throw CryptoException(GetLastError(), "Failed to parse certificate");
    }
    return result;
}

void Cert::toBio(X509Cert* cert, Bio* bio)
{
    if (!PEM_write_bio_X509(bio, cert))
    {
        throw CryptoException(GetLastError(), "Failed to save certificate");
    }
}

X509CertPtr Cert::fromBuffer(const std::vector<uint8_t>& input)
{
    const unsigned char* ptr = input.data();
    X509CertPtr result{d2i_X509(nullptr, &ptr, static_cast<long>(input.size()))};
    if (!result)
    {
        throw CryptoException(GetLastError(), "Failed to decode DER certificate");
    }
    return result;
}

std::vector<uint8_t> Cert::toBuffer(PINTRUST_OSSL_CONST_COMPAT X509Cert* cert)
{
    int length = i2d_X509(cert, nullptr);
    ThrowIfFalse(0 < length, "Failed to encode certificate");

    std::vector<uint8_t> output(static_cast<size_t>(length));
    unsigned char* ptr = output.data();
    ThrowIfFalse(length == i2d_X509(cert, &ptr), "Failed to encode certificate");
    return output;
}

X509CertPtr Cert::fromPem(std::string_view pem)
{
    auto bio = BioTraits::createMemoryReader(reinterpret_cast<const uint8_t*>(pem.data()), pem.size());
    return fromBio(bio);
}

std::string Cert::toPem(X509Cert* cert)
{
    auto bio = BioTraits::createMemoryBuffer();
    toBio(cert, bio);
    return BioTraits::getMemoryDataAsString(bio);
}

std::string Cert::derToPem(const std::vector<uint8_t>& der)
{
    auto cert = fromBuffer(der);
    return toPem(cert);
}

} // namespace pintrust::crypto
