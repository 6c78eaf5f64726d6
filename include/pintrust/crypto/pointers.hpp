#pragma once

#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/x509.h>

#include <pintrust/crypto/typedefs.hpp>
#include <pintrust/utils/custom_unique_ptr.hpp>

namespace pintrust::crypto
{

PINTRUST_DEFINE_UNIQUE_PTR(BioPtr, Bio, BIO_free_all);
PINTRUST_DEFINE_UNIQUE_PTR(X509CertPtr, X509Cert, X509_free);
PINTRUST_DEFINE_UNIQUE_PTR(KeyPtr, Key, EVP_PKEY_free);

} // namespace pintrust::crypto
