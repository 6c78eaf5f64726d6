#pragma once
#include <openssl/opensslv.h>

#if (OPENSSL_VERSION_NUMBER >= 0x30000000L)
#define PINTRUST_OSSL_CONST_COMPAT const
#else
#define PINTRUST_OSSL_CONST_COMPAT
#endif

using Bio = struct bio_st;
using X509Cert = struct x509_st;
using Key = struct evp_pkey_st;
