#include <openssl/err.h>
#include <pintrust/crypto/error_category.hpp>

namespace pintrust::crypto
{

const char* ErrorCategory::name() const noexcept
{
    return "OpenSSL";
}

std::string ErrorCategory::message(int value) const
{
    const char* reason = ::ERR_reason_error_string(static_cast<unsigned long>(value));
    if (reason)
    {
        const char* lib = ::ERR_lib_error_string(static_cast<unsigned long>(value));
        std::string result(reason);
        if (lib)
        {
            result += " (";
            result += lib;
            result += ")";
        }
        return result;
    }

    return "OpenSSL error";
}

} // namespace pintrust::crypto
