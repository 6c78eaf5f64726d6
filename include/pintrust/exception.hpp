/// @file
/// @brief Exception type for trust store operation failures.

#pragma once

#include <string>
#include <system_error>

#include <pintrust/error_code.hpp>

namespace pintrust
{

/// @brief Carries a pintrust::Error code and a description of the failure.
class Exception final : public std::system_error
{
public:
    explicit Exception(Error e)
        : std::system_error(MakeErrorCode(e))
    {
    }

    Exception(Error e, const std::string& what)
        : std::system_error(MakeErrorCode(e), what)
    {
    }
};

/// @brief Throws an exception with code @p e if @p exprResult is true.
inline void ThrowIfTrue(bool exprResult, Error e, const std::string& msg)
{
    if (exprResult)
    {
        throw Exception(e, msg);
    }
}

} // namespace pintrust
