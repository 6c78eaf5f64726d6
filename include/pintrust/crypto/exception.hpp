/// @file
/// @brief General exception type for OpenSSL errors.

#pragma once

#include <string>
#include <system_error>

#include <pintrust/crypto/error_code.hpp>

namespace pintrust::crypto
{

/// @brief Main class for OpenSSL exceptions.
class CryptoException final : public std::system_error
{
public:
    /// @brief Constructor.
    ///
    /// @param[in] ec Error code.
    ///
    explicit CryptoException(std::error_code ec)
        : std::system_error(ec)
    {
    }

    /// @brief Constructor.
    ///
    /// @param[in] ec Error code.
    /// @param[in] what Error message.
    ///
    CryptoException(std::error_code ec, const std::string& what)
        : std::system_error(ec, what)
    {
    }
};

/// @brief Throws an exception if @p expression is true.
///
/// @param[in] expression Result of the expression to check.
///
inline void ThrowIfTrue(bool expression)
{
    if (expression)
    {
        throw CryptoException(GetLastError());
    }
}

/// @brief Throws an exception if @p expression is true.
///
/// @param[in] expression Result of the expression to check.
/// @param[in] message Additional message.
///
inline void ThrowIfTrue(bool expression, const std::string& message)
{
    if (expression)
    {
        throw CryptoException(GetLastError(), message);
    }
}

/// @brief Throws an exception if @p expression is false.
///
/// @param[in] expression Result of the expression to check.
///
inline void ThrowIfFalse(bool expression)
{
    if (!expression)
    {
        throw CryptoException(GetLastError());
    }
}

/// @brief Throws an exception if @p expression is false.
///
/// @param[in] expression Result of the expression to check.
/// @param[in] message Additional message.
///
inline void ThrowIfFalse(bool expression, const std::string& message)
{
    if (!expression)
    {
        throw CryptoException(GetLastError(), message);
    }
}

} // namespace pintrust::crypto
