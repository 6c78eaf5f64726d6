#pragma once
#include <string>
#include <system_error>
#include <casket/utils/singleton.hpp>

namespace pintrust
{

/// @brief Error category of pintrust::Error values.
class ErrorCategory final : public casket::Singleton<ErrorCategory>,
                            public std::error_category
{
public:
    const char* name() const noexcept override;

    std::string message(int value) const override;
};

} // namespace pintrust
