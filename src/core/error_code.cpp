#include <pintrust/error_code.hpp>
#include <pintrust/error_category.hpp>

namespace pintrust
{

std::error_code MakeErrorCode(Error e)
{
    return std::error_code(static_cast<int>(e), ErrorCategory::Instance());
}

} // namespace pintrust
