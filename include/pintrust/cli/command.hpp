#pragma once
#include <vector>
#include <string_view>
#include <casket/utils/noncopyable.hpp>

namespace pintrust::cmd
{

class Command : public casket::NonCopyable
{
public:
    Command() = default;

    virtual ~Command() = default;

    /// @return Process exit status.
    virtual int execute(const std::vector<std::string_view>& args) = 0;
};

} // namespace pintrust::cmd
