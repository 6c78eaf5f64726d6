#pragma once
#include <algorithm>
#include <iterator>
#include <ostream>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <casket/utils/exception.hpp>

namespace pintrust::opt
{

/// @brief Ordered required arguments given among named options.
///
/// Splits a command line into the positional values and the named options,
/// the latter being handed over to casket::opt::OptionParser unchanged. Options
/// declared with addValueOption() consume the following token as their value.
class PositionalArguments final
{
public:
    PositionalArguments() = default;
    ~PositionalArguments() = default;

    /// @param names Base name and optional alias: "name" or "name, alias".
    void addValueOption(std::string_view names)
    {
        auto comma = names.find(',');
        valueOptions_.emplace(names.substr(0, comma));
        if (comma != std::string_view::npos)
        {
            auto alias = names.substr(comma + 1);
            alias.remove_prefix(std::min(alias.find_first_not_of(' '), alias.size()));
            valueOptions_.emplace(alias);
        }
    }

    void add(std::string name, std::string* value, std::string description)
    {
        arguments_.push_back(Argument{std::move(name), value, std::move(description)});
    }

    /// @brief Stores the positional values and returns the remaining tokens.
    ///
    /// @throw casket::RuntimeError for a missing or unexpected argument.
    std::vector<std::string_view> extract(const std::vector<std::string_view>& args) const
    {
        std::vector<std::string_view> named;
        auto next = arguments_.begin();

        for (auto arg = args.begin(); arg != args.end(); ++arg)
        {
            if (isOptionName(*arg))
            {
                named.push_back(*arg);
                if (takesValue(*arg) && std::next(arg) != args.end())
                {
                    named.push_back(*(++arg));
                }
                continue;
            }

            if (next == arguments_.end())
            {
                throw casket::RuntimeError("unexpected argument: " + std::string(*arg));
            }
            *next->value = std::string(*arg);
            ++next;
        }

        if (next != arguments_.end())
        {
            throw casket::RuntimeError("'" + next->name + "' must be specified");
        }
        return named;
    }

    /// @brief Names of the arguments in order, each preceded by a space.
    std::string usage() const
    {
        std::string result;
        for (const auto& argument : arguments_)
        {
            result += " " + argument.name;
        }
        return result;
    }

    void help(std::ostream& os) const
    {
        if (arguments_.empty())
        {
            return;
        }

        os << "Arguments:\n";
        for (const auto& argument : arguments_)
        {
            os << "  " << argument.name;
            for (auto pad = argument.name.size() < 23 ? 23 - argument.name.size() : 1; pad > 0; --pad)
            {
                os.put(' ');
            }
            os << argument.description << "\n";
        }
        os << "\n";
    }

private:
    struct Argument
    {
        std::string name;
        std::string* value;
        std::string description;
    };

    static bool isOptionName(std::string_view arg)
    {
        return arg.size() > 1 && arg.front() == '-';
    }

    // "--name=value" carries its own value
    bool takesValue(std::string_view arg) const
    {
        arg.remove_prefix(arg.rfind("--", 0) == 0 ? 2 : 1);
        if (arg.find('=') != std::string_view::npos)
        {
            return false;
        }
        return valueOptions_.find(arg) != valueOptions_.end();
    }

private:
    std::vector<Argument> arguments_;
    std::set<std::string, std::less<>> valueOptions_;
};

} // namespace pintrust::opt
