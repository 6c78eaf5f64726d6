#pragma once
#include <iosfwd>
#include <string>
#include <string_view>

namespace pintrust::trust
{

/// @brief Asks the user to approve an action.
class ConfirmationPrompt
{
public:
    virtual ~ConfirmationPrompt() = default;

    /// @brief Shows @p question and returns the raw answer.
    virtual std::string ask(std::string_view question) = 0;
};

/// @brief Reads the answer from a line of an input stream.
class ConsolePrompt final : public ConfirmationPrompt
{
public:
    ConsolePrompt();

    ConsolePrompt(std::istream& in, std::ostream& out);

    std::string ask(std::string_view question) override;

private:
    std::istream& in_;
    std::ostream& out_;
};

} // namespace pintrust::trust
