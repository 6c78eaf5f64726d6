#include <iostream>
#include <pintrust/trust/confirmation_prompt.hpp>

namespace pintrust::trust
{

ConsolePrompt::ConsolePrompt()
    : ConsolePrompt(std::cin, std::cout)
{
}

ConsolePrompt::ConsolePrompt(std::istream& in, std::ostream& out)
    : in_(in)
    , out_(out)
{
}

std::string ConsolePrompt::ask(std::string_view question)
{
    out_ << question << std::flush;

    std::string answer;
    std::getline(in_, answer);
    return answer;
}

} // namespace pintrust::trust
