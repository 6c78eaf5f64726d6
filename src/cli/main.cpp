#include <csignal>
#include <cstdlib>
#include <iostream>
#include <pintrust/cli/command_dispatcher.hpp>
#include <casket/utils/string.hpp>

using namespace casket;
using namespace pintrust::cmd;

int main(int argc, char* argv[])
{
    // A peer closing during the handshake must surface as an error, not kill us
    std::signal(SIGPIPE, SIG_IGN);

    try
    {
        std::vector<std::string_view> args(argv + 1, argv + argc);

        if (args.empty())
        {
            std::cerr << "Use '--help' to print commands" << std::endl;
            return EXIT_FAILURE;
        }
        else if (equals(args.front(), "-h") || equals(args.front(), "--help"))
        {
            std::cout << "Usage: pintrust <command> [options]" << std::endl << std::endl;
            CommandDispatcher::Instance().printCommands(std::cout);
            return EXIT_SUCCESS;
        }

        auto cmd = CommandDispatcher::Instance().createCommand(argv[1]);
        args.erase(args.begin());
        return cmd->execute(args);
    }
    catch (const std::system_error& e)
    {
        std::cerr << e.what() << " [" << e.code() << "]" << std::endl;
        return EXIT_FAILURE;
    }
    catch (const std::exception& e)
    {
        std::cerr << e.what() << std::endl;
        return EXIT_FAILURE;
    }
}
