#include <algorithm>
#include <cstdlib>
#include <iostream>

#include <casket/log/log_manager.hpp>
#include <casket/utils/string.hpp>

#include <pintrust/cli/trust_command.hpp>
#include <pintrust/config.hpp>
#include <pintrust/trust/trust_file.hpp>

namespace pintrust::cmd
{

TrustCommand::TrustCommand(std::string name, bool withUrl)
    : name_(std::move(name))
    , trustFile_(config::DefaultTrustFile())
{
    parser_.add("help, h", "Print help message");
    parser_.add("verbose, v", "Print debug messages");
    parser_.add("trust-file", casket::opt::Value(&trustFile_),
                "Trust file (default: " + trustFile_ + ")");
    arguments_.addValueOption("trust-file");
    if (withUrl)
    {
        arguments_.add("URL", &url_, "URL of the depot");
    }
}

int TrustCommand::execute(const std::vector<std::string_view>& args)
{
    auto isHelp = [](std::string_view arg) {
        return casket::equals(arg, "--help") || casket::equals(arg, "-h");
    };
    if (std::any_of(args.begin(), args.end(), isHelp))
    {
        parser_.help(std::cout, "pintrust " + name_ + arguments_.usage());
        arguments_.help(std::cout);
        return EXIT_SUCCESS;
    }

    parser_.parse(arguments_.extract(args));
    validate();

    auto& logManager = casket::LogManager::Instance();
    logManager.enable(casket::Type::Console);
    logManager.setLevel(parser_.isUsed("verbose") ? casket::Level::Debug : casket::Level::Info);

    trust::TrustFile file(trustFile_);
    trust::TrustManager manager(file, fetcher_, prompt_);

    return run(manager);
}

} // namespace pintrust::cmd
