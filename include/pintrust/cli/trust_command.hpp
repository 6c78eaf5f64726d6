#pragma once
#include <string>
#include <string_view>
#include <vector>

#include <casket/opt/option_parser.hpp>

#include <pintrust/cli/command.hpp>
#include <pintrust/opt/positional_arguments.hpp>
#include <pintrust/tls/leaf_cert_fetcher.hpp>
#include <pintrust/trust/confirmation_prompt.hpp>
#include <pintrust/trust/trust_manager.hpp>

namespace pintrust::cmd
{

/// @brief Base of the commands operating on the trust file.
///
/// Handles the options shared by all of them: `--help`, `--verbose`,
/// `--trust-file` and, if requested, the URL argument.
class TrustCommand : public Command
{
public:
    TrustCommand(std::string name, bool withUrl);

    int execute(const std::vector<std::string_view>& args) override;

protected:
    /// @brief Checks option values once parsed, throws on invalid ones.
    virtual void validate()
    {
    }

    virtual int run(trust::TrustManager& manager) = 0;

protected:
    casket::opt::OptionParser parser_;
    opt::PositionalArguments arguments_;
    std::string url_;

private:
    std::string name_;
    std::string trustFile_;
    tls::TlsCertificateFetcher fetcher_;
    trust::ConsolePrompt prompt_;
};

} // namespace pintrust::cmd
