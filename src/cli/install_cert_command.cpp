#include <chrono>
#include <casket/utils/exception.hpp>
#include <pintrust/cli/command_dispatcher.hpp>
#include <pintrust/cli/trust_command.hpp>

namespace pintrust::cmd
{

class InstallCertCommand final : public TrustCommand
{
public:
    InstallCertCommand()
        : TrustCommand("install-cert", true)
        , timeout_(static_cast<unsigned int>(config::kFetchTimeout.count()))
    {
        parser_.add("yes, y", "Pin the certificate without asking for confirmation");
        parser_.add("timeout", casket::opt::Value(&timeout_),
                    "Connection and handshake timeout in seconds, 1 to " +
                        std::to_string(config::kMaxFetchTimeout.count()) + " (default: " +
                        std::to_string(timeout_) + ")");
        arguments_.addValueOption("timeout");
    }

    ~InstallCertCommand() = default;

protected:
    void validate() override
    {
        casket::ThrowIfTrue(timeout_ == 0 || timeout_ > config::kMaxFetchTimeout.count(),
                            "timeout must be between 1 and " +
                                std::to_string(config::kMaxFetchTimeout.count()) + " seconds");
    }

    int run(trust::TrustManager& manager) override
    {
        return manager.installCert(url_, parser_.isUsed("yes"), std::chrono::seconds(timeout_));
    }

private:
    unsigned int timeout_;
};

PINTRUST_REGISTER_COMMAND("install-cert", "Pin the certificate served for URL", InstallCertCommand);

} // namespace pintrust::cmd
