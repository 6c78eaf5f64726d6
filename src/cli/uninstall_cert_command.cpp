#include <pintrust/cli/command_dispatcher.hpp>
#include <pintrust/cli/trust_command.hpp>

namespace pintrust::cmd
{

class UninstallCertCommand final : public TrustCommand
{
public:
    UninstallCertCommand()
        : TrustCommand("uninstall-cert", true)
    {
    }

protected:
    int run(trust::TrustManager& manager) override
    {
        return manager.uninstallCert(url_);
    }
};

PINTRUST_REGISTER_COMMAND("uninstall-cert", "Remove the certificate pinned for URL",
                          UninstallCertCommand);

} // namespace pintrust::cmd
