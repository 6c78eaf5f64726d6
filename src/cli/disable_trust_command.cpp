#include <pintrust/cli/command_dispatcher.hpp>
#include <pintrust/cli/trust_command.hpp>

namespace pintrust::cmd
{

class DisableTrustCommand final : public TrustCommand
{
public:
    DisableTrustCommand()
        : TrustCommand("disable-trust", true)
    {
    }

protected:
    int run(trust::TrustManager& manager) override
    {
        return manager.disableTrust(url_);
    }
};

PINTRUST_REGISTER_COMMAND("disable-trust", "Allow access to URL without establishing trust",
                          DisableTrustCommand);

} // namespace pintrust::cmd
