#include <pintrust/cli/command_dispatcher.hpp>
#include <pintrust/cli/trust_command.hpp>

namespace pintrust::cmd
{

class EnableTrustCommand final : public TrustCommand
{
public:
    EnableTrustCommand()
        : TrustCommand("enable-trust", true)
    {
    }

protected:
    int run(trust::TrustManager& manager) override
    {
        return manager.enableTrust(url_);
    }
};

PINTRUST_REGISTER_COMMAND("enable-trust", "Require trust to access URL again", EnableTrustCommand);

} // namespace pintrust::cmd
