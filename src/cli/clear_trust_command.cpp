#include <pintrust/cli/command_dispatcher.hpp>
#include <pintrust/cli/trust_command.hpp>

namespace pintrust::cmd
{

class ClearTrustCommand final : public TrustCommand
{
public:
    ClearTrustCommand()
        : TrustCommand("clear-trust", false)
    {
    }

protected:
    int run(trust::TrustManager& manager) override
    {
        return manager.clearTrust();
    }
};

PINTRUST_REGISTER_COMMAND("clear-trust", "Remove all trust entries", ClearTrustCommand);

} // namespace pintrust::cmd
