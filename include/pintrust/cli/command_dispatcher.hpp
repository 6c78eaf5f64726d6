#pragma once
#include <functional>
#include <map>
#include <memory>
#include <ostream>
#include <string>
#include <tuple>
#include <pintrust/cli/command.hpp>
#include <casket/utils/singleton.hpp>

namespace pintrust::cmd
{

class CommandDispatcher final : public casket::Singleton<CommandDispatcher>
{
    typedef std::unique_ptr<Command> CommandPtr;
    typedef std::string CommandDescription;
    typedef std::function<CommandPtr()> CommandCreator;
    typedef std::tuple<CommandDescription, CommandCreator> CommandMeta;
    typedef std::map<std::string, CommandMeta> CommandMap;

public:
    CommandDispatcher() = default;
    ~CommandDispatcher() = default;

    /// @throw std::runtime_error for an unknown command name.
    CommandPtr createCommand(const std::string& name);

    void printCommands(std::ostream& os);

private:
    CommandMap& getCommands();

public:
    class Registrar final
    {
    public:
        Registrar(const std::string& name, const std::string& desc,
                  const CommandCreator& creator);
        ~Registrar() = default;
    };

private:
    CommandMap commands_;
};

#define PINTRUST_REGISTER_COMMAND(commandName, commandDesc, className)         \
    const pintrust::cmd::CommandDispatcher::Registrar className##Registrar(    \
        commandName, commandDesc,                                              \
        []() -> std::unique_ptr<pintrust::cmd::Command> {                      \
            return std::make_unique<className>();                              \
        })

} // namespace pintrust::cmd
