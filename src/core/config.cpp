#include <cstdlib>
#include <filesystem>

#include <pintrust/config.hpp>

namespace pintrust::config
{

std::string DefaultTrustFile()
{
    const std::string envName(kConfigDirEnv);
    const char* configDir = std::getenv(envName.c_str());
    if (configDir != nullptr && *configDir != '\0')
    {
        return (std::filesystem::path(configDir) / "pintrust" / std::string(kTrustFileName)).string();
    }
    return (std::filesystem::path("/etc/pintrust") / std::string(kTrustFileName)).string();
}

} // namespace pintrust::config
