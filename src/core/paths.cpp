#include "core/paths.h"

#include <cstdlib>
#include <filesystem>

static std::string EnvOrEmpty(const char* name)
{
    const char* v = std::getenv(name);
    return (v && *v) ? std::string(v) : std::string();
}

std::string GetTomodrawConfigDir()
{
    const std::string xdg = EnvOrEmpty("XDG_CONFIG_HOME");
    if (!xdg.empty())
        return xdg + "/tomodraw";

    const std::string home = EnvOrEmpty("HOME");
    if (!home.empty())
        return home + "/.config/tomodraw";

    // Last resort: current directory
    return ".";
}

std::string TomodrawConfigPath(const std::string& relative)
{
    namespace fs = std::filesystem;
    if (relative.empty())
        return GetTomodrawConfigDir();
    return (fs::path(GetTomodrawConfigDir()) / relative).string();
}
