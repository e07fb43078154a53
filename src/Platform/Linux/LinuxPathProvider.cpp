#include "LinuxPathProvider.h"

#include <cstdlib>
#include <filesystem>

#include <pwd.h>
#include <unistd.h>

namespace Platform
{

namespace
{

constexpr const char* APP_DIR_NAME = "sockwatch";

/// Read-only environment lookup; empty values count as unset.
/// secure_getenv ignores the environment in setuid/setgid programs.
[[nodiscard]] const char* getEnvSafe(const char* name)
{
#if defined(__GLIBC__) && defined(_GNU_SOURCE)
    const char* value = secure_getenv(name);
#else
    // NOLINTNEXTLINE(concurrency-mt-unsafe) - fallback when secure_getenv unavailable
    const char* value = std::getenv(name);
#endif
    if (value == nullptr || value[0] == '\0')
    {
        return nullptr;
    }
    return value;
}

} // namespace

std::filesystem::path LinuxPathProvider::getUserConfigDir() const
{
    if (const char* xdg = getEnvSafe("XDG_CONFIG_HOME"))
    {
        return std::filesystem::path(xdg) / APP_DIR_NAME;
    }

    if (const char* home = getEnvSafe("HOME"))
    {
        return std::filesystem::path(home) / ".config" / APP_DIR_NAME;
    }

    // Services started without HOME
    if (const auto* pw = getpwuid(getuid()))
    {
        return std::filesystem::path(pw->pw_dir) / ".config" / APP_DIR_NAME;
    }

    return std::filesystem::current_path();
}

} // namespace Platform
