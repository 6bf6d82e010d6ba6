#include "app_paths.h"

#include <cstdlib>

#include "../utils/log.h"

#ifndef _WIN32
    #include <pwd.h>
    #include <unistd.h>
#endif

namespace sfc {
namespace paths {

namespace {

const char* APP_NAME = "speedsfeeds";
const char* APP_DISPLAY_NAME = "SpeedsFeeds";

Path envPath(const char* name) {
    const char* value = std::getenv(name);
    if (value && value[0] != '\0') {
        return Path(value);
    }
    return Path();
}

Path getHomeDir() {
#ifdef _WIN32
    Path userProfile = envPath("USERPROFILE");
    if (!userProfile.empty()) {
        return userProfile;
    }
    log::error("Paths", "Cannot determine home directory: %USERPROFILE% unset");
    return fs::temp_directory_path();
#else
    Path home = envPath("HOME");
    if (!home.empty()) {
        return home;
    }
    // Fallback: look up home dir from passwd entry
    struct passwd* pw = getpwuid(getuid());
    if (pw && pw->pw_dir) {
        return Path(pw->pw_dir);
    }
    log::error("Paths", "Cannot determine home directory: $HOME unset and getpwuid failed");
    return fs::temp_directory_path();
#endif
}

} // namespace

const char* getAppName() {
    return APP_NAME;
}

Path getConfigDir() {
#ifdef _WIN32
    Path appData = envPath("APPDATA");
    if (appData.empty()) {
        appData = getHomeDir() / "AppData" / "Roaming";
    }
    return appData / APP_DISPLAY_NAME;
#elif defined(__APPLE__)
    return getHomeDir() / "Library" / "Application Support" / APP_DISPLAY_NAME;
#else
    // Linux - XDG Base Directory
    Path xdgConfig = envPath("XDG_CONFIG_HOME");
    if (!xdgConfig.empty()) {
        return xdgConfig / APP_NAME;
    }
    return getHomeDir() / ".config" / APP_NAME;
#endif
}

Path getDataDir() {
#ifdef _WIN32
    Path localAppData = envPath("LOCALAPPDATA");
    if (localAppData.empty()) {
        localAppData = getHomeDir() / "AppData" / "Local";
    }
    return localAppData / APP_DISPLAY_NAME;
#elif defined(__APPLE__)
    return getHomeDir() / "Library" / "Application Support" / APP_DISPLAY_NAME;
#else
    // Linux - XDG Base Directory
    Path xdgData = envPath("XDG_DATA_HOME");
    if (!xdgData.empty()) {
        return xdgData / APP_NAME;
    }
    return getHomeDir() / ".local" / "share" / APP_NAME;
#endif
}

Path getDefaultMaterialsPath() {
    return getDataDir() / "materials.json";
}

Path getDefaultRigidityPath() {
    return getDataDir() / "rigidity.json";
}

Path getLogPath() {
    return getDataDir() / "speedsfeeds.log";
}

} // namespace paths
} // namespace sfc
