#pragma once

#include "../types.h"

namespace sfc {
namespace paths {

// Platform-specific application directories
// Linux:   ~/.config/speedsfeeds/, ~/.local/share/speedsfeeds/
// Windows: %APPDATA%/SpeedsFeeds/, %LOCALAPPDATA%/SpeedsFeeds/
// macOS:   ~/Library/Application Support/SpeedsFeeds/

// Configuration directory (settings, machine limits)
Path getConfigDir();

// Data directory (user material and rigidity tables)
Path getDataDir();

// Default location of a user-supplied material table
Path getDefaultMaterialsPath();

// Default location of a user-supplied rigidity table
Path getDefaultRigidityPath();

// Log file path
Path getLogPath();

// Get application name (used in paths)
const char* getAppName();

} // namespace paths
} // namespace sfc
