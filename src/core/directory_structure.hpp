#pragma once

#include <filesystem>
#include <string>
#include "types.hpp"

namespace fs = std::filesystem;

// Per-user data directory for an application:
//   Windows: %APPDATA%\<app_name>
//   else:    $XDG_DATA_HOME/<app_name, lowercased> or ~/.local/share/<...>
// Stable across versions so an old instance's claim is visible to a new one.
fs::path get_data_dir(const std::string& app_name);

// Creates the data directory and its logs/ subdirectory.
Result<void> ensure_data_directory(const fs::path& data_dir);
