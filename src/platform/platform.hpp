#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME on Unix, USERPROFILE on Windows).
std::filesystem::path home_dir();

// Returns the system temporary directory (/tmp on Unix, GetTempPath on Windows).
std::filesystem::path temp_dir();

// Root for per-user application data: %APPDATA% on Windows,
// $XDG_DATA_HOME or ~/.local/share elsewhere.
std::filesystem::path user_data_dir();

// Id of the calling process.
int current_pid();

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

// Human-readable text for an errno / GetLastError value.
std::string error_text(int code);

} // namespace platform
