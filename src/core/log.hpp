#pragma once

#include <string>
#include <filesystem>

// Append-only text log. Lines look like "[14:02:11.337] detect: not running".
// Defaults to <temp>/solo_debug.log until the host points it at the
// activity log. Logging never throws.

void set_log_path(const std::filesystem::path& path);
const std::string& solo_log_path();

void solo_log(const std::string& msg);

// Same as solo_log, prefixed with "WARN " so recovered failures stand out.
void solo_warn(const std::string& msg);
