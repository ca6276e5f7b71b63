#pragma once

#include <string>
#include <filesystem>
#include <system_error>

namespace platform {

// Returns the user's home directory (HOME on Unix, USERPROFILE on Windows).
std::filesystem::path home_dir();

// Returns the system temporary directory (/tmp on Unix, GetTempPath on Windows).
std::filesystem::path temp_dir();

// "macos", "linux" or "windows"; selects clipboard and browser helpers.
const char* os_name();

// Replaces path with content through "<path>.tmp" and a rename. The temp
// file is created owner-only (0600) before anything is written to it.
// Returns an empty error_code on success.
std::error_code write_private_file(const std::filesystem::path& path, const std::string& content);

} // namespace platform
