#pragma once

#include <string>
#include <vector>

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

// Copying variant of trim().
inline std::string trimmed(std::string s) {
    trim(s);
    return s;
}

std::string to_lower(std::string s);

// Split on a delimiter, dropping empty (after trimming) pieces.
std::vector<std::string> split_list(const std::string& str, char delimiter);

// Join with a separator.
std::string join(const std::vector<std::string>& parts, const std::string& sep);

// Split "key=value" at the first '='. Returns false if there is no '='.
bool split_key_value(const std::string& line, std::string& key, std::string& value);

// True if the variable is set to something other than "", "0" or "false".
bool env_flag_enabled(const std::string& name);
