#include "utils.hpp"
#include "types.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<std::string> split_list(const std::string& str, char delimiter) {
    std::vector<std::string> out;
    std::stringstream ss(str);
    std::string item;
    while (std::getline(ss, item, delimiter)) {
        trim(item);
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

bool split_key_value(const std::string& line, std::string& key, std::string& value) {
    auto eq = line.find('=');
    if (eq == std::string::npos) return false;
    key = line.substr(0, eq);
    value = line.substr(eq + 1);
    return true;
}

bool env_flag_enabled(const std::string& name) {
    auto v = process_env(name);
    if (!v) return false;
    std::string s = to_lower(*v);
    return s != "0" && s != "false";
}

std::optional<std::string> process_env(const std::string& name) {
    const char* v = std::getenv(name.c_str());
    if (!v || !*v) return std::nullopt;
    return std::string(v);
}

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:               return "none";
        case ErrorKind::Generic:            return "error";
        case ErrorKind::Transport:          return "transport";
        case ErrorKind::Protocol:           return "protocol";
        case ErrorKind::Expired:            return "expired";
        case ErrorKind::NotLoggedIn:        return "not-logged-in";
        case ErrorKind::NotAMember:         return "not-a-member";
        case ErrorKind::AmbiguousSelection: return "ambiguous-selection";
        case ErrorKind::Storage:            return "storage";
        case ErrorKind::Timeout:            return "timeout";
        case ErrorKind::WriteProtected:     return "write-protected";
        case ErrorKind::Validation:         return "validation";
        case ErrorKind::Cancelled:          return "cancelled";
    }
    return "error";
}
