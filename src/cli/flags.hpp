#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <core/types.hpp>

// One accepted flag. short_name is 0 when there is no short form.
struct FlagSpec {
    const char* name;
    char short_name;
    bool takes_value;
};

struct ParsedFlags {
    std::map<std::string, std::vector<std::string>> values;
    std::vector<std::string> positional;

    bool has(const std::string& name) const { return values.count(name) > 0; }

    // Last value given for the flag.
    std::optional<std::string> get(const std::string& name) const;
    std::string get_or(const std::string& name, const std::string& fallback) const;

    // Every value, with comma-separated lists expanded.
    std::vector<std::string> list(const std::string& name) const;
};

// Accepts --name, --name=value, --name value, -x and -x value. Anything after
// "--" is positional.
Result<ParsedFlags> parse_flags(const std::vector<std::string>& args,
                                const std::vector<FlagSpec>& specs);
