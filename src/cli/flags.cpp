#include "flags.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>

std::optional<std::string> ParsedFlags::get(const std::string& name) const {
    auto it = values.find(name);
    if (it == values.end() || it->second.empty()) return std::nullopt;
    return it->second.back();
}

std::string ParsedFlags::get_or(const std::string& name, const std::string& fallback) const {
    auto v = get(name);
    return v ? *v : fallback;
}

std::vector<std::string> ParsedFlags::list(const std::string& name) const {
    std::vector<std::string> out;
    auto it = values.find(name);
    if (it == values.end()) return out;
    for (const auto& v : it->second) {
        for (auto& piece : split_list(v, ',')) out.push_back(piece);
    }
    return out;
}

static const FlagSpec* find_long(const std::vector<FlagSpec>& specs, const std::string& name) {
    for (const auto& s : specs) {
        if (name == s.name) return &s;
    }
    return nullptr;
}

static const FlagSpec* find_short(const std::vector<FlagSpec>& specs, char c) {
    for (const auto& s : specs) {
        if (s.short_name != 0 && s.short_name == c) return &s;
    }
    return nullptr;
}

Result<ParsedFlags> parse_flags(const std::vector<std::string>& args,
                                const std::vector<FlagSpec>& specs) {
    ParsedFlags out;

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];

        if (arg == "--") {
            out.positional.insert(out.positional.end(), args.begin() + i + 1, args.end());
            break;
        }
        if (arg.size() < 2 || arg[0] != '-') {
            out.positional.push_back(arg);
            continue;
        }

        const FlagSpec* spec = nullptr;
        std::optional<std::string> inline_value;
        if (arg[1] == '-') {
            std::string name = arg.substr(2);
            auto eq = name.find('=');
            if (eq != std::string::npos) {
                inline_value = name.substr(eq + 1);
                name = name.substr(0, eq);
            }
            spec = find_long(specs, name);
        } else if (arg.size() == 2) {
            spec = find_short(specs, arg[1]);
        }
        if (!spec) {
            return Result<ParsedFlags>::Err(ErrorKind::Validation,
                fmt::format("unknown flag: {}", arg));
        }

        auto& slot = out.values[spec->name];
        if (!spec->takes_value) {
            if (inline_value) {
                return Result<ParsedFlags>::Err(ErrorKind::Validation,
                    fmt::format("flag --{} does not take a value", spec->name));
            }
            slot.push_back("true");
            continue;
        }

        if (inline_value) {
            slot.push_back(*inline_value);
        } else if (i + 1 < args.size()) {
            slot.push_back(args[++i]);
        } else {
            return Result<ParsedFlags>::Err(ErrorKind::Validation,
                fmt::format("flag needs an argument: --{}", spec->name));
        }
    }

    return Result<ParsedFlags>::Ok(std::move(out));
}
