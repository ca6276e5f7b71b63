#include "../keyring.hpp"
#include <core/config.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fstream>
#include <sstream>
#include <filesystem>
#include <map>
#include <fmt/format.h>

namespace fs = std::filesystem;

// Fallback for Linux builds without libsecret: entries stored as
// "service\taccount=secret" lines in <config dir>/keyring, owner-only.

static fs::path keyring_path() {
    return get_config_dir() / "keyring";
}

static std::string entry_key(const std::string& service, const std::string& account) {
    return service + "\t" + account;
}

class FileKeyring : public KeyringBackend {
public:
    Result<std::optional<std::string>> get(const std::string& service,
                                           const std::string& account) override {
        auto all = read_all();
        if (all.is_err()) return Result<std::optional<std::string>>::From(all);

        auto it = all.value.find(entry_key(service, account));
        if (it == all.value.end()) {
            return Result<std::optional<std::string>>::Ok(std::nullopt);
        }
        return Result<std::optional<std::string>>::Ok(it->second);
    }

    Result<void> set(const std::string& service,
                     const std::string& account,
                     const std::string& secret) override {
        auto all = read_all();
        if (all.is_err()) return Result<void>::From(all);
        all.value[entry_key(service, account)] = secret;
        return write_all(all.value);
    }

    Result<void> remove(const std::string& service,
                        const std::string& account) override {
        auto all = read_all();
        if (all.is_err()) return Result<void>::From(all);
        if (all.value.erase(entry_key(service, account)) == 0) {
            return Result<void>::Ok();
        }
        return write_all(all.value);
    }

    const char* name() const override { return "file"; }
    bool plaintext() const override { return true; }

private:
    static Result<std::map<std::string, std::string>> read_all() {
        std::map<std::string, std::string> m;
        fs::path path = keyring_path();
        if (!fs::exists(path)) {
            return Result<std::map<std::string, std::string>>::Ok(m);
        }

        std::ifstream f(path);
        if (!f) {
            return Result<std::map<std::string, std::string>>::Err(ErrorKind::Storage,
                fmt::format("failed to read {}", path.string()));
        }

        std::string line;
        while (std::getline(f, line)) {
            std::string key, value;
            if (split_key_value(line, key, value)) {
                m[key] = value;
            }
        }
        return Result<std::map<std::string, std::string>>::Ok(m);
    }

    static Result<void> write_all(const std::map<std::string, std::string>& m) {
        fs::path path = keyring_path();
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);

        std::string content;
        for (const auto& [k, v] : m) {
            content += k + "=" + v + "\n";
        }
        ec = platform::write_private_file(path, content);
        if (ec) {
            return Result<void>::Err(ErrorKind::Storage,
                fmt::format("failed to write {}: {}", path.string(), ec.message()));
        }
        return Result<void>::Ok();
    }
};

std::shared_ptr<KeyringBackend> make_system_keyring() {
    return std::make_shared<FileKeyring>();
}
