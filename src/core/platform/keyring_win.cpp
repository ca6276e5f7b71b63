#include "../keyring.hpp"
#include <windows.h>
#include <wincred.h>
#include <fmt/format.h>

#pragma comment(lib, "advapi32.lib")

// Credential Manager has one flat namespace; targets are "service:account".
static std::wstring target_name(const std::string& service, const std::string& account) {
    std::string key = service + ":" + account;
    return std::wstring(key.begin(), key.end());
}

class WinCredentialManager : public KeyringBackend {
public:
    Result<std::optional<std::string>> get(const std::string& service,
                                           const std::string& account) override {
        PCREDENTIALW cred = nullptr;
        std::wstring wkey = target_name(service, account);

        if (!CredReadW(wkey.c_str(), CRED_TYPE_GENERIC, 0, &cred)) {
            DWORD err = GetLastError();
            if (err == ERROR_NOT_FOUND) {
                return Result<std::optional<std::string>>::Ok(std::nullopt);
            }
            return Result<std::optional<std::string>>::Err(ErrorKind::Storage,
                fmt::format("Credential Manager read failed (error {})", static_cast<unsigned long>(err)));
        }

        std::string result;
        if (cred->CredentialBlob) {
            result = std::string(
                reinterpret_cast<char*>(cred->CredentialBlob),
                cred->CredentialBlobSize
            );
        }

        CredFree(cred);
        return Result<std::optional<std::string>>::Ok(result);
    }

    Result<void> set(const std::string& service,
                     const std::string& account,
                     const std::string& secret) override {
        std::wstring wkey = target_name(service, account);
        std::wstring wuser(account.begin(), account.end());

        CREDENTIALW cred = {};
        cred.Type = CRED_TYPE_GENERIC;
        cred.TargetName = const_cast<wchar_t*>(wkey.c_str());
        cred.CredentialBlob = reinterpret_cast<LPBYTE>(const_cast<char*>(secret.c_str()));
        cred.CredentialBlobSize = static_cast<DWORD>(secret.length());
        cred.Persist = CRED_PERSIST_LOCAL_MACHINE;
        cred.UserName = const_cast<wchar_t*>(wuser.c_str());

        if (!CredWriteW(&cred, 0)) {
            return Result<void>::Err(ErrorKind::Storage,
                fmt::format("failed to store token in Credential Manager (error {})",
                            static_cast<unsigned long>(GetLastError())));
        }
        return Result<void>::Ok();
    }

    Result<void> remove(const std::string& service,
                        const std::string& account) override {
        std::wstring wkey = target_name(service, account);

        if (!CredDeleteW(wkey.c_str(), CRED_TYPE_GENERIC, 0)) {
            DWORD err = GetLastError();
            if (err == ERROR_NOT_FOUND) return Result<void>::Ok();
            return Result<void>::Err(ErrorKind::Storage,
                fmt::format("failed to delete token from Credential Manager (error {})",
                            static_cast<unsigned long>(err)));
        }
        return Result<void>::Ok();
    }

    const char* name() const override { return "wincred"; }
};

std::shared_ptr<KeyringBackend> make_system_keyring() {
    return std::make_shared<WinCredentialManager>();
}
