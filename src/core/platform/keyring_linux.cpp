#include "../keyring.hpp"
#include <core/log.hpp>
#include <libsecret/secret.h>
#include <fmt/format.h>

// Secret Service (GNOME Keyring, KWallet) through libsecret. Items use the
// generic schema with "service" and "username" attributes, the layout other
// git credential tools use, so existing entries stay readable.

static const SecretSchema* generic_schema() {
    static const SecretSchema schema = {
        "org.freedesktop.Secret.Generic",
        SECRET_SCHEMA_NONE,
        {
            {"service", SECRET_SCHEMA_ATTRIBUTE_STRING},
            {"username", SECRET_SCHEMA_ATTRIBUTE_STRING},
            {nullptr, SecretSchemaAttributeType(0)},
        }};
    return &schema;
}

static std::string take_error(GError* error) {
    std::string msg = error ? error->message : "unknown error";
    if (error) g_error_free(error);
    return msg;
}

class LibsecretKeyring : public KeyringBackend {
public:
    Result<std::optional<std::string>> get(const std::string& service,
                                           const std::string& account) override {
        GError* error = nullptr;
        gchar* secret = secret_password_lookup_sync(
            generic_schema(), nullptr, &error,
            "service", service.c_str(),
            "username", account.c_str(),
            nullptr);

        if (error) {
            return Result<std::optional<std::string>>::Err(ErrorKind::Storage,
                fmt::format("keyring lookup failed: {}", take_error(error)));
        }
        if (!secret) {
            return Result<std::optional<std::string>>::Ok(std::nullopt);
        }

        std::string value(secret);
        secret_password_free(secret);
        return Result<std::optional<std::string>>::Ok(value);
    }

    Result<void> set(const std::string& service,
                     const std::string& account,
                     const std::string& secret) override {
        std::string label = fmt::format("{} ({})", service, account.empty() ? "active" : account);

        GError* error = nullptr;
        gboolean ok = secret_password_store_sync(
            generic_schema(), SECRET_COLLECTION_DEFAULT,
            label.c_str(), secret.c_str(), nullptr, &error,
            "service", service.c_str(),
            "username", account.c_str(),
            nullptr);

        if (!ok) {
            return Result<void>::Err(ErrorKind::Storage,
                fmt::format("failed to store token in keyring: {}", take_error(error)));
        }
        return Result<void>::Ok();
    }

    Result<void> remove(const std::string& service,
                        const std::string& account) override {
        GError* error = nullptr;
        secret_password_clear_sync(
            generic_schema(), nullptr, &error,
            "service", service.c_str(),
            "username", account.c_str(),
            nullptr);

        // FALSE without an error just means nothing matched.
        if (error) {
            return Result<void>::Err(ErrorKind::Storage,
                fmt::format("failed to delete token from keyring: {}", take_error(error)));
        }
        return Result<void>::Ok();
    }

    const char* name() const override { return "secret-service"; }
};

std::shared_ptr<KeyringBackend> make_system_keyring() {
    return std::make_shared<LibsecretKeyring>();
}
