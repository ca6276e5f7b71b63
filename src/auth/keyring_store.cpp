#include "keyring_store.hpp"
#include "timed_call.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

std::string keyring_service(const std::string& host) {
    return std::string(KEYRING_SERVICE_PREFIX) + host;
}

static std::string slot_label(const std::string& slot) {
    return slot.empty() ? "<active>" : slot;
}

KeyringCredentialStore::KeyringCredentialStore(std::shared_ptr<KeyringBackend> backend,
                                               std::chrono::milliseconds timeout)
    : backend_(std::move(backend)), timeout_(timeout) {
    source_ = backend_->plaintext() ? fmt::format("{} ({})", SOURCE_KEYRING, backend_->name())
                                    : std::string(SOURCE_KEYRING);
}

Result<std::optional<std::string>> KeyringCredentialStore::get(const std::string& host,
                                                               const std::string& slot) {
    auto backend = backend_;
    std::string service = keyring_service(host);
    ghx_logf("keyring[{}]: get {} {}", backend->name(), service, slot_label(slot));

    return run_with_timeout<std::optional<std::string>>(
        [backend, service, slot]() { return backend->get(service, slot); },
        timeout_, "keyring read");
}

Result<void> KeyringCredentialStore::store(const std::string& host,
                                           const std::string& slot,
                                           const std::string& secret) {
    auto backend = backend_;
    std::string service = keyring_service(host);
    ghx_logf("keyring[{}]: set {} {}", backend->name(), service, slot_label(slot));

    return run_with_timeout<void>(
        [backend, service, slot, secret]() { return backend->set(service, slot, secret); },
        timeout_, "keyring write");
}

Result<void> KeyringCredentialStore::remove(const std::string& host,
                                            const std::string& slot) {
    auto backend = backend_;
    std::string service = keyring_service(host);
    ghx_logf("keyring[{}]: delete {} {}", backend->name(), service, slot_label(slot));

    return run_with_timeout<void>(
        [backend, service, slot]() { return backend->remove(service, slot); },
        timeout_, "keyring delete");
}
