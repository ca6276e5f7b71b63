#include "../keyring.hpp"
#include <Security/Security.h>
#include <CoreFoundation/CoreFoundation.h>
#include <fmt/format.h>

static CFStringRef cf_str(const std::string& s) {
    return CFStringCreateWithCString(kCFAllocatorDefault, s.c_str(), kCFStringEncodingUTF8);
}

static std::string cf_data_to_string(CFDataRef data) {
    return std::string(reinterpret_cast<const char*>(CFDataGetBytePtr(data)),
                       CFDataGetLength(data));
}

static CFMutableDictionaryRef base_query(CFStringRef service, CFStringRef account) {
    CFMutableDictionaryRef query = CFDictionaryCreateMutable(
        kCFAllocatorDefault, 5, &kCFTypeDictionaryKeyCallBacks, &kCFTypeDictionaryValueCallBacks);
    CFDictionarySetValue(query, kSecClass, kSecClassGenericPassword);
    CFDictionarySetValue(query, kSecAttrService, service);
    CFDictionarySetValue(query, kSecAttrAccount, account);
    return query;
}

class MacKeychain : public KeyringBackend {
public:
    Result<std::optional<std::string>> get(const std::string& service,
                                           const std::string& account) override {
        CFStringRef cf_service = cf_str(service);
        CFStringRef cf_account = cf_str(account);

        CFMutableDictionaryRef query = base_query(cf_service, cf_account);
        CFDictionarySetValue(query, kSecReturnData, kCFBooleanTrue);
        CFDictionarySetValue(query, kSecMatchLimit, kSecMatchLimitOne);

        CFTypeRef result = nullptr;
        OSStatus status = SecItemCopyMatching(query, &result);

        CFRelease(query);
        CFRelease(cf_service);
        CFRelease(cf_account);

        if (status == errSecItemNotFound) {
            return Result<std::optional<std::string>>::Ok(std::nullopt);
        }
        if (status != errSecSuccess) {
            return Result<std::optional<std::string>>::Err(ErrorKind::Storage,
                fmt::format("Keychain error (OSStatus {})", static_cast<int>(status)));
        }

        std::string value = cf_data_to_string(static_cast<CFDataRef>(result));
        CFRelease(result);
        return Result<std::optional<std::string>>::Ok(value);
    }

    Result<void> set(const std::string& service,
                     const std::string& account,
                     const std::string& secret) override {
        CFStringRef cf_service = cf_str(service);
        CFStringRef cf_account = cf_str(account);
        CFDataRef cf_password = CFDataCreate(
            kCFAllocatorDefault,
            reinterpret_cast<const UInt8*>(secret.c_str()),
            secret.length());

        CFMutableDictionaryRef query = base_query(cf_service, cf_account);

        CFMutableDictionaryRef update = CFDictionaryCreateMutable(
            kCFAllocatorDefault, 1, &kCFTypeDictionaryKeyCallBacks, &kCFTypeDictionaryValueCallBacks);
        CFDictionarySetValue(update, kSecValueData, cf_password);

        OSStatus status = SecItemUpdate(query, update);

        if (status == errSecItemNotFound) {
            CFDictionarySetValue(query, kSecValueData, cf_password);
            status = SecItemAdd(query, nullptr);
        }

        CFRelease(query);
        CFRelease(update);
        CFRelease(cf_password);
        CFRelease(cf_service);
        CFRelease(cf_account);

        if (status != errSecSuccess) {
            return Result<void>::Err(ErrorKind::Storage,
                fmt::format("failed to store token in Keychain (OSStatus {})", static_cast<int>(status)));
        }
        return Result<void>::Ok();
    }

    Result<void> remove(const std::string& service,
                        const std::string& account) override {
        CFStringRef cf_service = cf_str(service);
        CFStringRef cf_account = cf_str(account);

        CFMutableDictionaryRef query = base_query(cf_service, cf_account);
        OSStatus status = SecItemDelete(query);

        CFRelease(query);
        CFRelease(cf_service);
        CFRelease(cf_account);

        if (status != errSecSuccess && status != errSecItemNotFound) {
            return Result<void>::Err(ErrorKind::Storage,
                fmt::format("failed to delete token from Keychain (OSStatus {})", static_cast<int>(status)));
        }
        return Result<void>::Ok();
    }

    const char* name() const override { return "keychain"; }
};

std::shared_ptr<KeyringBackend> make_system_keyring() {
    return std::make_shared<MacKeychain>();
}
