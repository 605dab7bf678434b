// SecretVault backends: Windows Credential Manager, Keychain (macOS),
// Libsecret (Linux), or an "unavailable" vault everywhere else.
#include "rdpvisor/SecretVault.hpp"

#include <QLoggingCategory>

Q_LOGGING_CATEGORY(rvVault, "rdpvisor.vault")

namespace rdpvisor {

const char *persistStatusName(SecretVault::PersistStatus st) {
    switch (st) {
    case SecretVault::PersistStatus::Stored:
        return "Stored";
    case SecretVault::PersistStatus::Unavailable:
        return "Unavailable";
    case SecretVault::PersistStatus::PermissionDenied:
        return "PermissionDenied";
    case SecretVault::PersistStatus::BackendError:
        return "BackendError";
    }
    return "Unknown";
}

[[maybe_unused]] static const char *kindTag(CredentialKind kind) {
    return kind == CredentialKind::DomainPassword ? "domain" : "generic";
}

} // namespace rdpvisor

#if defined(_WIN32)

#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#include <wincred.h>

namespace rdpvisor {
namespace {

std::wstring widen(const std::string &s) {
    if (s.empty())
        return std::wstring();
    const int len = MultiByteToWideChar(CP_UTF8, 0, s.data(),
                                        static_cast<int>(s.size()), nullptr, 0);
    if (len <= 0)
        return std::wstring();
    std::wstring out(static_cast<std::size_t>(len), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, s.data(), static_cast<int>(s.size()),
                        &out[0], len);
    return out;
}

void scrub(std::wstring &w) {
    if (w.empty())
        return;
    SecureZeroMemory(&w[0], w.size() * sizeof(wchar_t));
    w.clear();
}

DWORD credType(CredentialKind kind) {
    return kind == CredentialKind::DomainPassword ? CRED_TYPE_DOMAIN_PASSWORD
                                                  : CRED_TYPE_GENERIC;
}

class WinCredVault : public SecretVault {
public:
    PersistResult store(const VaultItem &item) override {
        if (item.target.empty())
            return {PersistStatus::BackendError, "Empty credential target"};
        std::wstring target = widen(item.target);
        std::wstring user = widen(item.username);
        std::wstring secret = item.secret ? widen(*item.secret) : std::wstring();

        CREDENTIALW cred{};
        cred.Type = credType(item.kind);
        cred.TargetName = &target[0];
        cred.UserName = user.empty() ? nullptr : &user[0];
        cred.CredentialBlobSize =
            static_cast<DWORD>(secret.size() * sizeof(wchar_t));
        cred.CredentialBlob = secret.empty()
                                  ? nullptr
                                  : reinterpret_cast<LPBYTE>(&secret[0]);
        cred.Persist = CRED_PERSIST_SESSION;

        const BOOL ok = CredWriteW(&cred, 0);
        const DWORD lastError = ok ? ERROR_SUCCESS : GetLastError();
        scrub(secret);

        if (ok)
            return {PersistStatus::Stored, std::string()};
        PersistResult r;
        if (lastError == ERROR_NO_SUCH_LOGON_SESSION)
            r.status = PersistStatus::Unavailable;
        else if (lastError == ERROR_ACCESS_DENIED)
            r.status = PersistStatus::PermissionDenied;
        else
            r.status = PersistStatus::BackendError;
        r.detail = "CredWriteW error=" + std::to_string(lastError);
        return r;
    }

    bool remove(const std::string &target, CredentialKind kind,
                std::string &err) override {
        const std::wstring wtarget = widen(target);
        if (CredDeleteW(wtarget.c_str(), credType(kind), 0))
            return true;
        const DWORD lastError = GetLastError();
        if (lastError == ERROR_NOT_FOUND)
            return true;
        err = "CredDeleteW error=" + std::to_string(lastError);
        return false;
    }

    std::string backendName() const override { return "wincred"; }
};

} // namespace

std::unique_ptr<SecretVault> createPlatformVault() {
    return std::make_unique<WinCredVault>();
}

} // namespace rdpvisor

#elif defined(__APPLE__)

#include <CoreFoundation/CoreFoundation.h>
#include <Security/Security.h>

namespace rdpvisor {
namespace {

CFStringRef kServiceNameCF() {
    static CFStringRef s = CFSTR("RdpVisor");
    return s;
}

CFStringRef cfAccount(const std::string &target, CredentialKind kind) {
    const std::string account = target + "#" + kindTag(kind);
    return CFStringCreateWithBytes(
        kCFAllocatorDefault, reinterpret_cast<const UInt8 *>(account.data()),
        static_cast<CFIndex>(account.size()), kCFStringEncodingUTF8, false);
}

SecretVault::PersistResult mapApplePersistStatus(OSStatus st) {
    SecretVault::PersistResult r{};
    if (st == errSecSuccess) {
        r.status = SecretVault::PersistStatus::Stored;
        return r;
    }
    if (st == errSecNotAvailable) {
        r.status = SecretVault::PersistStatus::Unavailable;
    } else if (st == errSecAuthFailed || st == errSecInteractionNotAllowed ||
               st == errSecUserCanceled) {
        r.status = SecretVault::PersistStatus::PermissionDenied;
    } else {
        r.status = SecretVault::PersistStatus::BackendError;
    }
    r.detail = "Keychain OSStatus=" + std::to_string(static_cast<int>(st));
    return r;
}

CFMutableDictionaryRef newQuery(CFStringRef account) {
    CFMutableDictionaryRef query = CFDictionaryCreateMutable(
        kCFAllocatorDefault, 0, &kCFTypeDictionaryKeyCallBacks,
        &kCFTypeDictionaryValueCallBacks);
    CFDictionarySetValue(query, kSecClass, kSecClassGenericPassword);
    CFDictionarySetValue(query, kSecAttrService, kServiceNameCF());
    CFDictionarySetValue(query, kSecAttrAccount, account);
    return query;
}

class KeychainVault : public SecretVault {
public:
    PersistResult store(const VaultItem &item) override {
        if (item.target.empty())
            return {PersistStatus::BackendError, "Empty credential target"};
        CFStringRef account = cfAccount(item.target, item.kind);
        static const std::string kEmpty;
        const std::string &secret = item.secret ? *item.secret : kEmpty;
        CFDataRef data = CFDataCreate(
            kCFAllocatorDefault,
            reinterpret_cast<const UInt8 *>(secret.data()),
            static_cast<CFIndex>(secret.size()));
        if (!account || !data) {
            if (data)
                CFRelease(data);
            if (account)
                CFRelease(account);
            return {PersistStatus::BackendError,
                    "Could not build Keychain item"};
        }

        CFMutableDictionaryRef query = newQuery(account);
        CFMutableDictionaryRef attrs = CFDictionaryCreateMutable(
            kCFAllocatorDefault, 0, &kCFTypeDictionaryKeyCallBacks,
            &kCFTypeDictionaryValueCallBacks);
        CFDictionarySetValue(attrs, kSecValueData, data);
        CFDictionarySetValue(attrs, kSecAttrAccessible,
                             kSecAttrAccessibleWhenUnlockedThisDeviceOnly);
        OSStatus st = SecItemUpdate(query, attrs);
        if (st == errSecItemNotFound) {
            CFDictionarySetValue(query, kSecValueData, data);
            CFDictionarySetValue(query, kSecAttrAccessible,
                                 kSecAttrAccessibleWhenUnlockedThisDeviceOnly);
            st = SecItemAdd(query, nullptr);
        }

        CFRelease(attrs);
        CFRelease(query);
        CFRelease(data);
        CFRelease(account);
        return mapApplePersistStatus(st);
    }

    bool remove(const std::string &target, CredentialKind kind,
                std::string &err) override {
        CFStringRef account = cfAccount(target, kind);
        if (!account) {
            err = "Could not build Keychain account";
            return false;
        }
        CFMutableDictionaryRef query = newQuery(account);
        const OSStatus st = SecItemDelete(query);
        CFRelease(query);
        CFRelease(account);
        if (st == errSecSuccess || st == errSecItemNotFound)
            return true;
        err = "Keychain OSStatus=" + std::to_string(static_cast<int>(st));
        return false;
    }

    std::string backendName() const override { return "keychain"; }
};

} // namespace

std::unique_ptr<SecretVault> createPlatformVault() {
    return std::make_unique<KeychainVault>();
}

} // namespace rdpvisor

#elif defined(HAVE_LIBSECRET)

#include <libsecret/secret.h>

namespace rdpvisor {
namespace {

const SecretSchema *rdpvisorSchema() {
    static const SecretSchema schema = {
        "rdpvisor.credential",
        SECRET_SCHEMA_NONE,
        {
            {"target", SECRET_SCHEMA_ATTRIBUTE_STRING},
            {"kind", SECRET_SCHEMA_ATTRIBUTE_STRING},
            {"user", SECRET_SCHEMA_ATTRIBUTE_STRING},
            {nullptr, SECRET_SCHEMA_ATTRIBUTE_STRING},
        }};
    return &schema;
}

class LibsecretVault : public SecretVault {
public:
    PersistResult store(const VaultItem &item) override {
        if (item.target.empty())
            return {PersistStatus::BackendError, "Empty credential target"};
        const std::string label = "RdpVisor " + item.target;
        GError *gerr = nullptr;
        // The session collection is dropped at logout, matching the
        // session-only persistence used on Windows.
        const gboolean ok = secret_password_store_sync(
            rdpvisorSchema(), SECRET_COLLECTION_SESSION, label.c_str(),
            item.secret ? item.secret->c_str() : "", nullptr, &gerr,
            "target", item.target.c_str(), "kind", kindTag(item.kind), "user",
            item.username.c_str(), nullptr);
        if (ok)
            return {PersistStatus::Stored, std::string()};
        std::string detail =
            gerr ? std::string(gerr->message) : "libsecret store failed";
        const bool denied =
            gerr && gerr->domain == SECRET_ERROR &&
            gerr->code == SECRET_ERROR_IS_LOCKED;
        if (gerr)
            g_error_free(gerr);
        return {denied ? PersistStatus::PermissionDenied
                       : PersistStatus::BackendError,
                detail};
    }

    bool remove(const std::string &target, CredentialKind kind,
                std::string &err) override {
        GError *gerr = nullptr;
        (void)secret_password_clear_sync(rdpvisorSchema(), nullptr, &gerr,
                                         "target", target.c_str(), "kind",
                                         kindTag(kind), nullptr);
        if (!gerr)
            return true;
        err = gerr->message;
        g_error_free(gerr);
        return false;
    }

    std::string backendName() const override { return "libsecret"; }
};

} // namespace

std::unique_ptr<SecretVault> createPlatformVault() {
    return std::make_unique<LibsecretVault>();
}

} // namespace rdpvisor

#else // no secure backend on this platform

namespace rdpvisor {
namespace {

class UnavailableVault : public SecretVault {
public:
    PersistResult store(const VaultItem &item) override {
        (void)item;
        return {PersistStatus::Unavailable,
                "No secure secret store available on this platform"};
    }

    bool remove(const std::string &target, CredentialKind kind,
                std::string &err) override {
        (void)target;
        (void)kind;
        (void)err;
        return true;
    }

    std::string backendName() const override { return "unavailable"; }
};

} // namespace

std::unique_ptr<SecretVault> createPlatformVault() {
    qCWarning(rvVault) << "No secure secret store backend compiled in;"
                       << "credentials will not be vaulted";
    return std::make_unique<UnavailableVault>();
}

} // namespace rdpvisor

#endif
