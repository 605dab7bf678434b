// Minimal abstraction over the OS secret store that remote-desktop clients
// read credentials from. Backends: Windows Credential Manager, libsecret
// (Secret Service) and the macOS Keychain.
#pragma once
#include "SessionTypes.hpp"

#include <memory>
#include <string>

namespace rdpvisor {

struct VaultItem {
    std::string target;  // "TERMSRV/<host>"
    CredentialKind kind = CredentialKind::Generic;
    std::string username;
    const std::string *secret = nullptr;  // borrowed, never copied
};

class SecretVault {
public:
    enum class PersistStatus {
        Stored,
        Unavailable,
        PermissionDenied,
        BackendError
    };

    struct PersistResult {
        PersistStatus status = PersistStatus::BackendError;
        std::string detail;

        bool ok() const { return status == PersistStatus::Stored; }
    };

    virtual ~SecretVault() = default;

    // Creates or overwrites the entry keyed by (target, kind).
    virtual PersistResult store(const VaultItem &item) = 0;

    // Removes the entry; a missing entry is not an error.
    virtual bool remove(const std::string &target, CredentialKind kind,
                        std::string &err) = 0;

    virtual std::string backendName() const = 0;
};

// Backend for the platform this binary was built for.
std::unique_ptr<SecretVault> createPlatformVault();

const char *persistStatusName(SecretVault::PersistStatus st);

} // namespace rdpvisor
