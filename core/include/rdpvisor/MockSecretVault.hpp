#pragma once
#include "SecretVault.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <utility>

namespace rdpvisor {

// In-memory vault with switchable failure modes.
class MockSecretVault : public SecretVault {
public:
    struct Record {
        std::string username;
        std::string secret;
    };

    PersistResult store(const VaultItem &item) override;
    bool remove(const std::string &target, CredentialKind kind,
                std::string &err) override;
    std::string backendName() const override { return "mock"; }

    void setFailStores(bool fail) { failStores_ = fail; }

    bool contains(const std::string &target, CredentialKind kind) const;
    std::optional<Record> find(const std::string &target,
                               CredentialKind kind) const;
    std::size_t size() const;
    int storeCalls() const;
    int removeCalls() const;

private:
    using Key = std::pair<std::string, CredentialKind>;

    mutable std::mutex mtx_;
    std::map<Key, Record> items_;
    bool failStores_ = false;
    int storeCalls_ = 0;
    int removeCalls_ = 0;
};

} // namespace rdpvisor
