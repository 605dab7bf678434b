// Registers, extends and withdraws ephemeral credentials in the OS secret
// store on behalf of running sessions.
#pragma once
#include "Credential.hpp"
#include "SecretVault.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>
#include <utility>

namespace rdpvisor {

class VaultCoordinator {
public:
    using Clock = Credential::Clock;

    // The vault is not owned and must outlive the coordinator.
    VaultCoordinator(SecretVault &vault, const VaultConfig &config);
    ~VaultCoordinator();

    VaultCoordinator(const VaultCoordinator &) = delete;
    VaultCoordinator &operator=(const VaultCoordinator &) = delete;

    // Best-effort write. Returns false when the credential could not be
    // vaulted; the caller proceeds without it.
    bool registerCredential(Credential &cred);

    // Pushes expiry forward by delta. Strictly increases expiry for
    // positive deltas; no-op otherwise.
    bool extendTtl(Credential &cred, std::chrono::seconds delta);

    // Restores the configured TTL (never the extended one).
    void resetTtl(Credential &cred);

    // Removes the entry now and wipes the secret.
    void withdraw(Credential &cred);

    // Adaptive increment derived from the configured TTL; zero when
    // adaptive TTL is off or the TTL is zero.
    std::chrono::seconds ttlIncrement() const { return increment_; }

    // Removes every tracked entry whose expiry lies before now.
    int sweepExpired(Clock::time_point now);

    bool isTracked(const Credential &cred) const;
    std::size_t trackedCount() const;

    // Background expiry sweeps (once per interval). Off by default so tests
    // stay deterministic.
    void startReaper(std::chrono::milliseconds interval =
                         std::chrono::milliseconds(1000));
    void stopReaper();

private:
    struct Tracked {
        Clock::time_point expiresAt{};
        bool expires = false;
    };
    using Key = std::pair<std::string, CredentialKind>;

    static Key keyOf(const Credential &cred);
    void removeFromVault(const Key &key);

    SecretVault &vault_;
    VaultConfig config_;
    std::chrono::seconds increment_{0};

    mutable std::mutex mtx_;  // protects tracked_
    std::map<Key, Tracked> tracked_;

    std::thread reaper_;
    std::mutex reaperMutex_;
    std::condition_variable reaperCv_;
    std::atomic<bool> reaperStop_{false};
};

} // namespace rdpvisor
