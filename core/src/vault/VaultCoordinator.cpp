// Credential lifetime bookkeeping on top of a SecretVault backend.
#include "rdpvisor/VaultCoordinator.hpp"
#include "rdpvisor/RuntimeLogging.hpp"

#include <QLoggingCategory>

#include <algorithm>
#include <cmath>
#include <vector>

Q_LOGGING_CATEGORY(rvCoord, "rdpvisor.vault")

namespace rdpvisor {

static std::chrono::seconds deriveIncrement(const VaultConfig &config) {
    if (config.ttlSeconds <= 0 || !config.adaptiveTtl)
        return std::chrono::seconds(0);
    const double half = std::max(1.0, config.ttlSeconds / 2.0);
    return std::chrono::seconds(static_cast<long long>(std::ceil(half)));
}

VaultCoordinator::VaultCoordinator(SecretVault &vault,
                                   const VaultConfig &config)
    : vault_(vault), config_(config), increment_(deriveIncrement(config)) {
    if (config_.ttlSeconds < 0)
        config_.ttlSeconds = 0;
}

VaultCoordinator::~VaultCoordinator() { stopReaper(); }

VaultCoordinator::Key VaultCoordinator::keyOf(const Credential &cred) {
    return {cred.target(), cred.kind()};
}

bool VaultCoordinator::registerCredential(Credential &cred) {
    if (cred.disposed()) {
        qCWarning(rvCoord) << "register skipped; credential already disposed";
        return false;
    }
    const auto now = Clock::now();
    cred.arm(now);

    VaultItem item;
    item.target = cred.target();
    item.kind = cred.kind();
    item.username = cred.username();
    item.secret = &cred.secret();
    const SecretVault::PersistResult r = vault_.store(item);
    if (!r.ok()) {
        qCWarning(rvCoord) << "register failed"
                           << "backend=" << vault_.backendName().c_str()
                           << "status=" << persistStatusName(r.status)
                           << "detail=" << r.detail.c_str();
        return false;
    }

    {
        std::lock_guard<std::mutex> lk(mtx_);
        Tracked &t = tracked_[keyOf(cred)];
        t.expires = cred.configuredTtlSeconds() > 0;
        t.expiresAt = cred.expiresAt();
    }
    qCInfo(rvCoord) << "registered"
                    << "target=" << redactedUser(cred.target()).c_str()
                    << "user=" << redactedUser(cred.username()).c_str()
                    << "ttl=" << cred.ttlSeconds();
    return true;
}

bool VaultCoordinator::extendTtl(Credential &cred, std::chrono::seconds delta) {
    if (cred.disposed() || !cred.extend(delta))
        return false;
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = tracked_.find(keyOf(cred));
    if (it != tracked_.end())
        it->second.expiresAt = cred.expiresAt();
    qCDebug(rvCoord) << "ttl extended" << "ttl=" << cred.ttlSeconds();
    return true;
}

void VaultCoordinator::resetTtl(Credential &cred) {
    cred.reset(Clock::now());
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = tracked_.find(keyOf(cred));
    if (it != tracked_.end())
        it->second.expiresAt = cred.expiresAt();
    qCDebug(rvCoord) << "ttl reset" << "ttl=" << cred.ttlSeconds();
}

void VaultCoordinator::withdraw(Credential &cred) {
    const Key key = keyOf(cred);
    {
        std::lock_guard<std::mutex> lk(mtx_);
        tracked_.erase(key);
    }
    removeFromVault(key);
    cred.dispose();
}

void VaultCoordinator::removeFromVault(const Key &key) {
    std::string err;
    if (!vault_.remove(key.first, key.second, err)) {
        qCWarning(rvCoord) << "remove failed"
                           << "backend=" << vault_.backendName().c_str()
                           << "detail=" << err.c_str();
    }
}

int VaultCoordinator::sweepExpired(Clock::time_point now) {
    std::vector<Key> expired;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        for (auto it = tracked_.begin(); it != tracked_.end();) {
            if (it->second.expires && it->second.expiresAt <= now) {
                expired.push_back(it->first);
                it = tracked_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (const Key &key : expired)
        removeFromVault(key);
    if (!expired.empty())
        qCInfo(rvCoord) << "expired entries removed" << "count=" << expired.size();
    return static_cast<int>(expired.size());
}

bool VaultCoordinator::isTracked(const Credential &cred) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return tracked_.count(keyOf(cred)) > 0;
}

std::size_t VaultCoordinator::trackedCount() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return tracked_.size();
}

void VaultCoordinator::startReaper(std::chrono::milliseconds interval) {
    if (reaper_.joinable())
        return;
    reaperStop_ = false;
    reaper_ = std::thread([this, interval] {
        std::unique_lock<std::mutex> lk(reaperMutex_);
        while (!reaperStop_.load()) {
            reaperCv_.wait_for(lk, interval,
                               [this] { return reaperStop_.load(); });
            if (reaperStop_.load())
                break;
            lk.unlock();
            sweepExpired(Clock::now());
            lk.lock();
        }
    });
}

void VaultCoordinator::stopReaper() {
    {
        std::lock_guard<std::mutex> lk(reaperMutex_);
        reaperStop_ = true;
    }
    reaperCv_.notify_all();
    if (reaper_.joinable())
        reaper_.join();
}

} // namespace rdpvisor
