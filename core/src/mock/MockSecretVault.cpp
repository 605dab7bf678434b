#include "rdpvisor/MockSecretVault.hpp"

namespace rdpvisor {

SecretVault::PersistResult MockSecretVault::store(const VaultItem &item) {
  std::lock_guard<std::mutex> lk(mtx_);
  ++storeCalls_;
  if (failStores_)
    return { PersistStatus::BackendError, "mock store failure" };
  if (item.target.empty())
    return { PersistStatus::BackendError, "empty target" };
  Record r;
  r.username = item.username;
  if (item.secret) r.secret = *item.secret;
  items_[{item.target, item.kind}] = r;
  return { PersistStatus::Stored, std::string() };
}

bool MockSecretVault::remove(const std::string& target, CredentialKind kind,
                             std::string& err) {
  std::lock_guard<std::mutex> lk(mtx_);
  ++removeCalls_;
  if (target.empty()) {
    err = "empty target";
    return false;
  }
  items_.erase({target, kind});
  return true;
}

bool MockSecretVault::contains(const std::string& target,
                               CredentialKind kind) const {
  std::lock_guard<std::mutex> lk(mtx_);
  return items_.count({target, kind}) > 0;
}

std::optional<MockSecretVault::Record>
MockSecretVault::find(const std::string& target, CredentialKind kind) const {
  std::lock_guard<std::mutex> lk(mtx_);
  auto it = items_.find({target, kind});
  if (it == items_.end()) return std::nullopt;
  return it->second;
}

std::size_t MockSecretVault::size() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return items_.size();
}

int MockSecretVault::storeCalls() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return storeCalls_;
}

int MockSecretVault::removeCalls() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return removeCalls_;
}

} // namespace rdpvisor
