#include "rdpvisor/Credential.hpp"

#include <algorithm>

namespace rdpvisor {

// Best-effort memory scrubbing for sensitive data
void secureClear(std::string &s) {
    if (s.empty())
        return;
    volatile char *p = reinterpret_cast<volatile char *>(&s[0]);
    for (std::size_t i = 0; i < s.size(); ++i)
        p[i] = 0;
    s.clear();
    s.shrink_to_fit();
}

SecretString::SecretString(SecretString &&other) noexcept
    : value_(std::move(other.value_)) {
    other.value_.clear();
}

SecretString &SecretString::operator=(SecretString &&other) noexcept {
    if (this != &other) {
        wipe();
        value_ = std::move(other.value_);
        other.value_.clear();
    }
    return *this;
}

void SecretString::wipe() { secureClear(value_); }

Credential::Credential(std::string username, SecretString secret,
                       std::string host, CredentialKind kind, int ttlSeconds)
    : username_(std::move(username)), secret_(std::move(secret)),
      host_(std::move(host)), kind_(kind),
      configuredTtl_(std::max(0, ttlSeconds)), ttl_(configuredTtl_) {}

Credential::~Credential() { dispose(); }

std::string Credential::target() const { return "TERMSRV/" + host_; }

const std::string &Credential::secret() const {
    static const std::string kEmpty;
    return disposed_ ? kEmpty : secret_.view();
}

void Credential::arm(Clock::time_point now) {
    ttl_ = configuredTtl_;
    expiresAt_ = now + std::chrono::seconds(ttl_);
}

bool Credential::extend(std::chrono::seconds delta) {
    if (delta.count() <= 0)
        return false;
    ttl_ += static_cast<int>(delta.count());
    expiresAt_ += delta;
    return true;
}

void Credential::reset(Clock::time_point now) { arm(now); }

void Credential::dispose() {
    if (disposed_)
        return;
    secret_.wipe();
    disposed_ = true;
}

} // namespace rdpvisor
