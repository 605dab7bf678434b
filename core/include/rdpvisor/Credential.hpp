// Ephemeral credential handed to the OS secret store for one session.
#pragma once
#include "SessionTypes.hpp"

#include <chrono>
#include <string>

namespace rdpvisor {

// Owning string that scrubs its buffer on destruction and on wipe().
class SecretString {
public:
    SecretString() = default;
    explicit SecretString(std::string value) : value_(std::move(value)) {}
    ~SecretString() { wipe(); }

    SecretString(const SecretString &) = delete;
    SecretString &operator=(const SecretString &) = delete;
    SecretString(SecretString &&other) noexcept;
    SecretString &operator=(SecretString &&other) noexcept;

    const std::string &view() const { return value_; }
    bool empty() const { return value_.empty(); }
    void wipe();

private:
    std::string value_;
};

// Scrubs any std::string holding secret material.
void secureClear(std::string &s);

class Credential {
public:
    using Clock = std::chrono::steady_clock;

    Credential(std::string username, SecretString secret, std::string host,
               CredentialKind kind, int ttlSeconds);
    ~Credential();

    Credential(const Credential &) = delete;
    Credential &operator=(const Credential &) = delete;

    const std::string &username() const { return username_; }
    const std::string &host() const { return host_; }
    CredentialKind kind() const { return kind_; }

    // Secret-store target name, "TERMSRV/<host>".
    std::string target() const;

    // Empty once disposed.
    const std::string &secret() const;

    int configuredTtlSeconds() const { return configuredTtl_; }
    int ttlSeconds() const { return ttl_; }
    Clock::time_point expiresAt() const { return expiresAt_; }

    // Starts the expiry clock with the configured TTL.
    void arm(Clock::time_point now);
    // Pushes expiry forward; ignored for non-positive deltas.
    bool extend(std::chrono::seconds delta);
    // Back to the configured TTL, measured from now.
    void reset(Clock::time_point now);

    // Wipes the secret. Further reads return an empty string.
    void dispose();
    bool disposed() const { return disposed_; }

private:
    std::string username_;
    SecretString secret_;
    std::string host_;
    CredentialKind kind_;
    int configuredTtl_ = 0;
    int ttl_ = 0;
    Clock::time_point expiresAt_{};
    bool disposed_ = false;
};

} // namespace rdpvisor
