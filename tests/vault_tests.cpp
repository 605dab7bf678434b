#include "TestSupport.hpp"
#include "rdpvisor/Credential.hpp"
#include "rdpvisor/MockSecretVault.hpp"
#include "rdpvisor/RuntimeLogging.hpp"
#include "rdpvisor/VaultCoordinator.hpp"

#include <QtGlobal>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>

using testsupport::TestContext;
using testsupport::eventually;
using namespace std::chrono_literals;

namespace {

using rdpvisor::Credential;
using rdpvisor::CredentialKind;
using rdpvisor::MockSecretVault;
using rdpvisor::SecretString;
using rdpvisor::VaultConfig;
using rdpvisor::VaultCoordinator;

VaultConfig vaultConfig(int ttl, bool adaptive) {
    VaultConfig c;
    c.ttlSeconds = ttl;
    c.adaptiveTtl = adaptive;
    return c;
}

Credential makeCredential(const std::string &host, int ttl,
                          CredentialKind kind = CredentialKind::DomainPassword) {
    return Credential("alice", SecretString("s3cret"), host, kind, ttl);
}

void test_increment_derivation(TestContext &t) {
    MockSecretVault vault;
    t.check(VaultCoordinator(vault, vaultConfig(10, true)).ttlIncrement() == 5s,
            "half of an even ttl");
    t.check(VaultCoordinator(vault, vaultConfig(7, true)).ttlIncrement() == 4s,
            "odd ttl rounds the half up");
    t.check(VaultCoordinator(vault, vaultConfig(1, true)).ttlIncrement() == 1s,
            "increment is at least one second");
    t.check(VaultCoordinator(vault, vaultConfig(10, false)).ttlIncrement() == 0s,
            "no increment without adaptive ttl");
    t.check(VaultCoordinator(vault, vaultConfig(0, true)).ttlIncrement() == 0s,
            "no increment for a non-expiring ttl");
}

void test_register_stores_and_arms(TestContext &t) {
    MockSecretVault vault;
    VaultCoordinator coord(vault, vaultConfig(10, true));
    Credential cred = makeCredential("srv01", 10);

    const auto before = Credential::Clock::now();
    t.check(coord.registerCredential(cred), "register succeeds");
    t.check(vault.contains("TERMSRV/srv01", CredentialKind::DomainPassword),
            "entry written under TERMSRV/<host>");
    t.check(coord.isTracked(cred), "entry tracked");
    t.check(cred.expiresAt() >= before + 10s, "expiry armed from now");
    t.check(cred.secret() == "s3cret", "secret still readable while vaulted");
}

void test_register_failure_is_not_fatal(TestContext &t) {
    MockSecretVault vault;
    vault.setFailStores(true);
    VaultCoordinator coord(vault, vaultConfig(10, true));
    Credential cred = makeCredential("srv01", 10);

    t.check(!coord.registerCredential(cred), "failed store reported");
    t.check(!coord.isTracked(cred), "failed entry not tracked");
    t.check(!cred.disposed(), "credential stays usable");
    t.check(vault.size() == 0, "nothing stored");
}

void test_extend_strictly_increases(TestContext &t) {
    MockSecretVault vault;
    VaultCoordinator coord(vault, vaultConfig(10, true));
    Credential cred = makeCredential("srv01", 10);
    coord.registerCredential(cred);

    auto last = cred.expiresAt();
    for (int i = 0; i < 3; ++i) {
        t.check(coord.extendTtl(cred, coord.ttlIncrement()), "extend accepted");
        t.check(cred.expiresAt() > last, "each extension moves expiry forward");
        last = cred.expiresAt();
    }
    t.check(cred.ttlSeconds() == 25, "ttl grew by three increments");
    t.check(!coord.extendTtl(cred, 0s), "zero delta is a no-op");
    t.check(!coord.extendTtl(cred, -3s), "negative delta is a no-op");
    t.check(cred.expiresAt() == last, "expiry unchanged by no-ops");
}

void test_reset_restores_configured_ttl(TestContext &t) {
    MockSecretVault vault;
    VaultCoordinator coord(vault, vaultConfig(10, true));
    Credential cred = makeCredential("srv01", 10);
    coord.registerCredential(cred);
    coord.extendTtl(cred, 5s);
    coord.extendTtl(cred, 5s);

    const auto before = Credential::Clock::now();
    coord.resetTtl(cred);
    const auto after = Credential::Clock::now();
    t.check(cred.ttlSeconds() == 10, "reset restores the configured ttl");
    t.check(cred.configuredTtlSeconds() == 10, "configured ttl untouched");
    t.check(cred.expiresAt() >= before + 10s && cred.expiresAt() <= after + 10s,
            "expiry measured from the reset, not the extended value");
}

void test_withdraw_removes_and_wipes(TestContext &t) {
    MockSecretVault vault;
    VaultCoordinator coord(vault, vaultConfig(10, true));
    Credential cred = makeCredential("srv01", 10);
    coord.registerCredential(cred);

    coord.withdraw(cred);
    t.check(vault.size() == 0, "entry removed from the store");
    t.check(!coord.isTracked(cred), "entry no longer tracked");
    t.check(cred.disposed(), "credential disposed");
    t.check(cred.secret().empty(), "secret unreadable after disposal");
    t.check(!coord.extendTtl(cred, 5s), "disposed credential cannot be extended");
    t.check(!coord.registerCredential(cred), "disposed credential cannot be vaulted");
}

void test_sweep_removes_expired_only(TestContext &t) {
    MockSecretVault vault;
    VaultCoordinator coord(vault, vaultConfig(10, false));
    Credential shortLived = makeCredential("srv01", 10);
    Credential longLived = makeCredential("srv02", 100);
    Credential forever = makeCredential("srv03", 0, CredentialKind::Generic);
    coord.registerCredential(shortLived);
    coord.registerCredential(longLived);
    coord.registerCredential(forever);

    const auto now = Credential::Clock::now();
    t.check(coord.sweepExpired(now) == 0, "nothing expired yet");
    t.check(coord.sweepExpired(now + 50s) == 1, "short-lived entry expires");
    t.check(!vault.contains("TERMSRV/srv01", CredentialKind::DomainPassword),
            "expired entry removed from the store");
    t.check(vault.contains("TERMSRV/srv02", CredentialKind::DomainPassword),
            "unexpired entry kept");
    t.check(coord.sweepExpired(now + 24h) == 1, "long-lived entry expires later");
    t.check(vault.contains("TERMSRV/srv03", CredentialKind::Generic),
            "ttl 0 never expires");
    t.check(coord.trackedCount() == 1, "only the non-expiring entry tracked");
}

void test_reaper_sweeps_in_background(TestContext &t) {
    MockSecretVault vault;
    VaultCoordinator coord(vault, vaultConfig(1, false));
    Credential cred = makeCredential("srv01", 1);
    coord.registerCredential(cred);

    coord.startReaper(20ms);
    t.check(eventually([&] { return vault.size() == 0; }, 5000ms),
            "reaper removes the expired entry");
    coord.stopReaper();
    t.check(!coord.isTracked(cred), "reaped entry untracked");
}

void test_secret_string_moves_and_wipes(TestContext &t) {
    SecretString a("pw");
    SecretString b(std::move(a));
    t.check(a.empty(), "moved-from secret is empty");
    t.check(b.view() == "pw", "moved-to secret holds the value");
    b.wipe();
    t.check(b.empty(), "wipe clears the value");

    std::string raw = "plain";
    rdpvisor::secureClear(raw);
    t.check(raw.empty(), "secureClear empties the string");
}

void test_usernames_redacted_outside_dev(TestContext &t) {
    qputenv("RDPVISOR_ENV", "prod");
    qputenv("RDPVISOR_LOG_SENSITIVE", "1");
    t.check(rdpvisor::redactedUser("CORP\\admin") == "<redacted>",
            "redacted outside a dev environment");
    t.check(rdpvisor::redactedUser("").empty(), "empty stays empty");

    qputenv("RDPVISOR_ENV", "  Dev ");
    t.check(rdpvisor::isDevEnvironment(), "env value trimmed and lower-cased");
    t.check(rdpvisor::redactedUser("CORP\\admin") == "CORP\\admin",
            "shown when dev and opted in");

    qputenv("RDPVISOR_LOG_SENSITIVE", "off");
    t.check(!rdpvisor::sensitiveLoggingEnabled(), "opt-in flag required");
    qunsetenv("RDPVISOR_ENV");
    qunsetenv("RDPVISOR_LOG_SENSITIVE");
}

} // namespace

int main() {
    TestContext t;
    test_increment_derivation(t);
    test_register_stores_and_arms(t);
    test_register_failure_is_not_fatal(t);
    test_extend_strictly_increases(t);
    test_reset_restores_configured_ttl(t);
    test_withdraw_removes_and_wipes(t);
    test_sweep_removes_expired_only(t);
    test_reaper_sweeps_in_background(t);
    test_secret_string_moves_and_wipes(t);
    test_usernames_redacted_outside_dev(t);

    if (t.failures > 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] vault_tests\n";
    return EXIT_SUCCESS;
}
