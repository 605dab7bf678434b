// Orchestrates a connect action: entry selection, credential resolution,
// duplicate checks and one supervised session per target.
#pragma once
#include "ClientProcess.hpp"
#include "CredentialResolver.hpp"
#include "EntryProvider.hpp"
#include "LaunchSupport.hpp"
#include "ProcessSupervisor.hpp"
#include "SecretVault.hpp"
#include "SessionRegistry.hpp"
#include "UserInteraction.hpp"
#include "VaultCoordinator.hpp"
#include "WindowAutomation.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace rdpvisor {

struct ConnectRequest {
    std::vector<std::string> entryIds;  // selection, in display order
    bool useCredentials = false;
    bool forceAdmin = false;
};

struct ConnectReport {
    int launched = 0;
    int skipped = 0;
    int parseFailures = 0;
    std::vector<std::string> sessionKeys;  // keys of launched sessions
};

struct ManagerOptions {
    // Both factories run on the session thread.
    std::function<std::unique_ptr<ClientProcess>()> processFactory =
        createDesktopProcess;
    std::function<std::unique_ptr<WindowAutomation>()> automationFactory =
        createDesktopAutomation;
    std::shared_ptr<CommandBuilder> commandBuilder;  // null = mstsc
    ActivationPolicy activation = ActivationPolicy::DefaultActionWithFallback;
    bool startReaper = true;
    std::chrono::milliseconds drainTimeout = std::chrono::seconds(10);
};

class ConnectionManager {
public:
    // provider, vault and prompter are borrowed; picker may be null, in
    // which case several candidates resolve to none.
    ConnectionManager(const EntryProvider &provider, SecretVault &vault,
                      Prompter &prompter, CredentialPicker *picker,
                      Config config, ManagerOptions options = {});
    // Cancels and awaits every session it started.
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager &) = delete;
    ConnectionManager &operator=(const ConnectionManager &) = delete;

    // Runs on the UI thread; prompts block it. Sessions run in the
    // background once launched.
    ConnectReport connect(const ConnectRequest &req);

    void cancelAll();
    bool waitForSessions(std::optional<std::chrono::milliseconds> timeout);

    // Target entry id, suffixed with "-<credential entry id>" when the
    // session carries a resolved credential.
    static std::string sessionKey(const std::string &targetEntryId,
                                  const std::string &credentialEntryId);

    std::optional<SupervisorOutcome> lastOutcome(const std::string &key) const;

    SessionRegistry &registry() { return registry_; }
    VaultCoordinator &vault() { return coordinator_; }
    const Config &config() const { return config_; }

private:
    // Credential chosen for a group of selected entries. skipGroup is set
    // when the picker was cancelled or nothing usable exists.
    std::optional<EntryRecord>
    resolveGroupCredential(const std::vector<EntryRecord> &group, bool &skipGroup);
    std::vector<CredentialCandidate>
    collectCandidates(const std::vector<EntryRecord> &participants);
    bool showsInPicker(const EntryRecord &e, const EntrySettings &s) const;
    void launchEntry(const EntryRecord &e, const ConnectRequest &req,
                     const std::optional<EntryRecord> &chosen, int totalCount,
                     ConnectReport &report);
    void startSession(const std::string &key, LaunchSpec spec,
                      std::shared_ptr<Credential> cred,
                      std::shared_ptr<ConnectionDescriptorFile> descriptor,
                      SupervisorPolicy policy);
    void recordOutcome(const std::string &key, SupervisorOutcome outcome);

    const EntryProvider &provider_;
    Prompter &prompter_;
    CredentialPicker *picker_;
    Config config_;
    ManagerOptions options_;
    CredentialResolver resolver_;
    VaultCoordinator coordinator_;
    SessionRegistry registry_;

    mutable std::mutex mtx_;  // protects launched_ and outcomes_
    std::vector<std::shared_ptr<SessionTask>> launched_;
    std::map<std::string, SupervisorOutcome> outcomes_;
};

// "<host>\<user>", dropping any domain prefix of user.
std::string forceLocalUser(const std::string &username, const std::string &host);

} // namespace rdpvisor
