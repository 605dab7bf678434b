// Connect action: selection grouping, picker, credential assembly and
// session launch.
#include "rdpvisor/ConnectionManager.hpp"
#include "rdpvisor/RuntimeLogging.hpp"

#include <QLoggingCategory>

#include <algorithm>
#include <set>

Q_LOGGING_CATEGORY(rvSession, "rdpvisor.session")

namespace rdpvisor {

static const char *kAppName = "RdpVisor";

std::string forceLocalUser(const std::string &username, const std::string &host) {
    const std::size_t slash = username.find_last_of('\\');
    const std::string bare =
        slash == std::string::npos ? username : username.substr(slash + 1);
    return host + "\\" + bare;
}

std::string ConnectionManager::sessionKey(const std::string &targetEntryId,
                                          const std::string &credentialEntryId) {
    if (credentialEntryId.empty())
        return targetEntryId;
    return targetEntryId + "-" + credentialEntryId;
}

ConnectionManager::ConnectionManager(const EntryProvider &provider,
                                     SecretVault &vault, Prompter &prompter,
                                     CredentialPicker *picker, Config config,
                                     ManagerOptions options)
    : provider_(provider), prompter_(prompter), picker_(picker),
      config_(std::move(config)), options_(std::move(options)),
      resolver_(provider), coordinator_(vault, config_.vault),
      registry_(options_.drainTimeout) {
    if (!options_.commandBuilder)
        options_.commandBuilder = std::make_shared<MstscCommandBuilder>();
    if (options_.startReaper)
        coordinator_.startReaper();
}

ConnectionManager::~ConnectionManager() {
    cancelAll();
    std::vector<std::shared_ptr<SessionTask>> tasks;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        tasks.swap(launched_);
    }
    // Sessions reference the registry and the coordinator until they end.
    for (const auto &t : tasks) {
        t->cancel();
        t->wait(std::nullopt);
    }
    coordinator_.stopReaper();
}

void ConnectionManager::cancelAll() { registry_.cancelAll(); }

bool ConnectionManager::waitForSessions(
    std::optional<std::chrono::milliseconds> timeout) {
    return registry_.waitAll(timeout);
}

std::optional<SupervisorOutcome>
ConnectionManager::lastOutcome(const std::string &key) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = outcomes_.find(key);
    if (it == outcomes_.end())
        return std::nullopt;
    return it->second;
}

void ConnectionManager::recordOutcome(const std::string &key,
                                      SupervisorOutcome outcome) {
    std::lock_guard<std::mutex> lk(mtx_);
    outcomes_[key] = outcome;
}

bool ConnectionManager::showsInPicker(const EntryRecord &e,
                                      const EntrySettings &s) const {
    if (!s.useCredPicker)
        return false;
    return !s.includeGroups.empty() ||
           resolver_.findCredentialRoot(e.id, config_.picker.customGroup).has_value();
}

ConnectReport ConnectionManager::connect(const ConnectRequest &req) {
    ConnectReport report;

    // Selected entries with a target, grouped by parent group in order of
    // first appearance.
    std::vector<std::vector<EntryRecord>> groups;
    std::map<std::string, std::size_t> groupIndex;
    std::set<std::string> seen;
    for (const std::string &id : req.entryIds) {
        if (!seen.insert(id).second)
            continue;
        std::optional<EntryRecord> e = provider_.entry(id);
        if (!e || e->url.empty()) {
            ++report.skipped;
            continue;
        }
        auto it = groupIndex.find(e->groupId);
        if (it == groupIndex.end()) {
            groupIndex[e->groupId] = groups.size();
            groups.push_back({std::move(*e)});
        } else {
            groups[it->second].push_back(std::move(*e));
        }
    }

    if (!config_.connectToAll && !groups.empty()) {
        std::vector<EntryRecord> last{groups.back().back()};
        groups.clear();
        groups.push_back(std::move(last));
    }

    int totalCount = 0;
    for (const auto &g : groups)
        totalCount += static_cast<int>(g.size());
    qCInfo(rvSession) << "connect requested"
                      << "entries=" << totalCount
                      << "selected=" << req.entryIds.size()
                      << "credentials=" << req.useCredentials;

    for (const auto &group : groups) {
        std::optional<EntryRecord> chosen;
        if (req.useCredentials) {
            bool skipGroup = false;
            chosen = resolveGroupCredential(group, skipGroup);
            if (skipGroup) {
                report.skipped += static_cast<int>(group.size());
                continue;
            }
        }
        for (const EntryRecord &e : group)
            launchEntry(e, req, chosen, totalCount, report);
    }
    return report;
}

std::vector<CredentialCandidate>
ConnectionManager::collectCandidates(const std::vector<EntryRecord> &participants) {
    std::vector<CredentialCandidate> all;
    std::set<std::string> ids;
    for (const EntryRecord &e : participants) {
        const EntrySettings s = loadEntrySettings(provider_, e.id);
        CrawlRequest crawl;
        if (auto root = resolver_.findCredentialRoot(e.id, config_.picker.customGroup))
            crawl.rootGroup = *root;
        crawl.includeGroups = s.includeGroups;
        crawl.excludeGroups = s.excludeGroups;
        crawl.recurse = s.recurseGroups;
        crawl.patterns = s.regexPatterns;

        const ResolveResult r = resolver_.resolve(crawl);
        if (!r.ok()) {
            qCWarning(rvSession) << "credential crawl rejected"
                                 << "entry=" << e.id.c_str()
                                 << "status=" << resolveStatusName(r.status)
                                 << "detail=" << r.detail.c_str();
            continue;
        }
        for (const CredentialCandidate &c : r.candidates) {
            if (ids.insert(c.entryId).second)
                all.push_back(c);
        }
    }

    if (config_.picker.includeSelected) {
        for (const EntryRecord &e : participants) {
            if (!ids.insert(e.id).second)
                continue;
            CredentialCandidate c;
            c.entryId = e.id;
            c.groupId = e.groupId;
            c.ignored = loadEntrySettings(provider_, e.id).ignore;
            all.push_back(std::move(c));
        }
    }
    return all;
}

std::optional<EntryRecord>
ConnectionManager::resolveGroupCredential(const std::vector<EntryRecord> &group,
                                          bool &skipGroup) {
    skipGroup = false;
    std::vector<EntryRecord> participants;
    for (const EntryRecord &e : group) {
        if (showsInPicker(e, loadEntrySettings(provider_, e.id)))
            participants.push_back(e);
    }
    if (participants.empty())
        return std::nullopt;

    const std::vector<CredentialCandidate> candidates = collectCandidates(participants);
    std::optional<std::string> chosenId;
    switch (chooseCandidate(candidates)) {
    case CandidateChoice::None:
        break;
    case CandidateChoice::AutoSelect:
        if (!candidates.front().ignored)
            chosenId = candidates.front().entryId;
        break;
    case CandidateChoice::Pick: {
        if (!picker_) {
            qCWarning(rvSession) << "several credentials but no picker"
                                 << "candidates=" << candidates.size();
            break;
        }
        std::vector<PickerItem> items;
        for (const CredentialCandidate &c : candidates) {
            std::optional<EntryRecord> ce = provider_.entry(c.entryId);
            if (!ce)
                continue;
            PickerItem item;
            item.entryId = ce->id;
            item.title = ce->title;
            item.username = ce->username;
            if (auto g = provider_.group(ce->groupId))
                item.groupName = g->name;
            items.push_back(std::move(item));
        }
        const PickResult pr = picker_->pick(items);
        if (pr.status == PickResult::Status::Cancelled) {
            qCInfo(rvSession) << "credential picker cancelled, group skipped";
            skipGroup = true;
            return std::nullopt;
        }
        if (pr.status == PickResult::Status::Chosen) {
            auto it = std::find_if(candidates.begin(), candidates.end(),
                                   [&](const CredentialCandidate &c) {
                                       return c.entryId == pr.entryId;
                                   });
            if (it != candidates.end() && !it->ignored)
                chosenId = it->entryId;
        }
        break;
    }
    }

    if (chosenId) {
        if (std::optional<EntryRecord> ce = provider_.entry(*chosenId))
            return ce;
    }

    // Nothing chosen: the entries' own credentials are the fallback, which
    // needs at least one username.
    const bool anyUser =
        std::any_of(group.begin(), group.end(),
                    [](const EntryRecord &e) { return !e.username.empty(); });
    if (!anyUser) {
        qCInfo(rvSession) << "no credential available, group skipped";
        skipGroup = true;
    }
    return std::nullopt;
}

void ConnectionManager::launchEntry(const EntryRecord &e,
                                    const ConnectRequest &req,
                                    const std::optional<EntryRecord> &chosen,
                                    int totalCount, ConnectReport &report) {
    TargetAddress target;
    std::string err;
    if (!parseTarget(e.url, target, err)) {
        qCWarning(rvSession) << "target not parsed" << "entry=" << e.id.c_str();
        PromptRequest p;
        p.title = std::string(kAppName) + " - Error";
        p.message = "The URL/target '" + e.url +
                    "' of the selected entry could not be parsed.";
        p.icon = PromptIcon::Error;
        prompter_.prompt(p);
        ++report.parseFailures;
        return;
    }

    const EntrySettings settings = loadEntrySettings(provider_, e.id);
    std::string key = e.id;
    std::shared_ptr<Credential> cred;

    if (req.useCredentials) {
        const bool shown = showsInPicker(e, settings);
        std::optional<EntryRecord> source;
        if (chosen && shown)
            source = chosen;
        else if (!settings.ignore)
            source = e;
        if (!source) {
            ++report.skipped;
            return;
        }
        key = sessionKey(e.id, source->id);

        if (source->username.empty()) {
            if (totalCount == 1) {
                PromptRequest p;
                p.title = kAppName;
                p.message = "Username is required when connecting with credentials.";
                p.icon = PromptIcon::Information;
                prompter_.prompt(p);
            }
            ++report.skipped;
            return;
        }

        std::string username = source->username;
        if (settings.forceLocalUser)
            username = forceLocalUser(username, target.host);
        cred = std::make_shared<Credential>(
            username, provider_.password(source->id), target.host,
            config_.vault.useWindowsVault ? CredentialKind::DomainPassword
                                          : CredentialKind::Generic,
            config_.vault.ttlSeconds);
    }

    if (req.useCredentials || config_.alwaysConfirm) {
        SessionRegistry::TaskPtr existing = registry_.tryGet(key);
        if (existing && !existing->isCompleted()) {
            PromptRequest p;
            p.title = kAppName;
            p.message = (req.useCredentials
                             ? "Already connected with the same credentials to URL/target '"
                             : "Already connected to URL/target '") +
                        target.host + "'.";
            p.detail = "Continue?";
            p.icon = PromptIcon::Question;
            p.buttons = {"Yes", "No"};
            p.defaultIndex = 0;
            if (prompter_.prompt(p) != 0) {
                qCInfo(rvSession) << "duplicate connection declined"
                                  << "key=" << key.c_str();
                ++report.skipped;
                return;
            }
        }
    }

    CommandRequest cmd;
    cmd.target = target;
    const ClientConfig &c = config_.client;
    if (settings.includeDefaultParameters) {
        cmd.admin = req.forceAdmin || c.useAdmin;
        cmd.restrictedAdmin = cmd.admin && c.useRestrictedAdmin;
        cmd.publicMode = c.usePublic;
        cmd.remoteGuard = c.useRemoteGuard;
        cmd.fullscreen = c.useFullscreen;
        cmd.span = c.useSpan;
        cmd.multimon = c.useMultimon;
        cmd.width = c.width;
        cmd.height = c.height;
    } else {
        cmd.admin = req.forceAdmin;
    }

    std::shared_ptr<ConnectionDescriptorFile> descriptor;
    if (settings.connectionDescriptor) {
        descriptor = std::make_shared<ConnectionDescriptorFile>();
        if (!descriptor->write(*settings.connectionDescriptor, err)) {
            qCWarning(rvSession) << "descriptor file failed"
                                 << "entry=" << e.id.c_str()
                                 << "detail=" << err.c_str();
            ++report.skipped;
            return;
        }
        cmd.descriptorPath = descriptor->path();
    }

    LaunchSpec spec = options_.commandBuilder->build(cmd);
    for (const std::string &param : settings.extraParameters) {
        if (!spec.arguments.empty())
            spec.arguments += ' ';
        spec.arguments += param;
    }
    if (spec.arguments.empty()) {
        qCInfo(rvSession) << "empty client arguments, entry skipped"
                          << "entry=" << e.id.c_str();
        ++report.skipped;
        return;
    }

    SupervisorPolicy policy;
    policy.autoConfirm = c.confirmCertificate;
    policy.adaptiveTtl = cred && config_.vault.adaptiveTtl &&
                         config_.vault.ttlSeconds > 0;
    policy.removeOnExit = cred && config_.vault.removeOnExit;
    policy.expectTrustPrompt = descriptor != nullptr;
    if (c.replaceTitle)
        policy.titleOverride =
            (e.title.empty() ? target.host : e.title) + " - " + kAppName;
    policy.activation = options_.activation;
    policy.automation = config_.automation;
    policy.timings = config_.timings;

    startSession(key, std::move(spec), std::move(cred), std::move(descriptor),
                 std::move(policy));
    ++report.launched;
    report.sessionKeys.push_back(key);
}

namespace {

// Descriptor disposal and registry bookkeeping at session end.
class SessionCleanup {
public:
    SessionCleanup(SessionRegistry &registry, std::string key,
                   std::shared_ptr<SessionTask> task,
                   std::shared_ptr<ConnectionDescriptorFile> descriptor)
        : registry_(registry), key_(std::move(key)), task_(std::move(task)),
          descriptor_(std::move(descriptor)) {}
    ~SessionCleanup() {
        if (descriptor_)
            descriptor_->dispose();
        registry_.remove(key_, task_);
        registry_.retire(task_);
    }
    SessionCleanup(const SessionCleanup &) = delete;
    SessionCleanup &operator=(const SessionCleanup &) = delete;

private:
    SessionRegistry &registry_;
    std::string key_;
    std::shared_ptr<SessionTask> task_;
    std::shared_ptr<ConnectionDescriptorFile> descriptor_;
};

} // namespace

void ConnectionManager::startSession(
    const std::string &key, LaunchSpec spec, std::shared_ptr<Credential> cred,
    std::shared_ptr<ConnectionDescriptorFile> descriptor, SupervisorPolicy policy) {
    auto task = std::make_shared<SessionTask>(key);
    if (SessionRegistry::TaskPtr previous = registry_.replace(key, task))
        registry_.retire(std::move(previous));
    {
        std::lock_guard<std::mutex> lk(mtx_);
        launched_.erase(std::remove_if(launched_.begin(), launched_.end(),
                                       [](const std::shared_ptr<SessionTask> &t) {
                                           return t->isCompleted();
                                       }),
                        launched_.end());
        launched_.push_back(task);
    }

    qCInfo(rvSession) << "session starting" << "key=" << key.c_str()
                      << "vaulted=" << (cred != nullptr)
                      << "user=" << (cred ? redactedUser(cred->username()).c_str() : "");

    task->start([this, key, spec = std::move(spec), cred = std::move(cred),
                 descriptor = std::move(descriptor),
                 policy = std::move(policy)](SessionTask &self) {
        SessionCleanup cleanup(registry_, key, self.shared_from_this(), descriptor);

        std::unique_ptr<ClientProcess> process = options_.processFactory();
        std::unique_ptr<WindowAutomation> automation = options_.automationFactory();
        if (!process || !automation) {
            qCCritical(rvSession) << "session backends unavailable" << "key=" << key.c_str();
            if (cred)
                cred->dispose();
            recordOutcome(key, SupervisorOutcome::SpawnFailed);
            return;
        }

        ProcessSupervisor supervisor(
            *process, *automation, cred ? &coordinator_ : nullptr, cred.get(),
            policy, [&self] { return self.isCancellationRequested(); });
        const SupervisorResult r = supervisor.run(spec);
        recordOutcome(key, r.outcome);
        qCInfo(rvSession) << "session ended" << "key=" << key.c_str()
                          << "outcome=" << supervisorOutcomeName(r.outcome);
    });
}

} // namespace rdpvisor
