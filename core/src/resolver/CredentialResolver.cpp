// Recursive group crawl with include/exclude lists and pattern filters.
#include "rdpvisor/CredentialResolver.hpp"

#include <QLoggingCategory>
#include <QRegularExpression>
#include <QString>

#include <set>

Q_LOGGING_CATEGORY(rvResolve, "rdpvisor.resolver")

namespace rdpvisor {

const char *resolveStatusName(ResolveStatus st) {
    switch (st) {
    case ResolveStatus::Ok:
        return "Ok";
    case ResolveStatus::ConfigurationConflict:
        return "ConfigurationConflict";
    case ResolveStatus::InvalidPattern:
        return "InvalidPattern";
    }
    return "Unknown";
}

CandidateChoice chooseCandidate(const std::vector<CredentialCandidate> &candidates) {
    if (candidates.empty())
        return CandidateChoice::None;
    if (candidates.size() == 1)
        return CandidateChoice::AutoSelect;
    return CandidateChoice::Pick;
}

CredentialResolver::CredentialResolver(const EntryProvider &provider)
    : provider_(provider) {}

namespace {

struct Crawl {
    const EntryProvider &provider;
    const CrawlRequest &req;
    std::set<std::string> excluded;
    std::vector<QRegularExpression> patterns;
    std::set<std::string> seenGroups;
    std::set<std::string> seenEntries;
    std::vector<CredentialCandidate> out;

    // True when the group or any ancestor is excluded.
    bool underExclusion(const std::string &groupId) const {
        std::set<std::string> guard;
        std::string id = groupId;
        while (!id.empty() && guard.insert(id).second) {
            if (excluded.count(id))
                return true;
            const std::optional<GroupRecord> g = provider.group(id);
            if (!g)
                break;
            id = g->parentId;
        }
        return false;
    }

    int matchPattern(const EntryRecord &e) const {
        const QString title = QString::fromStdString(e.title);
        const QString user = QString::fromStdString(e.username);
        for (std::size_t i = 0; i < patterns.size(); ++i) {
            if (patterns[i].match(title).hasMatch() ||
                patterns[i].match(user).hasMatch())
                return static_cast<int>(i);
        }
        return -1;
    }

    void visitEntry(const std::string &entryId, const std::string &groupId,
                    const std::string &start) {
        if (!seenEntries.insert(entryId).second)
            return;
        const std::optional<EntryRecord> e = provider.entry(entryId);
        if (!e)
            return;
        if (loadEntrySettings(provider, entryId).ignore)
            return;
        CredentialCandidate c;
        c.entryId = entryId;
        c.groupId = groupId;
        c.matchedGroup = start;
        if (!patterns.empty()) {
            c.patternIndex = matchPattern(*e);
            if (c.patternIndex < 0)
                return;
        }
        out.push_back(std::move(c));
    }

    // Entries of a group come before its subgroups.
    void visitGroup(const std::string &groupId, const std::string &start) {
        if (excluded.count(groupId) || !seenGroups.insert(groupId).second)
            return;
        const std::optional<GroupRecord> g = provider.group(groupId);
        if (!g) {
            qCDebug(rvResolve) << "unknown group" << "id=" << groupId.c_str();
            return;
        }
        for (const std::string &entryId : g->entries)
            visitEntry(entryId, groupId, start);
        if (!req.recurse)
            return;
        for (const std::string &child : g->childGroups)
            visitGroup(child, start);
    }

    void start(const std::string &groupId) {
        if (groupId.empty())
            return;
        if (underExclusion(groupId)) {
            qCDebug(rvResolve) << "crawl start excluded" << "group=" << groupId.c_str();
            return;
        }
        visitGroup(groupId, groupId);
    }
};

} // namespace

ResolveResult CredentialResolver::resolve(const CrawlRequest &req) const {
    ResolveResult result;
    if (!req.recurse && !req.excludeGroups.empty()) {
        result.status = ResolveStatus::ConfigurationConflict;
        result.detail = "Group exclusions require recursive crawling";
        qCWarning(rvResolve) << "crawl rejected" << "reason=conflict";
        return result;
    }

    Crawl crawl{provider_, req, {}, {}, {}, {}, {}};
    crawl.excluded.insert(req.excludeGroups.begin(), req.excludeGroups.end());
    for (const std::string &p : req.patterns) {
        QRegularExpression re(QString::fromStdString(p),
                              QRegularExpression::CaseInsensitiveOption);
        if (!re.isValid()) {
            result.status = ResolveStatus::InvalidPattern;
            result.detail = "Invalid pattern '" + p +
                            "': " + re.errorString().toStdString();
            qCWarning(rvResolve) << "crawl rejected" << "reason=pattern"
                                 << "detail=" << result.detail.c_str();
            return result;
        }
        crawl.patterns.push_back(std::move(re));
    }

    crawl.start(req.rootGroup);
    for (const std::string &g : req.includeGroups)
        crawl.start(g);

    result.candidates = std::move(crawl.out);
    qCInfo(rvResolve) << "crawl finished"
                      << "candidates=" << result.candidates.size()
                      << "groups=" << crawl.seenGroups.size();
    return result;
}

std::optional<std::string>
CredentialResolver::findCredentialRoot(const std::string &entryId,
                                       const std::string &groupName) const {
    const std::optional<EntryRecord> e = provider_.entry(entryId);
    if (!e)
        return std::nullopt;
    const std::optional<GroupRecord> parent = provider_.group(e->groupId);
    if (!parent)
        return std::nullopt;
    for (const std::string &childId : parent->childGroups) {
        const std::optional<GroupRecord> child = provider_.group(childId);
        if (child && child->name == groupName)
            return childId;
    }
    if (parent->name == groupName)
        return parent->id;
    return std::nullopt;
}

} // namespace rdpvisor
