// Group crawler that collects the credential entries applicable to a target.
#pragma once
#include "EntryProvider.hpp"

#include <optional>
#include <string>
#include <vector>

namespace rdpvisor {

struct CrawlRequest {
    std::string rootGroup;  // empty = crawl the include groups only
    std::vector<std::string> includeGroups;
    std::vector<std::string> excludeGroups;
    bool recurse = true;
    std::vector<std::string> patterns;  // case-insensitive regular expressions
};

struct CredentialCandidate {
    std::string entryId;
    std::string groupId;        // group the entry was found in
    std::string matchedGroup;   // crawl start (root or include group) that reached it
    bool ignored = false;       // only for entries added outside the crawl
    int patternIndex = -1;      // first matching pattern, -1 without patterns
};

enum class ResolveStatus {
    Ok,
    ConfigurationConflict,  // recursion disabled while exclusions are set
    InvalidPattern
};

struct ResolveResult {
    ResolveStatus status = ResolveStatus::Ok;
    std::string detail;
    std::vector<CredentialCandidate> candidates;
    bool ok() const { return status == ResolveStatus::Ok; }
};

class CredentialResolver {
public:
    // The provider is borrowed and must outlive the resolver.
    explicit CredentialResolver(const EntryProvider &provider);

    // Validates the request, then walks root and include groups in order.
    // Exclusion wins over inclusion; ignored entries are never candidates.
    ResolveResult resolve(const CrawlRequest &req) const;

    // Default credential group of an entry: a child of its parent group
    // named groupName, or the parent itself when it carries that name.
    std::optional<std::string> findCredentialRoot(const std::string &entryId,
                                                  const std::string &groupName) const;

private:
    const EntryProvider &provider_;
};

// Caller-side selection policy over a resolved candidate set.
enum class CandidateChoice {
    None,        // nothing to offer
    AutoSelect,  // exactly one, no picker
    Pick         // several, ask the user
};

CandidateChoice chooseCandidate(const std::vector<CredentialCandidate> &candidates);

const char *resolveStatusName(ResolveStatus st);

} // namespace rdpvisor
