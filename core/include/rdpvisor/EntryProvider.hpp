// Read-only view of the host password database: entries, the group tree
// and the per-entry settings blob.
#pragma once
#include "Credential.hpp"
#include "SessionTypes.hpp"

#include <optional>
#include <string>
#include <vector>

namespace rdpvisor {

// Entry fields arrive with placeholders already substituted by the host.
// The password is not part of the record; see EntryProvider::password().
struct EntryRecord {
    std::string id;
    std::string groupId;  // parent group
    std::string title;
    std::string url;
    std::string username;
};

struct GroupRecord {
    std::string id;
    std::string name;
    std::string parentId;                  // empty for the database root
    std::vector<std::string> childGroups;  // structural order
    std::vector<std::string> entries;      // structural order
};

class EntryProvider {
public:
    virtual ~EntryProvider() = default;

    virtual std::optional<EntryRecord> entry(const std::string &id) const = 0;
    virtual std::optional<GroupRecord> group(const std::string &id) const = 0;

    // Read only when a credential is assembled; empty for unknown entries.
    virtual SecretString password(const std::string &entryId) const = 0;

    // Raw JSON settings stored with the entry, empty when none.
    virtual std::string settingsBlob(const std::string &entryId) const = 0;
};

// Parses a settings blob. An empty blob yields defaults. On a malformed
// blob out is left at defaults and err describes the problem.
bool parseEntrySettings(const std::string &blob, EntrySettings &out,
                        std::string &err);

// Settings of one entry; parse failures are logged and fall back to
// defaults.
EntrySettings loadEntrySettings(const EntryProvider &provider,
                                const std::string &entryId);

} // namespace rdpvisor
