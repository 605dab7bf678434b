#include "rdpvisor/MockEntryProvider.hpp"

namespace rdpvisor {

std::optional<EntryRecord> MockEntryProvider::entry(const std::string& id) const {
  auto it = entries_.find(id);
  if (it == entries_.end()) return std::nullopt;
  return it->second;
}

std::optional<GroupRecord> MockEntryProvider::group(const std::string& id) const {
  auto it = groups_.find(id);
  if (it == groups_.end()) return std::nullopt;
  return it->second;
}

SecretString MockEntryProvider::password(const std::string& entryId) const {
  ++passwordReads_;
  auto it = passwords_.find(entryId);
  return it == passwords_.end() ? SecretString() : SecretString(it->second);
}

std::string MockEntryProvider::settingsBlob(const std::string& entryId) const {
  auto it = settings_.find(entryId);
  return it == settings_.end() ? std::string() : it->second;
}

void MockEntryProvider::addGroup(const std::string& id, const std::string& name,
                                 const std::string& parentId) {
  GroupRecord g;
  g.id = id;
  g.name = name;
  g.parentId = parentId;
  groups_[id] = g;
  if (!parentId.empty()) {
    auto it = groups_.find(parentId);
    if (it != groups_.end()) it->second.childGroups.push_back(id);
  }
}

void MockEntryProvider::addEntry(const EntryRecord& e, const std::string& settings,
                                 const std::string& password) {
  entries_[e.id] = e;
  if (!password.empty()) passwords_[e.id] = password;
  auto it = groups_.find(e.groupId);
  if (it != groups_.end()) it->second.entries.push_back(e.id);
  if (!settings.empty()) settings_[e.id] = settings;
}

void MockEntryProvider::setSettings(const std::string& entryId,
                                    const std::string& settings) {
  settings_[entryId] = settings;
}

} // namespace rdpvisor
