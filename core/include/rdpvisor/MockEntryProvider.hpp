#pragma once
#include "EntryProvider.hpp"

#include <map>

namespace rdpvisor {

// In-memory database used by the tests. Groups and entries keep insertion
// order as their structural order.
class MockEntryProvider : public EntryProvider {
public:
  std::optional<EntryRecord> entry(const std::string& id) const override;
  std::optional<GroupRecord> group(const std::string& id) const override;
  SecretString password(const std::string& entryId) const override;
  std::string settingsBlob(const std::string& entryId) const override;

  // parentId empty = database root. The parent must already exist.
  void addGroup(const std::string& id, const std::string& name,
                const std::string& parentId = std::string());
  void addEntry(const EntryRecord& e, const std::string& settings = std::string(),
                const std::string& password = std::string());
  void setSettings(const std::string& entryId, const std::string& settings);

  // Number of password() calls so far.
  int passwordReads() const { return passwordReads_; }

private:
  std::map<std::string, GroupRecord> groups_;
  std::map<std::string, EntryRecord> entries_;
  std::map<std::string, std::string> settings_;
  std::map<std::string, std::string> passwords_;
  mutable int passwordReads_ = 0;
};

} // namespace rdpvisor
