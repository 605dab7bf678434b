// User-facing collaborators the orchestrator talks to. The Qt Widgets
// implementations live in the ui library; tests script them.
#pragma once
#include <string>
#include <vector>

namespace rdpvisor {

enum class PromptIcon { Information, Warning, Error, Question };

struct PromptRequest {
    std::string title;
    std::string message;
    std::string detail;
    PromptIcon icon = PromptIcon::Information;
    std::vector<std::string> buttons;  // empty = a single OK button
    int defaultIndex = 0;
};

class Prompter {
public:
    virtual ~Prompter() = default;
    // Blocks until answered. Returns the chosen button index, -1 when the
    // prompt was dismissed.
    virtual int prompt(const PromptRequest &req) = 0;
};

struct PickerItem {
    std::string entryId;
    std::string title;
    std::string username;
    std::string groupName;
};

struct PickResult {
    enum class Status { Chosen, None, Cancelled };
    Status status = Status::None;
    std::string entryId;  // set when Chosen
};

class CredentialPicker {
public:
    virtual ~CredentialPicker() = default;
    virtual PickResult pick(const std::vector<PickerItem> &items) = 0;
};

} // namespace rdpvisor
