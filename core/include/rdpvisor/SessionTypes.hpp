// Basic types shared between the UI layer and the core for connection
// sessions, per-entry settings and persisted configuration.
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace rdpvisor {

// Opaque native window handle (HWND on Windows). 0 means "no window".
using WindowHandle = std::uintptr_t;

// Kind of OS secret-store entry a credential is written as.
enum class CredentialKind {
    Generic,        // generic credential, read by the client on demand
    DomainPassword  // domain credential, used by the OS authentication stack
};

// Per-entry settings blob, stored alongside the entry by the host database.
struct EntrySettings {
    bool ignore = false;                   // never a credential candidate
    bool useCredPicker = true;             // participate in the picker
    bool forceLocalUser = false;           // rewrite user as <host>\<user>
    bool includeDefaultParameters = true;  // apply configured client flags
    bool recurseGroups = true;             // crawler descends into subgroups

    std::vector<std::string> includeGroups;  // extra credential groups
    std::vector<std::string> excludeGroups;  // subtrees never crawled
    std::vector<std::string> regexPatterns;  // candidate filters
    std::vector<std::string> extraParameters;  // raw client arguments

    // Contents of a connection-descriptor (.rdp) file, if any.
    std::optional<std::string> connectionDescriptor;
};

struct VaultConfig {
    bool useWindowsVault = true;  // DomainPassword instead of Generic
    int ttlSeconds = 10;          // 0 = never expires
    bool adaptiveTtl = true;      // extend while completion is uncertain
    bool removeOnExit = false;    // withdraw as soon as the session ends
};

struct ClientConfig {
    bool useAdmin = false;
    bool useRestrictedAdmin = false;
    bool usePublic = false;
    bool useRemoteGuard = false;
    bool useFullscreen = false;
    bool useSpan = false;
    bool useMultimon = false;
    int width = 0;   // 0 = client default
    int height = 0;  // 0 = client default
    bool replaceTitle = true;
    bool confirmCertificate = false;  // auto-confirm trust/cert dialogs
};

struct PickerConfig {
    std::string customGroup = "RDP";  // name of the default credential group
    bool includeSelected = false;     // offer the selected entries too
};

// Control identifiers of the client's dialogs. They belong to one client UI
// revision and are therefore configurable instead of hard-coded.
struct AutomationConfig {
    std::string progressClass = "msctls_progress32";
    std::string trustImageId = "13498";
    std::string trustConfirmId = "1";
    std::string connectionFailedId = "CommandButton_1";
    std::string certificateConfirmId = "14004";
};

// Supervisor cadence. Defaults mirror the client's observed behaviour;
// tests shrink them.
struct SupervisorTimings {
    int minWindowBoundMs = 1000;   // lower bound of the startup window wait
    int spinGranularityMs = 250;   // bound / granularity = number of spins
    int spinExitWaitMs = 200;      // exit wait between spins without window
    int spinRecheckMs = 50;          // short re-check for the window handle
    int pollIntervalMs = 750;      // modal/progress poll cadence
    int monitorBaseMs = 5000;      // first liveness wait
    int monitorStepMs = 5000;      // escalation step while window is absent
    int monitorCapMs = 60000;      // escalation ceiling
    int monitorPresentMs = 5000;   // wait slice while the window is present
    int hangEscalations = 3;       // absent checks before a forced kill
};

struct Config {
    bool connectToAll = true;      // connect every selected entry
    bool alwaysConfirm = false;    // ask before duplicate connections
    VaultConfig vault;
    ClientConfig client;
    PickerConfig picker;
    AutomationConfig automation;
    SupervisorTimings timings;
};

} // namespace rdpvisor
