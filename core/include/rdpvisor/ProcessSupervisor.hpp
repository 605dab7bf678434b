// State machine that launches one client process and follows it through
// startup, trust/error dialogs, the connecting phase and its lifetime.
#pragma once
#include "ClientProcess.hpp"
#include "Credential.hpp"
#include "VaultCoordinator.hpp"
#include "WindowAutomation.hpp"

#include <functional>
#include <string>

namespace rdpvisor {

enum class SupervisorState {
    Starting,
    WaitingForWindow,
    WaitingForModal,
    Running,     // connecting phase, progress indicator watched
    Monitoring,  // connected, liveness of the main window watched
    Exited,
    Killed
};

enum class SupervisorOutcome {
    Connected,            // connecting phase ended normally
    ConnectionFailed,     // client showed its connection-failed dialog
    WindowNeverAppeared,  // gave up waiting for a main window, no kill
    SpawnFailed,
    Unsupervised,         // started, but its state cannot be observed
    ProcessExited,        // exited before the connecting phase ended
    Cancelled,
    Killed                // presumed hung, terminated
};

const char *supervisorStateName(SupervisorState st);
const char *supervisorOutcomeName(SupervisorOutcome o);

struct SupervisorPolicy {
    bool autoConfirm = false;          // press trust/certificate buttons
    bool adaptiveTtl = false;          // extend TTL while connecting
    bool removeOnExit = false;         // withdraw credential at session end
    bool expectTrustPrompt = false;    // a descriptor file was supplied
    std::string titleOverride;         // empty = keep the client's title
    ActivationPolicy activation = ActivationPolicy::DefaultActionWithFallback;
    AutomationConfig automation;
    SupervisorTimings timings;
};

struct SupervisorResult {
    SupervisorOutcome outcome = SupervisorOutcome::ProcessExited;
    SupervisorState finalState = SupervisorState::Exited;
    int ttlExtensions = 0;
    bool credentialVaulted = false;
    bool credentialReleasedEarly = false;  // disposed after connecting
};

class ProcessSupervisor {
public:
    // process, automation and the optional coordinator/credential are
    // borrowed for the duration of run().
    ProcessSupervisor(ClientProcess &process, WindowAutomation &automation,
                      VaultCoordinator *coordinator, Credential *credential,
                      SupervisorPolicy policy,
                      std::function<bool()> shouldCancel = {});

    // Drives the state machine to a terminal state. Credential cleanup runs
    // on every path, including exceptions thrown by the collaborators.
    SupervisorResult run(const LaunchSpec &spec);

    SupervisorState state() const { return state_; }

private:
    struct SupervisionContext {
        WindowHandle mainWindow = 0;
        WindowHandle progress = 0;
        std::string pendingTitle;
        int boundMs = 0;
        int spinsLeft = 0;       // window and progress-indicator lookups
        int modalSpinsLeft = 0;  // polls while a trust prompt is open
        bool idleChecked = false;
        bool trustPending = false;
        bool progressSeen = false;
        bool monitorStarted = false;
        int monitorTimeoutMs = 0;
        int absentChecks = 0;
    };

    void stepStarting(const LaunchSpec &spec);
    void stepWaitingForWindow();
    void stepWaitingForModal();
    void stepRunning();
    void stepMonitoring();

    void onMainWindow(WindowHandle window);
    void enterRunning();
    void applyTitle();
    WindowHandle recheckForWindow(int budgetMs);
    bool hasButton(WindowHandle popup, const std::string &id,
                   ControlInfo *out = nullptr);
    void pressButton(const ControlInfo &button);
    void endConnectingPhase(SupervisorOutcome outcome);
    void finishProcess(SupervisorOutcome outcome);
    void extendCredential();
    void releaseCredentialEarly();
    void cleanupCredential();
    bool cancelled() const;
    bool waitForExitOrCancel(int timeoutMs);

    ClientProcess &process_;
    WindowAutomation &automation_;
    VaultCoordinator *coordinator_;
    Credential *credential_;
    SupervisorPolicy policy_;
    std::function<bool()> shouldCancel_;

    SupervisorState state_ = SupervisorState::Starting;
    SupervisionContext ctx_;
    SupervisorResult result_;
    bool outcomeSet_ = false;
    bool credentialDone_ = false;
};

} // namespace rdpvisor
