// Client supervision: window discovery, dialog handling, connecting-phase
// polling and the post-connect hang watchdog.
#include "rdpvisor/ProcessSupervisor.hpp"

#include <QLoggingCategory>

#include <algorithm>
#include <chrono>
#include <thread>

Q_LOGGING_CATEGORY(rvSup, "rdpvisor.supervisor")

namespace rdpvisor {

const char *supervisorStateName(SupervisorState st) {
    switch (st) {
    case SupervisorState::Starting:
        return "Starting";
    case SupervisorState::WaitingForWindow:
        return "WaitingForWindow";
    case SupervisorState::WaitingForModal:
        return "WaitingForModal";
    case SupervisorState::Running:
        return "Running";
    case SupervisorState::Monitoring:
        return "Monitoring";
    case SupervisorState::Exited:
        return "Exited";
    case SupervisorState::Killed:
        return "Killed";
    }
    return "Unknown";
}

const char *supervisorOutcomeName(SupervisorOutcome o) {
    switch (o) {
    case SupervisorOutcome::Connected:
        return "Connected";
    case SupervisorOutcome::ConnectionFailed:
        return "ConnectionFailed";
    case SupervisorOutcome::WindowNeverAppeared:
        return "WindowNeverAppeared";
    case SupervisorOutcome::SpawnFailed:
        return "SpawnFailed";
    case SupervisorOutcome::Unsupervised:
        return "Unsupervised";
    case SupervisorOutcome::ProcessExited:
        return "ProcessExited";
    case SupervisorOutcome::Cancelled:
        return "Cancelled";
    case SupervisorOutcome::Killed:
        return "Killed";
    }
    return "Unknown";
}

ProcessSupervisor::ProcessSupervisor(ClientProcess &process,
                                     WindowAutomation &automation,
                                     VaultCoordinator *coordinator,
                                     Credential *credential,
                                     SupervisorPolicy policy,
                                     std::function<bool()> shouldCancel)
    : process_(process), automation_(automation), coordinator_(coordinator),
      credential_(credential), policy_(std::move(policy)),
      shouldCancel_(std::move(shouldCancel)) {
    SupervisorTimings &t = policy_.timings;
    t.spinGranularityMs = std::max(1, t.spinGranularityMs);
    t.pollIntervalMs = std::max(1, t.pollIntervalMs);
    t.monitorBaseMs = std::max(1, t.monitorBaseMs);
    t.monitorCapMs = std::max(t.monitorBaseMs, t.monitorCapMs);
    t.hangEscalations = std::max(1, t.hangEscalations);
}

namespace {

bool isTerminal(SupervisorState st) {
    return st == SupervisorState::Exited || st == SupervisorState::Killed;
}

// Runs the credential cleanup when run() leaves by any path.
class CleanupGuard {
public:
    explicit CleanupGuard(std::function<void()> fn) : fn_(std::move(fn)) {}
    ~CleanupGuard() { fn_(); }
    CleanupGuard(const CleanupGuard &) = delete;
    CleanupGuard &operator=(const CleanupGuard &) = delete;

private:
    std::function<void()> fn_;
};

} // namespace

SupervisorResult ProcessSupervisor::run(const LaunchSpec &spec) {
    CleanupGuard guard([this] { cleanupCredential(); });

    state_ = SupervisorState::Starting;
    while (!isTerminal(state_)) {
        if (cancelled()) {
            qCInfo(rvSup) << "supervision cancelled"
                          << "state=" << supervisorStateName(state_);
            finishProcess(SupervisorOutcome::Cancelled);
            break;
        }
        switch (state_) {
        case SupervisorState::Starting:
            stepStarting(spec);
            break;
        case SupervisorState::WaitingForWindow:
            stepWaitingForWindow();
            break;
        case SupervisorState::WaitingForModal:
            stepWaitingForModal();
            break;
        case SupervisorState::Running:
            stepRunning();
            break;
        case SupervisorState::Monitoring:
            stepMonitoring();
            break;
        case SupervisorState::Exited:
        case SupervisorState::Killed:
            break;
        }
    }
    result_.finalState = state_;
    qCInfo(rvSup) << "supervision finished"
                  << "outcome=" << supervisorOutcomeName(result_.outcome)
                  << "state=" << supervisorStateName(state_)
                  << "extensions=" << result_.ttlExtensions;
    return result_;
}

bool ProcessSupervisor::cancelled() const {
    return shouldCancel_ && shouldCancel_();
}

// Long waits are sliced so a cancellation request is noticed promptly.
bool ProcessSupervisor::waitForExitOrCancel(int timeoutMs) {
    constexpr int kSliceMs = 250;
    if (!shouldCancel_)
        return process_.waitForExit(timeoutMs);
    while (timeoutMs > kSliceMs) {
        if (process_.waitForExit(kSliceMs))
            return true;
        timeoutMs -= kSliceMs;
        if (cancelled())
            return false;
    }
    return process_.waitForExit(timeoutMs);
}

void ProcessSupervisor::stepStarting(const LaunchSpec &spec) {
    if (credential_ && coordinator_)
        result_.credentialVaulted = coordinator_->registerCredential(*credential_);

    std::string err;
    if (!process_.start(spec, err)) {
        qCWarning(rvSup) << "client spawn failed" << "detail=" << err.c_str();
        finishProcess(SupervisorOutcome::SpawnFailed);
        return;
    }
    if (!process_.observable()) {
        qCWarning(rvSup) << "client running unsupervised";
        finishProcess(SupervisorOutcome::Unsupervised);
        return;
    }

    const int incrementMs =
        coordinator_
            ? static_cast<int>(coordinator_->ttlIncrement().count() * 1000)
            : 0;
    ctx_.boundMs = std::max(policy_.timings.minWindowBoundMs, incrementMs);
    ctx_.spinsLeft =
        std::max(1, ctx_.boundMs / policy_.timings.spinGranularityMs);
    ctx_.pendingTitle = policy_.titleOverride;
    ctx_.trustPending = policy_.expectTrustPrompt;
    state_ = SupervisorState::WaitingForWindow;
}

WindowHandle ProcessSupervisor::recheckForWindow(int budgetMs) {
    using namespace std::chrono;
    const auto deadline = steady_clock::now() + milliseconds(budgetMs);
    for (;;) {
        process_.refresh();
        if (const WindowHandle w = process_.mainWindow())
            return w;
        if (steady_clock::now() >= deadline)
            return 0;
        std::this_thread::sleep_for(milliseconds(10));
    }
}

void ProcessSupervisor::stepWaitingForWindow() {
    if (!ctx_.idleChecked) {
        ctx_.idleChecked = true;
        if (!process_.waitForInputIdle(ctx_.boundMs))
            qCDebug(rvSup) << "client not idle within bound" << "ms=" << ctx_.boundMs;
    }

    if (ctx_.spinsLeft <= 0) {
        qCWarning(rvSup) << "main window never appeared";
        finishProcess(SupervisorOutcome::WindowNeverAppeared);
        return;
    }
    --ctx_.spinsLeft;

    process_.refresh();
    WindowHandle window = process_.mainWindow();
    if (!window) {
        if (process_.waitForExit(policy_.timings.spinExitWaitMs)) {
            finishProcess(SupervisorOutcome::ProcessExited);
            return;
        }
        window = recheckForWindow(policy_.timings.spinRecheckMs);
    }
    if (!window) {
        extendCredential();
        return;
    }
    onMainWindow(window);
    if (ctx_.trustPending) {
        ctx_.modalSpinsLeft =
            std::max(1, ctx_.boundMs / policy_.timings.pollIntervalMs);
        state_ = SupervisorState::WaitingForModal;
        return;
    }
    enterRunning();
}

void ProcessSupervisor::enterRunning() {
    ctx_.spinsLeft =
        std::max(1, ctx_.boundMs / policy_.timings.spinGranularityMs);
    state_ = SupervisorState::Running;
}

void ProcessSupervisor::onMainWindow(WindowHandle window) {
    ctx_.mainWindow = window;
    qCDebug(rvSup) << "main window found"
                   << "title=" << process_.mainWindowTitle().c_str();
    applyTitle();
    ctx_.progress =
        automation_.findChildByClass(window, policy_.automation.progressClass);
    if (ctx_.progress)
        ctx_.progressSeen = true;
}

void ProcessSupervisor::applyTitle() {
    if (ctx_.pendingTitle.empty() || !ctx_.mainWindow)
        return;
    if (!automation_.setWindowText(ctx_.mainWindow, ctx_.pendingTitle))
        qCDebug(rvSup) << "title not applied";
}

bool ProcessSupervisor::hasButton(WindowHandle popup, const std::string &id,
                                  ControlInfo *out) {
    const std::optional<ControlInfo> c = automation_.findControlById(popup, id);
    if (!c || c->type != ControlType::Button)
        return false;
    if (out)
        *out = *c;
    return true;
}

void ProcessSupervisor::pressButton(const ControlInfo &button) {
    const bool native =
        activateControl(automation_, button.handle, policy_.activation);
    qCInfo(rvSup) << "dialog confirmed" << "native=" << native;
}

void ProcessSupervisor::stepWaitingForModal() {
    if (process_.waitForExit(policy_.timings.pollIntervalMs)) {
        finishProcess(SupervisorOutcome::ProcessExited);
        return;
    }
    process_.refresh();
    const WindowHandle window = process_.mainWindow();

    // Without a main window there is nothing left to watch.
    bool handled = !window;
    if (window) {
        ctx_.mainWindow = window;
        const WindowHandle popup = automation_.lastActivePopup(window);
        if (popup && popup != window) {
            const std::optional<ControlInfo> icon = automation_.findControlById(
                popup, policy_.automation.trustImageId);
            ControlInfo confirm;
            if (!icon || icon->type != ControlType::Image) {
                // Some other dialog; the connecting phase deals with it.
                handled = true;
            } else if (policy_.autoConfirm &&
                       hasButton(popup, policy_.automation.trustConfirmId, &confirm)) {
                pressButton(confirm);
                handled = true;
            }
        }
    }

    // The prompt may open on a later poll, or is left for the user.
    if (!handled && --ctx_.modalSpinsLeft > 0) {
        extendCredential();
        return;
    }
    if (!handled)
        qCDebug(rvSup) << "trust prompt watch ended without confirmation";

    ctx_.trustPending = false;
    if (window && !ctx_.progress) {
        ctx_.progress = automation_.findChildByClass(
            window, policy_.automation.progressClass);
        if (ctx_.progress)
            ctx_.progressSeen = true;
    }
    enterRunning();
}

void ProcessSupervisor::stepRunning() {
    if (!ctx_.progress) {
        // The indicator may show up late; keep looking for the remaining
        // spins before treating the connecting phase as over.
        if (ctx_.spinsLeft <= 0) {
            endConnectingPhase(SupervisorOutcome::Connected);
            return;
        }
        --ctx_.spinsLeft;
        if (process_.waitForExit(policy_.timings.spinExitWaitMs)) {
            finishProcess(SupervisorOutcome::ProcessExited);
            return;
        }
        process_.refresh();
        const WindowHandle window = process_.mainWindow();
        if (!window) {
            endConnectingPhase(SupervisorOutcome::Connected);
            return;
        }
        ctx_.mainWindow = window;
        applyTitle();
        ctx_.progress = automation_.findChildByClass(
            window, policy_.automation.progressClass);
        if (ctx_.progress)
            ctx_.progressSeen = true;
        return;
    }

    if (process_.waitForExit(policy_.timings.pollIntervalMs)) {
        finishProcess(SupervisorOutcome::ProcessExited);
        return;
    }
    process_.refresh();
    const WindowHandle window = process_.mainWindow();
    if (!window) {
        endConnectingPhase(SupervisorOutcome::Connected);
        return;
    }
    ctx_.mainWindow = window;

    const WindowHandle popup = automation_.lastActivePopup(window);
    if (popup && popup != window) {
        if (hasButton(popup, policy_.automation.connectionFailedId)) {
            qCWarning(rvSup) << "client reported connection failure";
            endConnectingPhase(SupervisorOutcome::ConnectionFailed);
            return;
        }
        ControlInfo confirm;
        if (policy_.autoConfirm &&
            hasButton(popup, policy_.automation.certificateConfirmId, &confirm)) {
            pressButton(confirm);
            return;
        }
    } else if (!automation_.findChildByClass(window,
                                             policy_.automation.progressClass)) {
        endConnectingPhase(SupervisorOutcome::Connected);
        return;
    }
    extendCredential();
}

void ProcessSupervisor::endConnectingPhase(SupervisorOutcome outcome) {
    result_.outcome = outcome;
    outcomeSet_ = true;
    qCInfo(rvSup) << "connecting phase over"
                  << "outcome=" << supervisorOutcomeName(outcome)
                  << "progressSeen=" << ctx_.progressSeen;

    if (policy_.adaptiveTtl ||
        (policy_.removeOnExit && !ctx_.progressSeen))
        releaseCredentialEarly();

    ctx_.monitorTimeoutMs = policy_.timings.monitorBaseMs;
    state_ = SupervisorState::Monitoring;
}

void ProcessSupervisor::stepMonitoring() {
    const SupervisorTimings &t = policy_.timings;
    if (!ctx_.monitorStarted) {
        ctx_.monitorStarted = true;
        // The client rewrites its title once connected.
        for (int i = 0; i < 2; ++i) {
            if (process_.waitForExit(i == 0 ? 0 : t.spinExitWaitMs)) {
                finishProcess(result_.outcome);
                return;
            }
            process_.refresh();
            if (const WindowHandle w = process_.mainWindow()) {
                ctx_.mainWindow = w;
                applyTitle();
            }
        }
    }

    const int waitMs = ctx_.absentChecks > 0 ? ctx_.monitorTimeoutMs
                                             : t.monitorPresentMs;
    if (waitForExitOrCancel(waitMs)) {
        finishProcess(result_.outcome);
        return;
    }
    process_.refresh();
    if (process_.mainWindow()) {
        ctx_.absentChecks = 0;
        ctx_.monitorTimeoutMs = t.monitorBaseMs;
        return;
    }

    ++ctx_.absentChecks;
    if (ctx_.absentChecks >= t.hangEscalations) {
        qCWarning(rvSup) << "client presumed hung, terminating";
        process_.kill();
        result_.outcome = SupervisorOutcome::Killed;
        outcomeSet_ = true;
        state_ = SupervisorState::Killed;
        return;
    }
    if (ctx_.absentChecks > 1)
        ctx_.monitorTimeoutMs =
            std::min(t.monitorCapMs, ctx_.monitorTimeoutMs + t.monitorStepMs);
    qCDebug(rvSup) << "main window gone, process alive"
                   << "checks=" << ctx_.absentChecks
                   << "nextWaitMs=" << ctx_.monitorTimeoutMs;
}

void ProcessSupervisor::finishProcess(SupervisorOutcome outcome) {
    // A process exiting after the connecting phase keeps that phase's
    // outcome; cancellation always wins.
    if (!outcomeSet_ || outcome == SupervisorOutcome::Cancelled) {
        result_.outcome = outcome;
        outcomeSet_ = true;
    }
    state_ = SupervisorState::Exited;
}

void ProcessSupervisor::extendCredential() {
    if (!credential_ || !coordinator_ || credentialDone_ || !policy_.adaptiveTtl)
        return;
    if (coordinator_->extendTtl(*credential_, coordinator_->ttlIncrement()))
        ++result_.ttlExtensions;
}

void ProcessSupervisor::releaseCredentialEarly() {
    if (!credential_ || credentialDone_)
        return;
    if (coordinator_)
        coordinator_->withdraw(*credential_);
    else
        credential_->dispose();
    credentialDone_ = true;
    result_.credentialReleasedEarly = true;
}

void ProcessSupervisor::cleanupCredential() {
    if (!credential_ || credentialDone_)
        return;
    credentialDone_ = true;
    if (coordinator_) {
        if (policy_.removeOnExit) {
            coordinator_->withdraw(*credential_);
            return;
        }
        // The store entry outlives the session only until its configured
        // TTL runs out.
        if (policy_.adaptiveTtl)
            coordinator_->resetTtl(*credential_);
    }
    credential_->dispose();
}

} // namespace rdpvisor
