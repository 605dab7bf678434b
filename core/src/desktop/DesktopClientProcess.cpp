// Detached client process: QProcess launches it, platform APIs observe it.
#include "rdpvisor/ClientProcess.hpp"

#include <QDir>
#include <QLoggingCategory>
#include <QProcess>
#include <QString>
#include <QStringList>

#include <chrono>
#include <thread>

#if defined(_WIN32)
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#else
#include <cerrno>
#include <csignal>
#include <sys/types.h>
#endif

Q_LOGGING_CATEGORY(rvProc, "rdpvisor.process")

namespace rdpvisor {
namespace {

#if defined(_WIN32)

struct WindowSearch {
    DWORD pid = 0;
    HWND found = nullptr;
};

// Same notion of "main window" as the .NET Process class: visible, unowned
// top-level window of the process.
BOOL CALLBACK findMainWindow(HWND hwnd, LPARAM lparam) {
    auto *search = reinterpret_cast<WindowSearch *>(lparam);
    DWORD owner = 0;
    GetWindowThreadProcessId(hwnd, &owner);
    if (owner != search->pid || !IsWindowVisible(hwnd) ||
        GetWindow(hwnd, GW_OWNER) != nullptr)
        return TRUE;
    search->found = hwnd;
    return FALSE;
}

#endif

class DesktopClientProcess : public ClientProcess {
public:
    ~DesktopClientProcess() override {
#if defined(_WIN32)
        if (handle_)
            CloseHandle(handle_);
#endif
    }

    bool start(const LaunchSpec &spec, std::string &err) override {
        if (spec.executable.empty()) {
            err = "No client executable";
            return false;
        }
        QProcess proc;
        proc.setProgram(QString::fromStdString(spec.executable));
#if defined(_WIN32)
        // The client parses its own command line; pass it through untouched.
        proc.setNativeArguments(QString::fromStdString(spec.arguments));
#else
        proc.setArguments(
            QProcess::splitCommand(QString::fromStdString(spec.arguments)));
#endif
        proc.setWorkingDirectory(
            spec.workingDirectory.empty()
                ? QDir::tempPath()
                : QString::fromStdString(spec.workingDirectory));

        qint64 pid = 0;
        if (!proc.startDetached(&pid) || pid <= 0) {
            err = "Could not start " + spec.executable;
            return false;
        }
        pid_ = pid;
#if defined(_WIN32)
        handle_ = OpenProcess(SYNCHRONIZE | PROCESS_TERMINATE |
                                  PROCESS_QUERY_INFORMATION,
                              FALSE, static_cast<DWORD>(pid));
        if (!handle_)
            handle_ = OpenProcess(SYNCHRONIZE | PROCESS_QUERY_LIMITED_INFORMATION,
                                  FALSE, static_cast<DWORD>(pid));
        if (!handle_) {
            // The client is already running; it just cannot be watched.
            qCWarning(rvProc) << "client started without a process handle"
                              << "pid=" << pid_ << "error=" << GetLastError();
            return true;
        }
#endif
        qCInfo(rvProc) << "client started" << "pid=" << pid_;
        return true;
    }

    bool observable() const override {
#if defined(_WIN32)
        return handle_ != nullptr;
#else
        return pid_ > 0;
#endif
    }

    void refresh() override { windowCached_ = false; }

    bool hasExited() override {
        if (pid_ <= 0)
            return true;
#if defined(_WIN32)
        if (!handle_)
            return true;
        return WaitForSingleObject(handle_, 0) == WAIT_OBJECT_0;
#else
        return ::kill(static_cast<pid_t>(pid_), 0) != 0 && errno == ESRCH;
#endif
    }

    bool waitForExit(int timeoutMs) override {
        if (pid_ <= 0)
            return true;
#if defined(_WIN32)
        if (!handle_)
            return true;
        const DWORD rc = WaitForSingleObject(
            handle_, timeoutMs < 0 ? 0 : static_cast<DWORD>(timeoutMs));
        return rc == WAIT_OBJECT_0;
#else
        // Detached children are reparented, so poll instead of waitpid().
        using namespace std::chrono;
        const auto deadline = steady_clock::now() + milliseconds(timeoutMs);
        while (!hasExited()) {
            if (steady_clock::now() >= deadline)
                return false;
            std::this_thread::sleep_for(milliseconds(25));
        }
        return true;
#endif
    }

    bool waitForInputIdle(int timeoutMs) override {
        if (pid_ <= 0)
            return false;
#if defined(_WIN32)
        if (!handle_)
            return false;
        return WaitForInputIdle(handle_, static_cast<DWORD>(timeoutMs)) == 0;
#else
        return !waitForExit(0);
#endif
    }

    void kill() override {
        if (pid_ <= 0 || hasExited())
            return;
        qCWarning(rvProc) << "terminating client" << "pid=" << pid_;
#if defined(_WIN32)
        if (!handle_)
            return;
        if (!TerminateProcess(handle_, 1)) {
            qCWarning(rvProc) << "TerminateProcess failed"
                              << "error=" << GetLastError();
        }
#else
        // A hung client may ignore SIGTERM.
        if (::kill(static_cast<pid_t>(pid_), SIGKILL) != 0)
            qCWarning(rvProc) << "SIGKILL failed" << "errno=" << errno;
#endif
    }

    WindowHandle mainWindow() override {
        if (!windowCached_) {
            window_ = lookupMainWindow();
            windowCached_ = true;
        }
        return window_;
    }

    std::string mainWindowTitle() override {
        const WindowHandle window = mainWindow();
        if (!window)
            return std::string();
#if defined(_WIN32)
        wchar_t buf[512];
        const int n = GetWindowTextW(reinterpret_cast<HWND>(window), buf,
                                     static_cast<int>(sizeof(buf) / sizeof(buf[0])));
        return QString::fromWCharArray(buf, n > 0 ? n : 0).toStdString();
#else
        return std::string();
#endif
    }

private:
    WindowHandle lookupMainWindow() const {
        if (pid_ <= 0)
            return 0;
#if defined(_WIN32)
        WindowSearch search;
        search.pid = static_cast<DWORD>(pid_);
        EnumWindows(&findMainWindow, reinterpret_cast<LPARAM>(&search));
        return reinterpret_cast<WindowHandle>(search.found);
#else
        // No portable top-level window enumeration outside Windows.
        return 0;
#endif
    }

    qint64 pid_ = 0;
    WindowHandle window_ = 0;
    bool windowCached_ = false;
#if defined(_WIN32)
    HANDLE handle_ = nullptr;
#endif
};

} // namespace

std::unique_ptr<ClientProcess> createDesktopProcess() {
    return std::make_unique<DesktopClientProcess>();
}

} // namespace rdpvisor
