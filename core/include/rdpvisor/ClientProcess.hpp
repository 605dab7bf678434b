// Abstract handle on the external remote-desktop client process. The
// supervisor only observes the client through this interface.
#pragma once
#include "SessionTypes.hpp"

#include <memory>
#include <string>

namespace rdpvisor {

struct LaunchSpec {
    std::string executable;
    std::string arguments;         // already assembled, space separated
    std::string workingDirectory;  // empty = system temp directory
};

class ClientProcess {
public:
    virtual ~ClientProcess() = default;

    virtual bool start(const LaunchSpec &spec, std::string &err) = 0;

    // False when the client was started but its state cannot be queried,
    // e.g. no process handle could be opened. Only meaningful after start().
    virtual bool observable() const { return true; }

    // Drops cached window information so the next query re-reads it.
    virtual void refresh() = 0;

    virtual bool hasExited() = 0;

    // Bounded wait; true once the process has exited.
    virtual bool waitForExit(int timeoutMs) = 0;

    // Bounded wait for the client's message loop to become idle.
    virtual bool waitForInputIdle(int timeoutMs) = 0;

    virtual void kill() = 0;

    virtual WindowHandle mainWindow() = 0;
    virtual std::string mainWindowTitle() = 0;
};

// Detached desktop process: the client keeps running when the handle goes
// away, only an explicit kill() terminates it.
std::unique_ptr<ClientProcess> createDesktopProcess();

} // namespace rdpvisor
