// Window and accessibility-tree capabilities used to detect and dismiss the
// client's modal dialogs. Every lookup failure means "not found yet".
#pragma once
#include "SessionTypes.hpp"

#include <memory>
#include <optional>
#include <string>

namespace rdpvisor {

enum class ControlType { Other, Button, Image };

struct ControlInfo {
    ControlType type = ControlType::Other;
    WindowHandle handle = 0;  // native handle of the control, may be 0
};

class WindowAutomation {
public:
    virtual ~WindowAutomation() = default;

    // Best effort; the client may overwrite the title again.
    virtual bool setWindowText(WindowHandle window, const std::string &text) = 0;

    virtual WindowHandle findChildByClass(WindowHandle parent,
                                          const std::string &className) = 0;

    // Returns the window itself when no popup is open.
    virtual WindowHandle lastActivePopup(WindowHandle owner) = 0;

    // Direct child of window with the given automation id.
    virtual std::optional<ControlInfo>
    findControlById(WindowHandle window, const std::string &automationId) = 0;

    // Native default action (LegacyIAccessible). False when unavailable or
    // when the control rejected it.
    virtual bool invokeDefaultAction(WindowHandle control, std::string &err) = 0;

    // Mouse-down, mouse-up and click messages sent to the control.
    virtual void synthesizeClick(WindowHandle control) = 0;
};

// How a confirm button is pressed.
enum class ActivationPolicy {
    DefaultActionWithFallback,  // native default action, synthesized on failure
    SynthesizedOnly             // synthesized input only
};

// Returns true when the native default action succeeded, false when the
// synthesized fallback was used.
bool activateControl(WindowAutomation &automation, WindowHandle control,
                     ActivationPolicy policy);

// Win32 UI Automation backend on Windows; elsewhere every lookup reports
// "not found".
std::unique_ptr<WindowAutomation> createDesktopAutomation();

} // namespace rdpvisor
