// Window automation backends and the confirm-button activation policy.
#include "rdpvisor/WindowAutomation.hpp"

#include <QLoggingCategory>
#include <QString>

#if defined(_WIN32)
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#include <oleacc.h>
#include <uiautomation.h>
#include <wrl/client.h>
#endif

Q_LOGGING_CATEGORY(rvAuto, "rdpvisor.automation")

namespace rdpvisor {

bool activateControl(WindowAutomation &automation, WindowHandle control,
                     ActivationPolicy policy) {
    if (policy == ActivationPolicy::DefaultActionWithFallback) {
        std::string err;
        if (automation.invokeDefaultAction(control, err))
            return true;
        qCDebug(rvAuto) << "default action failed, synthesizing click"
                        << "detail=" << err.c_str();
    }
    automation.synthesizeClick(control);
    return false;
}

namespace {

#if defined(_WIN32)

using Microsoft::WRL::ComPtr;

HWND toHwnd(WindowHandle h) { return reinterpret_cast<HWND>(h); }

class Win32WindowAutomation : public WindowAutomation {
public:
    Win32WindowAutomation() {
        // S_FALSE (already initialised on this thread) still needs a
        // matching CoUninitialize.
        const HRESULT init = CoInitializeEx(nullptr, COINIT_MULTITHREADED);
        comInitialized_ = SUCCEEDED(init);
        const HRESULT hr =
            CoCreateInstance(__uuidof(CUIAutomation), nullptr,
                             CLSCTX_INPROC_SERVER, IID_PPV_ARGS(&uia_));
        if (FAILED(hr)) {
            qCWarning(rvAuto) << "UI Automation unavailable"
                              << "hr=" << Qt::hex << static_cast<unsigned>(hr);
            uia_.Reset();
        }
    }

    ~Win32WindowAutomation() override {
        uia_.Reset();
        if (comInitialized_)
            CoUninitialize();
    }

    bool setWindowText(WindowHandle window, const std::string &text) override {
        if (!window)
            return false;
        const std::wstring wtext = QString::fromStdString(text).toStdWString();
        return SetWindowTextW(toHwnd(window), wtext.c_str()) != FALSE;
    }

    WindowHandle findChildByClass(WindowHandle parent,
                                  const std::string &className) override {
        if (!parent)
            return 0;
        const std::wstring cls = QString::fromStdString(className).toStdWString();
        return reinterpret_cast<WindowHandle>(
            FindWindowExW(toHwnd(parent), nullptr, cls.c_str(), nullptr));
    }

    WindowHandle lastActivePopup(WindowHandle owner) override {
        if (!owner)
            return 0;
        return reinterpret_cast<WindowHandle>(GetLastActivePopup(toHwnd(owner)));
    }

    std::optional<ControlInfo>
    findControlById(WindowHandle window,
                    const std::string &automationId) override {
        if (!uia_ || !window)
            return std::nullopt;
        ComPtr<IUIAutomationElement> root;
        if (FAILED(uia_->ElementFromHandle(toHwnd(window), &root)) || !root)
            return std::nullopt;

        VARIANT id;
        VariantInit(&id);
        id.vt = VT_BSTR;
        id.bstrVal = SysAllocString(
            QString::fromStdString(automationId).toStdWString().c_str());
        ComPtr<IUIAutomationCondition> condition;
        const HRESULT hr = uia_->CreatePropertyCondition(
            UIA_AutomationIdPropertyId, id, &condition);
        VariantClear(&id);
        if (FAILED(hr) || !condition)
            return std::nullopt;

        ComPtr<IUIAutomationElement> found;
        if (FAILED(root->FindFirst(TreeScope_Children, condition.Get(), &found)) ||
            !found)
            return std::nullopt;

        ControlInfo info;
        CONTROLTYPEID type = 0;
        if (SUCCEEDED(found->get_CurrentControlType(&type))) {
            if (type == UIA_ButtonControlTypeId)
                info.type = ControlType::Button;
            else if (type == UIA_ImageControlTypeId)
                info.type = ControlType::Image;
        }
        UIA_HWND native = nullptr;
        if (SUCCEEDED(found->get_CurrentNativeWindowHandle(&native)))
            info.handle = reinterpret_cast<WindowHandle>(native);
        return info;
    }

    bool invokeDefaultAction(WindowHandle control, std::string &err) override {
        if (!control) {
            err = "no native handle";
            return false;
        }
        ComPtr<IAccessible> acc;
        HRESULT hr = AccessibleObjectFromWindow(
            toHwnd(control), static_cast<DWORD>(OBJID_CLIENT),
            IID_PPV_ARGS(&acc));
        if (FAILED(hr) || !acc) {
            err = "AccessibleObjectFromWindow hr=" +
                  std::to_string(static_cast<unsigned long>(hr));
            return false;
        }
        VARIANT self;
        VariantInit(&self);
        self.vt = VT_I4;
        self.lVal = CHILDID_SELF;
        hr = acc->accDoDefaultAction(self);
        if (FAILED(hr)) {
            err = "accDoDefaultAction hr=" +
                  std::to_string(static_cast<unsigned long>(hr));
            return false;
        }
        return true;
    }

    void synthesizeClick(WindowHandle control) override {
        if (!control)
            return;
        SendMessageW(toHwnd(control), WM_LBUTTONDOWN, 0, 0);
        SendMessageW(toHwnd(control), WM_LBUTTONUP, 0, 0);
        SendMessageW(toHwnd(control), BM_CLICK, 0, 0);
    }

private:
    ComPtr<IUIAutomation> uia_;
    bool comInitialized_ = false;
};

#else

// Without a window system binding nothing is ever found, which degrades
// supervision to "window never appeared".
class UnsupportedWindowAutomation : public WindowAutomation {
public:
    bool setWindowText(WindowHandle, const std::string &) override {
        return false;
    }
    WindowHandle findChildByClass(WindowHandle, const std::string &) override {
        return 0;
    }
    WindowHandle lastActivePopup(WindowHandle owner) override { return owner; }
    std::optional<ControlInfo> findControlById(WindowHandle,
                                               const std::string &) override {
        return std::nullopt;
    }
    bool invokeDefaultAction(WindowHandle, std::string &err) override {
        err = "not supported on this platform";
        return false;
    }
    void synthesizeClick(WindowHandle) override {}
};

#endif

} // namespace

std::unique_ptr<WindowAutomation> createDesktopAutomation() {
#if defined(_WIN32)
    return std::make_unique<Win32WindowAutomation>();
#else
    return std::make_unique<UnsupportedWindowAutomation>();
#endif
}

} // namespace rdpvisor
