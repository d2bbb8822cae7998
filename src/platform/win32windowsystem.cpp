// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "win32windowsystem.h"
#include "core/logging.h"

#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>

#include <type_traits>

namespace DeskPin {

namespace {

HWND toHwnd(NativeHandle handle)
{
    return reinterpret_cast<HWND>(handle.value());
}

NativeHandle fromHwnd(HWND hwnd)
{
    return NativeHandle(reinterpret_cast<quintptr>(hwnd));
}

LPCWSTR toWide(const QString& text)
{
    return reinterpret_cast<LPCWSTR>(text.utf16());
}

// GetWindowLongPtrW/SetWindowLongPtrW are macros over the 32-bit entry points on x86
#ifdef _WIN64
constexpr const char* GetStyleSymbol = "GetWindowLongPtrW";
constexpr const char* SetStyleSymbol = "SetWindowLongPtrW";
#else
constexpr const char* GetStyleSymbol = "GetWindowLongW";
constexpr const char* SetStyleSymbol = "SetWindowLongW";
#endif

BOOL CALLBACK visitTopLevelWindow(HWND hwnd, LPARAM param)
{
    const auto* visit = reinterpret_cast<const IWindowSystem::WindowVisitor*>(param);
    return (*visit)(fromHwnd(hwnd)) ? TRUE : FALSE;
}

} // namespace

struct Win32WindowSystem::Api
{
    using FindWindowWFn = HWND(WINAPI*)(LPCWSTR, LPCWSTR);
    using FindWindowExWFn = HWND(WINAPI*)(HWND, HWND, LPCWSTR, LPCWSTR);
    using EnumWindowsFn = BOOL(WINAPI*)(WNDENUMPROC, LPARAM);
    using GetWindowFn = HWND(WINAPI*)(HWND, UINT);
    using IsWindowFn = BOOL(WINAPI*)(HWND);
    using GetWindowRectFn = BOOL(WINAPI*)(HWND, LPRECT);
    using GetWindowLongPtrWFn = LONG_PTR(WINAPI*)(HWND, int);
    using SetWindowLongPtrWFn = LONG_PTR(WINAPI*)(HWND, int, LONG_PTR);
    using SetParentFn = HWND(WINAPI*)(HWND, HWND);
    using SetWindowPosFn = BOOL(WINAPI*)(HWND, HWND, int, int, int, int, UINT);

    FindWindowWFn findWindow = nullptr;
    FindWindowExWFn findWindowEx = nullptr;
    EnumWindowsFn enumWindows = nullptr;
    GetWindowFn getWindow = nullptr;
    IsWindowFn isWindow = nullptr;
    GetWindowRectFn getWindowRect = nullptr;
    GetWindowLongPtrWFn getWindowLong = nullptr;
    SetWindowLongPtrWFn setWindowLong = nullptr;
    SetParentFn setParent = nullptr;
    SetWindowPosFn setWindowPos = nullptr;
};

Win32WindowSystem::Win32WindowSystem()
    : m_user32(QStringLiteral("user32"))
    , m_api(std::make_unique<Api>())
{
}

Win32WindowSystem::~Win32WindowSystem() = default;

std::unique_ptr<Win32WindowSystem> Win32WindowSystem::load(QString* reason)
{
    std::unique_ptr<Win32WindowSystem> system(new Win32WindowSystem());

    if (!system->m_user32.load()) {
        *reason = QStringLiteral("cannot load user32: %1").arg(system->m_user32.errorString());
        return nullptr;
    }

    Api& api = *system->m_api;
    QLibrary& lib = system->m_user32;
    bool ok = true;

    auto bind = [&](auto& fn, const char* symbol) {
        fn = reinterpret_cast<std::remove_reference_t<decltype(fn)>>(lib.resolve(symbol));
        if (!fn && ok) {
            ok = false;
            *reason = QStringLiteral("user32 lacks symbol %1").arg(QLatin1String(symbol));
        }
    };

    bind(api.findWindow, "FindWindowW");
    bind(api.findWindowEx, "FindWindowExW");
    bind(api.enumWindows, "EnumWindows");
    bind(api.getWindow, "GetWindow");
    bind(api.isWindow, "IsWindow");
    bind(api.getWindowRect, "GetWindowRect");
    bind(api.getWindowLong, GetStyleSymbol);
    bind(api.setWindowLong, SetStyleSymbol);
    bind(api.setParent, "SetParent");
    bind(api.setWindowPos, "SetWindowPos");

    if (!ok) {
        return nullptr;
    }

    qCDebug(lcProbe) << "Resolved user32 from" << lib.fileName();
    return system;
}

NativeHandle Win32WindowSystem::findWindow(const QString& className) const
{
    return fromHwnd(m_api->findWindow(toWide(className), nullptr));
}

NativeHandle Win32WindowSystem::findChildWindow(NativeHandle parent, const QString& className) const
{
    return fromHwnd(m_api->findWindowEx(toHwnd(parent), nullptr, toWide(className), nullptr));
}

void Win32WindowSystem::enumerateTopLevelWindows(const WindowVisitor& visitor) const
{
    // EnumWindows returns FALSE both on error and when the callback stops early;
    // the visitor already saw every window either way
    m_api->enumWindows(&visitTopLevelWindow, reinterpret_cast<LPARAM>(&visitor));
}

std::optional<NativeHandle> Win32WindowSystem::previousSibling(NativeHandle window) const
{
    if (!m_api->isWindow(toHwnd(window))) {
        return std::nullopt;
    }
    return fromHwnd(m_api->getWindow(toHwnd(window), GW_HWNDPREV));
}

std::optional<QRect> Win32WindowSystem::windowRect(NativeHandle window) const
{
    RECT rect{};
    if (!m_api->getWindowRect(toHwnd(window), &rect)) {
        return std::nullopt;
    }
    return QRect(QPoint(rect.left, rect.top), QSize(rect.right - rect.left, rect.bottom - rect.top));
}

std::optional<quint32> Win32WindowSystem::windowStyle(NativeHandle window) const
{
    SetLastError(ERROR_SUCCESS);
    const LONG_PTR style = m_api->getWindowLong(toHwnd(window), GWL_STYLE);
    if (style == 0 && GetLastError() != ERROR_SUCCESS) {
        return std::nullopt;
    }
    return static_cast<quint32>(style);
}

bool Win32WindowSystem::setWindowStyle(NativeHandle window, quint32 style)
{
    // A previous value of 0 is only an error if the last-error code says so
    SetLastError(ERROR_SUCCESS);
    const LONG_PTR previous = m_api->setWindowLong(toHwnd(window), GWL_STYLE, static_cast<LONG_PTR>(style));
    return previous != 0 || GetLastError() == ERROR_SUCCESS;
}

bool Win32WindowSystem::setParent(NativeHandle window, NativeHandle newParent)
{
    // Top-level windows have no previous parent, so NULL alone is not a failure
    SetLastError(ERROR_SUCCESS);
    const HWND previous = m_api->setParent(toHwnd(window), toHwnd(newParent));
    return previous != nullptr || GetLastError() == ERROR_SUCCESS;
}

bool Win32WindowSystem::setWindowPosition(NativeHandle window, const QRect& geometry, PositionFlags flags)
{
    return m_api->setWindowPos(toHwnd(window), HWND_TOP, geometry.x(), geometry.y(), geometry.width(),
                               geometry.height(), static_cast<UINT>(flags.toInt()))
        != FALSE;
}

} // namespace DeskPin
