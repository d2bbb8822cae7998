// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "core/interfaces.h"
#include <QLibrary>
#include <memory>

namespace DeskPin {

/**
 * @brief IWindowSystem bound to user32 at runtime
 *
 * Resolves every entry point through QLibrary instead of linking user32, so a
 * missing library or symbol surfaces as "unavailable" from CapabilityProbe
 * rather than as a loader error at process start.
 */
class Win32WindowSystem : public IWindowSystem
{
public:
    /**
     * @brief Load user32 and resolve all symbols
     * @param reason Filled with the failing library/symbol on error
     * @return Bound instance, or nullptr
     */
    static std::unique_ptr<Win32WindowSystem> load(QString* reason);

    ~Win32WindowSystem() override;

    NativeHandle findWindow(const QString& className) const override;
    NativeHandle findChildWindow(NativeHandle parent, const QString& className) const override;
    void enumerateTopLevelWindows(const WindowVisitor& visitor) const override;
    std::optional<NativeHandle> previousSibling(NativeHandle window) const override;

    std::optional<QRect> windowRect(NativeHandle window) const override;
    std::optional<quint32> windowStyle(NativeHandle window) const override;
    bool setWindowStyle(NativeHandle window, quint32 style) override;

    bool setParent(NativeHandle window, NativeHandle newParent) override;
    bool setWindowPosition(NativeHandle window, const QRect& geometry, PositionFlags flags) override;

private:
    Win32WindowSystem();

    struct Api;
    QLibrary m_user32;
    std::unique_ptr<Api> m_api;
};

} // namespace DeskPin
