// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "deskpin_export.h"
#include "types.h"
#include <QHash>
#include <QRect>
#include <QString>
#include <QStringList>

namespace DeskPin {

class IWindowSystem;
class ShellLocator;
class WindowObserver;
class ZOrderManager;

/**
 * @brief Moves windows into and out of the desktop icon layer
 *
 * Attaching makes the window a sibling of the icon view (a child of the icon
 * view's container) so it can be stacked above the icons. The window's
 * on-screen position is preserved across the parent change: window rects are
 * read in screen coordinates, but once parented, SetWindowPos expects
 * coordinates relative to the container's client area, so the container
 * origin is subtracted by hand.
 *
 * The engine remembers which container each window id was attached to; the
 * entry lives from a successful attach until detach, window close, eviction or
 * cleanup (see forgetContainer()).
 */
class DESKPIN_EXPORT ReparentEngine
{
public:
    ReparentEngine(IWindowSystem* windowSystem, ShellLocator* shellLocator, ZOrderManager* zOrderManager);

    /**
     * @brief Attach a window above the desktop icons
     * @param windowId Logical window id
     * @param handle Native handle of the window
     * @param observer Optional focus/close source handed to the Z-order manager
     * @return true on success; on failure nothing is left half-attached
     */
    bool attachWindow(const QString& windowId, NativeHandle handle, WindowObserver* observer = nullptr);

    /**
     * @brief Return a window to an ordinary top-level window at the same position
     * @return true on success
     */
    bool detachWindow(const QString& windowId, NativeHandle handle);

    bool isAttached(const QString& windowId) const { return m_containers.contains(windowId); }

    /**
     * @brief Container the window was attached to, or a null handle
     */
    NativeHandle containerFor(const QString& windowId) const { return m_containers.value(windowId); }

    QStringList attachedWindows() const { return m_containers.keys(); }

    void forgetContainer(const QString& windowId);
    void forgetAll();

private:
    /**
     * @brief Best-effort undo of a partially applied attach
     */
    void rollbackAttach(const QString& windowId, NativeHandle handle, const QRect& screenRect);

    IWindowSystem* m_windowSystem;
    ShellLocator* m_shellLocator;
    ZOrderManager* m_zOrderManager;

    QHash<QString, NativeHandle> m_containers; // windowId -> container
};

} // namespace DeskPin
