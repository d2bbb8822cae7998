// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "reparentengine.h"
#include "interfaces.h"
#include "logging.h"
#include "shelllocator.h"
#include "zordermanager.h"

namespace DeskPin {

ReparentEngine::ReparentEngine(IWindowSystem* windowSystem, ShellLocator* shellLocator,
                               ZOrderManager* zOrderManager)
    : m_windowSystem(windowSystem)
    , m_shellLocator(shellLocator)
    , m_zOrderManager(zOrderManager)
{
    Q_ASSERT(windowSystem);
    Q_ASSERT(shellLocator);
    Q_ASSERT(zOrderManager);
}

bool ReparentEngine::attachWindow(const QString& windowId, NativeHandle handle, WindowObserver* observer)
{
    if (windowId.isEmpty() || handle.isNull()) {
        qCWarning(lcReparent) << "Cannot attach: empty window id or null handle" << windowId << handle;
        return false;
    }

    const std::optional<ShellTarget> shell = m_shellLocator->locate();
    if (!shell) {
        qCWarning(lcReparent) << "Cannot attach" << windowId << "- desktop icon view or its container not found";
        return false;
    }

    // Position to preserve, in screen coordinates
    const std::optional<QRect> screenRect = m_windowSystem->windowRect(handle);
    if (!screenRect) {
        qCWarning(lcReparent) << "Cannot attach" << windowId << "- failed to read window rect of" << handle;
        return false;
    }

    // Keep WS_POPUP: clearing it changes how the window is decorated and composited
    const std::optional<quint32> style = m_windowSystem->windowStyle(handle);
    if (!style) {
        qCWarning(lcReparent) << "Cannot attach" << windowId << "- failed to read window style";
        return false;
    }
    const bool styleChanged = (*style & WindowStyle::Visible) == 0;
    if (styleChanged && !m_windowSystem->setWindowStyle(handle, *style | WindowStyle::Visible)) {
        qCWarning(lcReparent) << "Cannot attach" << windowId << "- failed to update window style";
        return false;
    }

    if (!m_windowSystem->setParent(handle, shell->container)) {
        qCWarning(lcReparent) << "Cannot attach" << windowId << "- SetParent to" << shell->container << "failed";
        if (styleChanged && !m_windowSystem->setWindowStyle(handle, *style)) {
            qCWarning(lcReparent) << "Could not restore original style of" << windowId;
        }
        return false;
    }
    m_containers.insert(windowId, shell->container);

    // From here on a failure must not leave the window parented at a shifted position
    const std::optional<QRect> containerRect = m_windowSystem->windowRect(shell->container);
    if (!containerRect) {
        qCWarning(lcReparent) << "Attach of" << windowId << "failed - cannot read container rect";
        rollbackAttach(windowId, handle, *screenRect);
        return false;
    }

    const QRect clientRect(screenRect->topLeft() - containerRect->topLeft(), screenRect->size());
    if (!m_windowSystem->setWindowPosition(handle, clientRect,
                                           PositionFlag::ShowWindow | PositionFlag::NoActivate)) {
        qCWarning(lcReparent) << "Attach of" << windowId << "failed - cannot position window at" << clientRect;
        rollbackAttach(windowId, handle, *screenRect);
        return false;
    }

    const bool reattached = m_zOrderManager->handleFor(windowId) == handle;
    m_zOrderManager->registerWindow(windowId, handle, observer);
    if (reattached) {
        // Repositioning put the window on top; keep the queue in step
        m_zOrderManager->bringToFront(windowId);
    }
    if (!m_zOrderManager->isRegistered(windowId)) {
        // Evicted on its first raise
        qCWarning(lcReparent) << "Attach of" << windowId << "failed - window could not be raised";
        rollbackAttach(windowId, handle, *screenRect);
        return false;
    }

    qCInfo(lcReparent) << "Attached" << windowId << "to" << shell->container << "screen" << *screenRect
                       << "client" << clientRect.topLeft();
    return true;
}

bool ReparentEngine::detachWindow(const QString& windowId, NativeHandle handle)
{
    const NativeHandle container = m_containers.value(windowId);

    // Unregister first so no correction touches the window mid-detach
    m_zOrderManager->unregisterWindow(windowId);

    if (handle.isNull()) {
        qCWarning(lcReparent) << "Cannot detach" << windowId << "- null handle";
        forgetContainer(windowId);
        return false;
    }

    // Window rects are screen-relative whatever the parent
    const std::optional<QRect> screenRect = m_windowSystem->windowRect(handle);
    if (!screenRect) {
        qCWarning(lcReparent) << "Cannot detach" << windowId << "- failed to read window rect of" << handle;
        forgetContainer(windowId);
        return false;
    }

    if (!m_windowSystem->setParent(handle, NativeHandle())) {
        qCWarning(lcReparent) << "Cannot detach" << windowId << "- SetParent(NULL) failed";
        forgetContainer(windowId);
        return false;
    }

    const bool positioned =
        m_windowSystem->setWindowPosition(handle, *screenRect, PositionFlag::ShowWindow | PositionFlag::NoActivate);
    forgetContainer(windowId);

    if (!positioned) {
        qCWarning(lcReparent) << "Detached" << windowId << "but failed to restore position" << *screenRect;
        return false;
    }

    qCInfo(lcReparent) << "Detached" << windowId << "from" << container << "at" << *screenRect;
    return true;
}

void ReparentEngine::forgetContainer(const QString& windowId)
{
    m_containers.remove(windowId);
}

void ReparentEngine::forgetAll()
{
    m_containers.clear();
}

void ReparentEngine::rollbackAttach(const QString& windowId, NativeHandle handle, const QRect& screenRect)
{
    m_zOrderManager->unregisterWindow(windowId);
    forgetContainer(windowId);

    if (!m_windowSystem->setParent(handle, NativeHandle())) {
        qCWarning(lcReparent) << "Rollback of" << windowId << "could not reset parent";
        return;
    }
    if (!m_windowSystem->setWindowPosition(handle, screenRect, PositionFlag::ShowWindow | PositionFlag::NoActivate)) {
        qCWarning(lcReparent) << "Rollback of" << windowId << "could not restore" << screenRect;
    }
}

} // namespace DeskPin
