// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "desktopattach.h"
#include "capabilityprobe.h"
#include "interfaces.h"
#include "logging.h"
#include "reparentengine.h"
#include "shelllocator.h"
#include "windowobserver.h"
#include "zordermanager.h"
#include <QWindow>

namespace DeskPin {

DesktopAttach::DesktopAttach(QObject* parent)
    : DesktopAttach(std::make_unique<CapabilityProbe>(), parent)
{
}

DesktopAttach::DesktopAttach(std::unique_ptr<CapabilityProbe> probe, QObject* parent)
    : QObject(parent)
    , m_probe(std::move(probe))
{
    Q_ASSERT(m_probe);
}

DesktopAttach::~DesktopAttach() = default;

// ═══════════════════════════════════════════════════════════════════════════════
// Capability
// ═══════════════════════════════════════════════════════════════════════════════

bool DesktopAttach::isAvailable()
{
    return ensureServices();
}

QString DesktopAttach::unavailableReason() const
{
    return m_probe->unavailableReason();
}

bool DesktopAttach::ensureServices()
{
    if (!m_probe->isAvailable()) {
        return false;
    }
    if (m_zOrderManager) {
        return true;
    }

    IWindowSystem* windowSystem = m_probe->bindings();
    m_shellLocator = std::make_unique<ShellLocator>(windowSystem);
    m_zOrderManager = std::make_unique<ZOrderManager>(windowSystem, m_shellLocator.get(), m_config);
    m_reparentEngine =
        std::make_unique<ReparentEngine>(windowSystem, m_shellLocator.get(), m_zOrderManager.get());

    // Closed and evicted windows no longer need their container
    connect(m_zOrderManager.get(), &ZOrderManager::windowUnregistered, this, [this](const QString& windowId) {
        m_reparentEngine->forgetContainer(windowId);
    });

    return true;
}

NativeHandle DesktopAttach::resolveHandle(const QString& windowId, const HandleProvider& handleProvider) const
{
    if (!handleProvider) {
        qCWarning(lcCore) << "No handle provider for" << windowId;
        return NativeHandle();
    }

    const NativeHandle handle = handleProvider();
    if (handle.isNull()) {
        qCWarning(lcCore) << "Handle provider for" << windowId << "returned a null handle";
    }
    return handle;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Attach / Detach
// ═══════════════════════════════════════════════════════════════════════════════

bool DesktopAttach::attach(const QString& windowId, const HandleProvider& handleProvider, WindowObserver* observer)
{
    if (!ensureServices()) {
        qCWarning(lcCore) << "Cannot attach" << windowId << "-" << m_probe->unavailableReason();
        return false;
    }

    const NativeHandle handle = resolveHandle(windowId, handleProvider);
    if (handle.isNull()) {
        return false;
    }

    if (!m_reparentEngine->attachWindow(windowId, handle, observer)) {
        return false;
    }

    Q_EMIT windowAttached(windowId);
    return true;
}

bool DesktopAttach::attach(const QString& windowId, QWindow* window)
{
    if (!window) {
        qCWarning(lcCore) << "Cannot attach" << windowId << "- no window";
        return false;
    }

    QPointer<QWindow> guard(window);
    return attach(
        windowId,
        [guard]() {
            return guard ? NativeHandle::fromWinId(guard->winId()) : NativeHandle();
        },
        QtWindowObserver::forWindow(window));
}

bool DesktopAttach::detach(const QString& windowId, const HandleProvider& handleProvider)
{
    if (!ensureServices()) {
        return false;
    }

    const NativeHandle handle = resolveHandle(windowId, handleProvider);
    if (handle.isNull()) {
        // Still stop tracking: the window is gone or never existed
        m_zOrderManager->unregisterWindow(windowId);
        return false;
    }

    const bool detached = m_reparentEngine->detachWindow(windowId, handle);
    if (detached) {
        Q_EMIT windowDetached(windowId);
    }
    return detached;
}

bool DesktopAttach::detach(const QString& windowId, QWindow* window)
{
    if (!window) {
        qCWarning(lcCore) << "Cannot detach" << windowId << "- no window";
        return false;
    }

    QPointer<QWindow> guard(window);
    return detach(windowId, [guard]() {
        return guard ? NativeHandle::fromWinId(guard->winId()) : NativeHandle();
    });
}

bool DesktopAttach::toggle(const QString& windowId, const HandleProvider& handleProvider, bool enable,
                           WindowObserver* observer)
{
    return enable ? attach(windowId, handleProvider, observer) : detach(windowId, handleProvider);
}

bool DesktopAttach::toggle(const QString& windowId, QWindow* window, bool enable)
{
    return enable ? attach(windowId, window) : detach(windowId, window);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Stacking
// ═══════════════════════════════════════════════════════════════════════════════

void DesktopAttach::bringToFront(const QString& windowId)
{
    if (!ensureServices()) {
        return;
    }
    m_zOrderManager->bringToFront(windowId);
}

void DesktopAttach::cleanupAll()
{
    if (!ensureServices()) {
        return;
    }
    m_zOrderManager->cleanupAll();
    m_reparentEngine->forgetAll();
}

// ═══════════════════════════════════════════════════════════════════════════════
// Queries / Configuration
// ═══════════════════════════════════════════════════════════════════════════════

bool DesktopAttach::isAttached(const QString& windowId) const
{
    return m_zOrderManager && m_zOrderManager->isRegistered(windowId);
}

QStringList DesktopAttach::attachedWindows() const
{
    return m_zOrderManager ? m_zOrderManager->windowOrder() : QStringList();
}

void DesktopAttach::setZOrderConfig(const ZOrderConfig& config)
{
    m_config = config;
    if (m_zOrderManager) {
        m_zOrderManager->setConfig(config);
    }
}

} // namespace DeskPin
