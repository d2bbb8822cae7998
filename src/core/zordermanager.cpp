// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "zordermanager.h"
#include "interfaces.h"
#include "logging.h"
#include "shelllocator.h"
#include <QScopedValueRollback>
#include <utility>

namespace DeskPin {

namespace {
ZOrderConfig boundedConfig(ZOrderConfig config)
{
    config.sweepIntervalMs = qBound(Defaults::MinSweepIntervalMs, config.sweepIntervalMs, Defaults::MaxSweepIntervalMs);
    config.siblingSearchDepth =
        qBound(Defaults::MinSiblingSearchDepth, config.siblingSearchDepth, Defaults::MaxSiblingSearchDepth);
    return config;
}
} // anonymous namespace

ZOrderManager::ZOrderManager(IWindowSystem* windowSystem, ShellLocator* shellLocator,
                             const ZOrderConfig& config, QObject* parent)
    : QObject(parent)
    , m_windowSystem(windowSystem)
    , m_shellLocator(shellLocator)
    , m_config(boundedConfig(config))
{
    Q_ASSERT(windowSystem);
    Q_ASSERT(shellLocator);

    m_sweepTimer.setInterval(m_config.sweepIntervalMs);
    connect(&m_sweepTimer, &QTimer::timeout, this, &ZOrderManager::sweep);
}

// Observer connections use this object as context and drop with it
ZOrderManager::~ZOrderManager() = default;

// ═══════════════════════════════════════════════════════════════════════════════
// Queue Management
// ═══════════════════════════════════════════════════════════════════════════════

void ZOrderManager::registerWindow(const QString& windowId, NativeHandle handle, WindowObserver* observer)
{
    if (windowId.isEmpty() || handle.isNull()) {
        qCWarning(lcZOrder) << "Refusing to register window with empty id or null handle:" << windowId << handle;
        return;
    }

    const int index = indexOf(windowId);
    if (index >= 0) {
        WindowEntry& existing = m_windows[index];
        if (existing.handle == handle) {
            return;
        }

        // Recreated window: it appeared at the top of its siblings, so it becomes the topmost entry
        qCInfo(lcZOrder) << "Window" << windowId << "recreated, handle" << existing.handle << "->" << handle;
        existing.handle = handle;
        if (observer && observer != existing.observer) {
            releaseEntry(existing);
            connectObserver(existing, observer);
        }
        bringToFront(windowId);
        return;
    }

    WindowEntry entry;
    entry.windowId = windowId;
    entry.handle = handle;
    connectObserver(entry, observer);

    // New registrant is the topmost entry
    m_windows.append(entry);
    qCDebug(lcZOrder) << "Registered" << windowId << handle << "queue size:" << m_windows.size();
    Q_EMIT windowRegistered(windowId);

    startSweepTimer();
    raise(entry);
}

void ZOrderManager::unregisterWindow(const QString& windowId)
{
    const int index = indexOf(windowId);
    if (index < 0) {
        return;
    }

    // Copy: windowId may alias the entry being removed
    const QString id = windowId;
    takeEntry(index);
    qCDebug(lcZOrder) << "Unregistered" << id << "queue size:" << m_windows.size();
    Q_EMIT windowUnregistered(id);

    if (m_windows.isEmpty()) {
        stopSweepTimer();
    }
}

void ZOrderManager::bringToFront(const QString& windowId)
{
    const int index = indexOf(windowId);
    if (index < 0) {
        return;
    }

    const int last = m_windows.size() - 1;
    if (index != last) {
        m_windows.move(index, last);
    }
    raise(m_windows.constLast());
}

void ZOrderManager::cleanupAll()
{
    QVector<WindowEntry> entries = std::exchange(m_windows, {});
    if (!entries.isEmpty()) {
        qCInfo(lcZOrder) << "Releasing" << entries.size() << "attached windows";
    }

    for (WindowEntry& entry : entries) {
        releaseEntry(entry);
        Q_EMIT windowUnregistered(entry.windowId);
    }

    stopSweepTimer();
}

// ═══════════════════════════════════════════════════════════════════════════════
// Queries
// ═══════════════════════════════════════════════════════════════════════════════

bool ZOrderManager::isRegistered(const QString& windowId) const
{
    return indexOf(windowId) >= 0;
}

NativeHandle ZOrderManager::handleFor(const QString& windowId) const
{
    const int index = indexOf(windowId);
    return index >= 0 ? m_windows.at(index).handle : NativeHandle();
}

QStringList ZOrderManager::windowOrder() const
{
    QStringList order;
    order.reserve(m_windows.size());
    for (const WindowEntry& entry : m_windows) {
        order.append(entry.windowId);
    }
    return order;
}

void ZOrderManager::setConfig(const ZOrderConfig& config)
{
    const ZOrderConfig bounded = boundedConfig(config);
    if (bounded == m_config) {
        return;
    }

    m_config = bounded;
    // Restarts the timer if it is running
    m_sweepTimer.setInterval(m_config.sweepIntervalMs);
    qCDebug(lcZOrder) << "Sweep interval" << m_config.sweepIntervalMs << "ms, sibling depth"
                      << m_config.siblingSearchDepth;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Sweep
// ═══════════════════════════════════════════════════════════════════════════════

void ZOrderManager::sweep()
{
    if (m_sweeping) {
        qCDebug(lcZOrder) << "Sweep already in progress, skipping";
        return;
    }
    if (m_windows.isEmpty()) {
        return;
    }

    QScopedValueRollback<bool> guard(m_sweeping, true);

    const std::optional<ShellTarget> shell = m_shellLocator->locate();
    if (!shell) {
        qCDebug(lcZOrder) << "Icon view not found, skipping sweep";
        return;
    }

    // A dead topmost window says nothing about the icon view; check the next one down
    while (!m_windows.isEmpty()) {
        const WindowEntry top = m_windows.constLast();
        bool stale = false;
        const bool covered = isCoveredBy(top, shell->iconView, &stale);

        if (stale) {
            qCWarning(lcZOrder) << "Window" << top.windowId << top.handle << "no longer exists, evicting";
            evict(top.windowId);
            continue;
        }

        if (covered) {
            qCDebug(lcZOrder) << "Icon view" << shell->iconView << "is above" << top.windowId << "- restoring order";
            restoreOrder();
        }
        return;
    }
}

bool ZOrderManager::isCoveredBy(const WindowEntry& entry, NativeHandle iconView, bool* stale) const
{
    NativeHandle current = entry.handle;

    for (int step = 0; step < m_config.siblingSearchDepth; ++step) {
        const std::optional<NativeHandle> above = m_windowSystem->previousSibling(current);
        if (!above) {
            // Only the first step queries the tracked window itself
            *stale = (step == 0);
            return false;
        }
        if (above->isNull()) {
            return false; // reached the top of the stack
        }
        if (*above == iconView) {
            return true;
        }
        current = *above;
    }

    return false;
}

void ZOrderManager::restoreOrder()
{
    // Raising a window can evict it; walk a snapshot
    const QVector<WindowEntry> snapshot = m_windows;
    int restored = 0;

    for (const WindowEntry& entry : snapshot) {
        const int index = indexOf(entry.windowId);
        if (index < 0 || m_windows.at(index).handle != entry.handle) {
            continue;
        }
        if (raise(entry)) {
            ++restored;
        }
    }

    qCDebug(lcZOrder) << "Re-raised" << restored << "of" << snapshot.size() << "windows";
    Q_EMIT orderRestored(restored);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Helpers
// ═══════════════════════════════════════════════════════════════════════════════

int ZOrderManager::indexOf(const QString& windowId) const
{
    for (int i = 0; i < m_windows.size(); ++i) {
        if (m_windows.at(i).windowId == windowId) {
            return i;
        }
    }
    return -1;
}

bool ZOrderManager::raise(const WindowEntry& entry)
{
    if (m_windowSystem->setWindowPosition(entry.handle, QRect(),
                                          PositionFlag::NoMove | PositionFlag::NoSize | PositionFlag::NoActivate)) {
        qCDebug(lcZOrder) << "Raised" << entry.windowId;
        return true;
    }

    const QString windowId = entry.windowId;
    qCWarning(lcZOrder) << "Raising" << windowId << entry.handle << "failed, evicting stale window";
    evict(windowId);
    return false;
}

void ZOrderManager::evict(const QString& windowId)
{
    if (!isRegistered(windowId)) {
        return;
    }
    const QString id = windowId;
    unregisterWindow(id);
    Q_EMIT windowEvicted(id);
}

void ZOrderManager::connectObserver(WindowEntry& entry, WindowObserver* observer)
{
    entry.observer = observer;
    if (!observer) {
        return;
    }

    const QString windowId = entry.windowId;
    entry.connections.append(connect(observer, &WindowObserver::focused, this, [this, windowId]() {
        bringToFront(windowId);
    }));
    entry.connections.append(connect(observer, &WindowObserver::closed, this, [this, windowId]() {
        qCDebug(lcZOrder) << "Window" << windowId << "closed";
        unregisterWindow(windowId);
    }));
}

WindowEntry ZOrderManager::takeEntry(int index)
{
    WindowEntry entry = m_windows.takeAt(index);
    releaseEntry(entry);
    return entry;
}

void ZOrderManager::releaseEntry(WindowEntry& entry)
{
    for (const QMetaObject::Connection& connection : std::as_const(entry.connections)) {
        disconnect(connection);
    }
    entry.connections.clear();
}

void ZOrderManager::startSweepTimer()
{
    if (m_sweepTimer.isActive()) {
        return;
    }
    m_sweepTimer.start();
    qCDebug(lcZOrder) << "Sweep timer started," << m_sweepTimer.interval() << "ms";
    Q_EMIT sweepTimerActiveChanged(true);
}

void ZOrderManager::stopSweepTimer()
{
    if (!m_sweepTimer.isActive()) {
        return;
    }
    m_sweepTimer.stop();
    qCDebug(lcZOrder) << "Sweep timer stopped";
    Q_EMIT sweepTimerActiveChanged(false);
}

} // namespace DeskPin
