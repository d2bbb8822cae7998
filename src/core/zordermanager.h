// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "deskpin_export.h"
#include "types.h"
#include <QObject>
#include <QString>
#include <QStringList>
#include <QTimer>
#include <QVector>

namespace DeskPin {

class IWindowSystem;
class ShellLocator;
class WindowObserver;

/**
 * @brief Keeps shell-attached windows stacked above the desktop icons
 *
 * Holds the queue of attached windows ordered by "most recently brought to
 * front" (last entry = topmost). The queue is the source of truth; the OS
 * stacking order is a mirror of it that this class verifies and repairs:
 *
 * - registerWindow()/bringToFront() raise the affected window immediately.
 * - A single sweep timer, running only while the queue is non-empty, checks
 *   whether the icon view has been promoted above the topmost window and, if
 *   so, re-raises every window bottom to top.
 *
 * Everything runs on the owning thread's event loop. Sweeps are serialized and
 * iterate over a snapshot of the queue, so windows may be removed while a
 * correction is in progress.
 *
 * A failed correction means the handle no longer refers to a live window: the
 * entry is evicted and windowEvicted() is emitted.
 */
class DESKPIN_EXPORT ZOrderManager : public QObject
{
    Q_OBJECT

public:
    explicit ZOrderManager(IWindowSystem* windowSystem, ShellLocator* shellLocator,
                           const ZOrderConfig& config = {}, QObject* parent = nullptr);
    ~ZOrderManager() override;

    // ═══════════════════════════════════════════════════════════════════════════
    // Queue Management
    // ═══════════════════════════════════════════════════════════════════════════

    /**
     * @brief Start tracking a window as the new topmost entry
     * @param windowId Logical window id
     * @param handle Current native handle
     * @param observer Optional focus/close source; focus brings the window to
     *        front, close unregisters it
     *
     * No-op for an id that is already registered with the same handle. A
     * changed handle (window recreated under the same id) replaces the stored
     * one, the entry moves to the top and a new @p observer replaces the old.
     */
    void registerWindow(const QString& windowId, NativeHandle handle, WindowObserver* observer = nullptr);

    /**
     * @brief Stop tracking a window (no-op for unknown ids)
     */
    void unregisterWindow(const QString& windowId);

    /**
     * @brief Move a window to the top of the queue and raise it
     */
    void bringToFront(const QString& windowId);

    /**
     * @brief Drop every entry and stop the sweep timer
     */
    void cleanupAll();

    // ═══════════════════════════════════════════════════════════════════════════
    // Queries
    // ═══════════════════════════════════════════════════════════════════════════

    bool isRegistered(const QString& windowId) const;
    NativeHandle handleFor(const QString& windowId) const;
    int count() const { return m_windows.size(); }

    /**
     * @brief Window ids bottom to top (last = topmost)
     */
    QStringList windowOrder() const;

    bool isSweepTimerActive() const { return m_sweepTimer.isActive(); }

    // ═══════════════════════════════════════════════════════════════════════════
    // Configuration
    // ═══════════════════════════════════════════════════════════════════════════

    ZOrderConfig config() const { return m_config; }

    /**
     * @brief Apply new tunables; a running sweep timer adopts the new interval
     */
    void setConfig(const ZOrderConfig& config);

public Q_SLOTS:
    /**
     * @brief One consistency check (driven by the sweep timer)
     */
    void sweep();

Q_SIGNALS:
    void windowRegistered(const QString& windowId);

    /**
     * @brief Emitted for every removal: explicit, closed, evicted or cleanupAll()
     */
    void windowUnregistered(const QString& windowId);

    /**
     * @brief Emitted when a window is dropped because its handle went stale
     */
    void windowEvicted(const QString& windowId);

    void sweepTimerActiveChanged(bool active);

    /**
     * @brief Emitted after a sweep re-raised the whole queue
     * @param windowCount Number of windows re-raised
     */
    void orderRestored(int windowCount);

private:
    int indexOf(const QString& windowId) const;

    /**
     * @brief Raise one window to the top of its siblings without activating it
     * @return false if the call failed (the entry has then been evicted)
     */
    bool raise(const WindowEntry& entry);

    /**
     * @brief Walk the sibling chain above @p entry looking for @p iconView
     * @return true if found within the configured depth; *stale is set if the
     *         entry's own handle is dead
     */
    bool isCoveredBy(const WindowEntry& entry, NativeHandle iconView, bool* stale) const;

    void restoreOrder();
    void evict(const QString& windowId);
    void connectObserver(WindowEntry& entry, WindowObserver* observer);
    WindowEntry takeEntry(int index);
    void releaseEntry(WindowEntry& entry);

    void startSweepTimer();
    void stopSweepTimer();

    IWindowSystem* m_windowSystem;
    ShellLocator* m_shellLocator;
    ZOrderConfig m_config;

    QVector<WindowEntry> m_windows; // bottom -> top
    QTimer m_sweepTimer;
    bool m_sweeping = false;
};

} // namespace DeskPin
