// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "deskpin_export.h"
#include "types.h"
#include <QObject>
#include <QString>
#include <QStringList>
#include <memory>

class QWindow;

namespace DeskPin {

class CapabilityProbe;
class ReparentEngine;
class ShellLocator;
class WindowObserver;
class ZOrderManager;

/**
 * @brief Pins application windows above the desktop icons
 *
 * Entry point for hosts. Construct one instance at startup and keep it for
 * the process lifetime; it owns the Z-order manager and its sweep timer.
 *
 * Every operation first consults the CapabilityProbe. Where the desktop shell
 * bindings are unavailable (any platform other than Windows, or a missing
 * user32 symbol) all operations are no-ops returning false. No operation
 * throws; failures are logged and reported as false, and the host keeps
 * treating the window as an ordinary top-level window.
 *
 * Usage:
 * @code
 * auto* desktop = new DesktopAttach(app);
 * desktop->setZOrderConfig(settings->zOrderConfig());
 * if (!desktop->attach(QStringLiteral("note-1"), noteWindow)) {
 *     // stays a normal window
 * }
 * QObject::connect(app, &QCoreApplication::aboutToQuit, desktop, &DesktopAttach::cleanupAll);
 * @endcode
 */
class DESKPIN_EXPORT DesktopAttach : public QObject
{
    Q_OBJECT

public:
    explicit DesktopAttach(QObject* parent = nullptr);
    explicit DesktopAttach(std::unique_ptr<CapabilityProbe> probe, QObject* parent = nullptr);
    ~DesktopAttach() override;

    // ═══════════════════════════════════════════════════════════════════════════
    // Capability
    // ═══════════════════════════════════════════════════════════════════════════

    bool isAvailable();
    QString unavailableReason() const;

    // ═══════════════════════════════════════════════════════════════════════════
    // Attach / Detach
    // ═══════════════════════════════════════════════════════════════════════════

    /**
     * @brief Attach a window above the desktop icon layer
     * @param windowId Logical window id (stable across window re-creation)
     * @param handleProvider Yields the window's current native handle
     * @param observer Optional focus/close source driving bringToFront/unregister
     * @return true if the window is now attached
     */
    bool attach(const QString& windowId, const HandleProvider& handleProvider, WindowObserver* observer = nullptr);

    /**
     * @brief Attach a QWindow; focus and close are tracked automatically
     */
    bool attach(const QString& windowId, QWindow* window);

    /**
     * @brief Restore a window to a normal top-level window at the same position
     */
    bool detach(const QString& windowId, const HandleProvider& handleProvider);
    bool detach(const QString& windowId, QWindow* window);

    /**
     * @brief attach() if @p enable, detach() otherwise
     */
    bool toggle(const QString& windowId, const HandleProvider& handleProvider, bool enable,
                WindowObserver* observer = nullptr);
    bool toggle(const QString& windowId, QWindow* window, bool enable);

    // ═══════════════════════════════════════════════════════════════════════════
    // Stacking
    // ═══════════════════════════════════════════════════════════════════════════

    /**
     * @brief Make an attached window the topmost one
     *
     * Needed only when no observer reports focus changes.
     */
    void bringToFront(const QString& windowId);

    /**
     * @brief Forget all attached windows and stop the sweep timer
     *
     * Call at shutdown. Windows are left where they are.
     */
    void cleanupAll();

    // ═══════════════════════════════════════════════════════════════════════════
    // Queries / Configuration
    // ═══════════════════════════════════════════════════════════════════════════

    bool isAttached(const QString& windowId) const;

    /**
     * @brief Attached window ids bottom to top
     */
    QStringList attachedWindows() const;

    ZOrderConfig zOrderConfig() const { return m_config; }
    void setZOrderConfig(const ZOrderConfig& config);

    /**
     * @brief Z-order manager, or nullptr while the bindings are unavailable
     */
    ZOrderManager* zOrderManager() const { return m_zOrderManager.get(); }

Q_SIGNALS:
    void windowAttached(const QString& windowId);
    void windowDetached(const QString& windowId);

private:
    /**
     * @brief Probe once and build the services on first success
     */
    bool ensureServices();

    NativeHandle resolveHandle(const QString& windowId, const HandleProvider& handleProvider) const;

    std::unique_ptr<CapabilityProbe> m_probe;
    ZOrderConfig m_config;

    // Declaration order is destruction order in reverse: engine first, locator last
    std::unique_ptr<ShellLocator> m_shellLocator;
    std::unique_ptr<ZOrderManager> m_zOrderManager;
    std::unique_ptr<ReparentEngine> m_reparentEngine;
};

} // namespace DeskPin
