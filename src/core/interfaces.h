// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "deskpin_export.h"
#include "nativehandle.h"
#include <QFlags>
#include <QObject>
#include <QRect>
#include <QString>
#include <functional>
#include <optional>

namespace DeskPin {

/**
 * @brief Window style bits DeskPin reads and writes (GWL_STYLE)
 */
namespace WindowStyle {
constexpr quint32 Visible = 0x10000000; // WS_VISIBLE
constexpr quint32 Child = 0x40000000; // WS_CHILD
constexpr quint32 Popup = 0x80000000; // WS_POPUP
}

/**
 * @brief Flags for IWindowSystem::setWindowPosition (subset of SWP_*)
 */
enum class PositionFlag {
    NoFlags = 0,
    NoSize = 0x0001, ///< SWP_NOSIZE - keep current size
    NoMove = 0x0002, ///< SWP_NOMOVE - keep current position
    NoZOrder = 0x0004, ///< SWP_NOZORDER - keep stacking position
    NoActivate = 0x0010, ///< SWP_NOACTIVATE - never take input focus
    ShowWindow = 0x0040 ///< SWP_SHOWWINDOW - make visible
};
Q_DECLARE_FLAGS(PositionFlags, PositionFlag)
Q_DECLARE_OPERATORS_FOR_FLAGS(PositionFlags)

/**
 * @brief Abstract foreign-call layer over the OS windowing API
 *
 * Every call DeskPin makes into the windowing system goes through this
 * interface. Failures are reported by return value (false / std::nullopt),
 * never by exception. Rectangles are always in screen coordinates on read;
 * setWindowPosition() takes coordinates relative to the window's parent
 * client area (screen coordinates for top-level windows).
 *
 * Pure abstract (no QObject), same as the other service interfaces, so it can
 * be mocked without a meta-object.
 */
class DESKPIN_EXPORT IWindowSystem
{
public:
    IWindowSystem() = default;
    virtual ~IWindowSystem();

    /// Visitor for enumerateTopLevelWindows(); return false to stop
    using WindowVisitor = std::function<bool(NativeHandle)>;

    // Lookup
    virtual NativeHandle findWindow(const QString& className) const = 0;
    virtual NativeHandle findChildWindow(NativeHandle parent, const QString& className) const = 0;
    virtual void enumerateTopLevelWindows(const WindowVisitor& visitor) const = 0;

    /**
     * @brief Window directly above @p window among its siblings (GW_HWNDPREV)
     * @return Sibling handle, a null handle at the top of the chain,
     *         or std::nullopt if @p window is no longer a live window
     */
    virtual std::optional<NativeHandle> previousSibling(NativeHandle window) const = 0;

    // Geometry and style
    virtual std::optional<QRect> windowRect(NativeHandle window) const = 0;
    virtual std::optional<quint32> windowStyle(NativeHandle window) const = 0;
    virtual bool setWindowStyle(NativeHandle window, quint32 style) = 0;

    // Hierarchy and stacking
    virtual bool setParent(NativeHandle window, NativeHandle newParent) = 0;

    /**
     * @brief Move/resize the window and place it at the top of its siblings
     * @param window Target window
     * @param geometry Position (parent client coordinates) and size
     * @param flags SWP_* subset; NoZOrder keeps the stacking position
     */
    virtual bool setWindowPosition(NativeHandle window, const QRect& geometry, PositionFlags flags) = 0;
};

/**
 * @brief Focus/close notifications for one tracked window
 *
 * Hosts emit focused() when the window gains input focus and closed() when it
 * is gone. ZOrderManager subscribes to both; see QtWindowObserver for the
 * QWindow adapter.
 */
class DESKPIN_EXPORT WindowObserver : public QObject
{
    Q_OBJECT

public:
    explicit WindowObserver(QObject* parent = nullptr)
        : QObject(parent)
    {
    }
    ~WindowObserver() override;

Q_SIGNALS:
    void focused();
    void closed();
};

} // namespace DeskPin
