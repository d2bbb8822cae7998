// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "deskpin_export.h"
#include "constants.h"
#include "nativehandle.h"
#include <QMetaObject>
#include <QPointer>
#include <QString>
#include <QVector>
#include <functional>

namespace DeskPin {

class WindowObserver;

/**
 * @brief Supplies the native handle of a logical window on demand
 *
 * Called once per attach/detach; the handle of a recreated window may differ
 * from the one seen before.
 */
using HandleProvider = std::function<NativeHandle()>;

/**
 * @brief The desktop icon layer as found by ShellLocator
 */
struct DESKPIN_EXPORT ShellTarget
{
    NativeHandle iconView; ///< SHELLDLL_DefView
    NativeHandle container; ///< Direct parent of the icon view (Progman or a WorkerW)
};

/**
 * @brief One window tracked by ZOrderManager
 */
struct DESKPIN_EXPORT WindowEntry
{
    QString windowId; ///< Application-assigned logical id, stable across re-creation
    NativeHandle handle; ///< Current OS handle
    QPointer<WindowObserver> observer;
    QVector<QMetaObject::Connection> connections; ///< Observer subscriptions, dropped on removal
};

/**
 * @brief Tunables of the Z-order sweep
 *
 * Value type; Settings::zOrderConfig() builds it from deskpinrc.
 */
struct DESKPIN_EXPORT ZOrderConfig
{
    int sweepIntervalMs = Defaults::SweepIntervalMs;
    int siblingSearchDepth = Defaults::SiblingSearchDepth;

    bool operator==(const ZOrderConfig& other) const
    {
        return sweepIntervalMs == other.sweepIntervalMs && siblingSearchDepth == other.siblingSearchDepth;
    }
    bool operator!=(const ZOrderConfig& other) const { return !(*this == other); }
};

} // namespace DeskPin
