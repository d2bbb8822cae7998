// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "deskpin_export.h"
#include <QLoggingCategory>

/**
 * @file logging.h
 * @brief Centralized logging categories for DeskPin
 *
 * Use these categories instead of plain qDebug/qWarning.
 *
 * Usage:
 *   #include "logging.h"
 *   qCDebug(lcZOrder) << "Debug message";
 *   qCWarning(lcReparent) << "Warning message";
 *
 * Runtime filtering via environment variable:
 *   QT_LOGGING_RULES="deskpin.*=true"              # Enable all
 *   QT_LOGGING_RULES="deskpin.*.debug=false"       # Disable debug only
 *   QT_LOGGING_RULES="deskpin.zorder.debug=true"   # Trace every sweep
 *
 * Severity Guidelines:
 *   qCDebug    - Per-call tracing (corrections, sweeps, enumeration)
 *   qCInfo     - Attach/detach outcomes, capability probe result
 *   qCWarning  - Foreign-call failures, shell not found, stale handles, bad config
 *   qCCritical - Not used by the library; failures never stop the host
 */

namespace DeskPin {

// Facade and shared types
DESKPIN_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcCore)

// Capability probe and native bindings
DESKPIN_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcProbe)

// Desktop shell lookup (Progman / SHELLDLL_DefView)
DESKPIN_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcShell)

// Attach/detach coordinate transform
DESKPIN_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcReparent)

// Z-order queue and sweep timer
DESKPIN_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcZOrder)

// Configuration loading/saving
DESKPIN_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcConfig)

// Demo host
DESKPIN_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcDemo)

} // namespace DeskPin
