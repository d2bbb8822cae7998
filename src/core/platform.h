// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "deskpin_export.h"
#include <QString>

namespace DeskPin {

/**
 * @brief Platform detection
 *
 * Compile-time and runtime checks for the desktop shell hierarchy DeskPin
 * attaches to.
 */
namespace Platform {

/**
 * @brief Check if the Win32 shell binding is compiled in
 * @return true on Windows builds (DESKPIN_HAVE_WIN32_SHELL)
 */
DESKPIN_EXPORT bool hasDesktopShell();

/**
 * @brief Get the Qt platform plugin name
 * @return e.g. "windows", "xcb", "wayland", or "unknown" without a QGuiApplication
 */
DESKPIN_EXPORT QString windowingPlatform();

/**
 * @brief Check if the running session can host shell-attached windows
 * @return true if the binding is compiled in and the Qt platform is "windows"
 */
DESKPIN_EXPORT bool isDesktopShellSession();

} // namespace Platform

} // namespace DeskPin
