// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "platform.h"
#include <QGuiApplication>

namespace DeskPin {

namespace Platform {

bool hasDesktopShell()
{
#ifdef DESKPIN_HAVE_WIN32_SHELL
    return true;
#else
    return false;
#endif
}

QString windowingPlatform()
{
    if (const auto* app = qGuiApp) {
        return app->platformName();
    }
    return QStringLiteral("unknown");
}

bool isDesktopShellSession()
{
    if (!hasDesktopShell()) {
        return false;
    }

    // Offscreen/minimal plugins run headless; there is no shell to attach to
    const QString platform = windowingPlatform();
    return platform == QLatin1String("windows") || platform == QLatin1String("unknown");
}

} // namespace Platform

} // namespace DeskPin
