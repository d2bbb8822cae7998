// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "shelllocator.h"
#include "interfaces.h"
#include "logging.h"

namespace DeskPin {

ShellLocator::ShellLocator(IWindowSystem* windowSystem)
    : m_windowSystem(windowSystem)
{
    Q_ASSERT(windowSystem);
}

std::optional<ShellTarget> ShellLocator::locate() const
{
    if (auto target = locateUnderProgramManager()) {
        return target;
    }

    if (auto target = locateByEnumeration()) {
        return target;
    }

    qCDebug(lcShell) << "Icon view not found in any shell window";
    return std::nullopt;
}

std::optional<ShellTarget> ShellLocator::locateUnderProgramManager() const
{
    const NativeHandle progman = m_windowSystem->findWindow(ShellClass::ProgramManager);
    if (progman.isNull()) {
        return std::nullopt;
    }

    const NativeHandle iconView = m_windowSystem->findChildWindow(progman, ShellClass::IconView);
    if (iconView.isNull()) {
        return std::nullopt;
    }

    qCDebug(lcShell) << "Icon view" << iconView << "found under Progman" << progman;
    return ShellTarget{iconView, progman};
}

std::optional<ShellTarget> ShellLocator::locateByEnumeration() const
{
    std::optional<ShellTarget> result;

    m_windowSystem->enumerateTopLevelWindows([this, &result](NativeHandle candidate) {
        const NativeHandle iconView = m_windowSystem->findChildWindow(candidate, ShellClass::IconView);
        if (iconView.isNull()) {
            return true; // keep looking
        }
        result = ShellTarget{iconView, candidate};
        return false;
    });

    if (result) {
        qCDebug(lcShell) << "Icon view" << result->iconView << "found under" << result->container;
    }
    return result;
}

} // namespace DeskPin
