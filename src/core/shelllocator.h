// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "deskpin_export.h"
#include "types.h"
#include <optional>

namespace DeskPin {

class IWindowSystem;

/**
 * @brief Finds the desktop icon view and the window that directly contains it
 *
 * Shell versions put SHELLDLL_DefView either under Progman or under one of the
 * WorkerW windows spawned behind it. The Progman path is tried first; the
 * top-level enumeration stops at the first container that has the icon view.
 *
 * Results are never cached: the shell may restart and rebuild its windows at
 * any time, so callers locate again on every attach and every sweep.
 */
class DESKPIN_EXPORT ShellLocator
{
public:
    explicit ShellLocator(IWindowSystem* windowSystem);

    /**
     * @brief Locate the icon layer
     * @return Icon view and container, or std::nullopt if neither path finds it
     */
    std::optional<ShellTarget> locate() const;

private:
    std::optional<ShellTarget> locateUnderProgramManager() const;
    std::optional<ShellTarget> locateByEnumeration() const;

    IWindowSystem* m_windowSystem;
};

} // namespace DeskPin
