// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <QLatin1String>

namespace DeskPin {

/**
 * @brief Default values for core module constants
 *
 * Used by core files that can't depend on config. User-configurable values
 * are mirrored in deskpin.kcfg; keep both in sync.
 */
namespace Defaults {
constexpr int SweepIntervalMs = 2000; // Icon-layer intrusion check
constexpr int SiblingSearchDepth = 20; // GW_HWNDPREV steps per sweep

constexpr int MinSweepIntervalMs = 100;
constexpr int MaxSweepIntervalMs = 60000;
constexpr int MinSiblingSearchDepth = 1;
constexpr int MaxSiblingSearchDepth = 200;
}

/**
 * @brief Window class names of the desktop shell hierarchy
 */
namespace ShellClass {
// Root "Program Manager" window
inline constexpr QLatin1String ProgramManager{"Progman"};
// Window rendering the desktop icons
inline constexpr QLatin1String IconView{"SHELLDLL_DefView"};
}

} // namespace DeskPin
