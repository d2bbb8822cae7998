// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "deskpinconfig.h" // Generated from deskpin.kcfg via KConfigXT

namespace DeskPin {

/**
 * @brief Static access to the defaults declared in deskpin.kcfg
 *
 * The .kcfg file is the single source of truth; this class only exposes the
 * generated default getters. Core code that cannot depend on config uses the
 * mirrored values in constants.h.
 */
class ConfigDefaults
{
public:
    static int sweepIntervalMs() { return instance().defaultSweepIntervalMsValue(); }
    static int siblingSearchDepth() { return instance().defaultSiblingSearchDepthValue(); }

private:
    // Lazily-initialized singleton instance
    static DeskPinConfig& instance()
    {
        static DeskPinConfig config;
        return config;
    }

    // Non-instantiable
    ConfigDefaults() = delete;
};

} // namespace DeskPin
