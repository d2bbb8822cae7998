// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "deskpin_export.h"
#include <QString>
#include <functional>
#include <memory>

namespace DeskPin {

class IWindowSystem;

/**
 * @brief Lazily loads the native window bindings, once
 *
 * The first isAvailable()/bindings() call runs the loader. Its outcome, either
 * a bound IWindowSystem or the reason it could not be bound, is kept for the
 * lifetime of the probe and never retried: a failure means the OS integration
 * layer is absent, not busy.
 *
 * The default loader binds user32 on Windows and reports the platform as
 * unsupported everywhere else. Tests inject their own loader.
 */
class DESKPIN_EXPORT CapabilityProbe
{
public:
    /**
     * @brief Produces the bindings, or nullptr with @p reason filled in
     */
    using Loader = std::function<std::unique_ptr<IWindowSystem>(QString* reason)>;

    CapabilityProbe();
    explicit CapabilityProbe(Loader loader);
    ~CapabilityProbe();

    CapabilityProbe(const CapabilityProbe&) = delete;
    CapabilityProbe& operator=(const CapabilityProbe&) = delete;

    bool isAvailable();

    /**
     * @brief Bound windowing API
     * @return Bindings owned by the probe, or nullptr if unavailable
     */
    IWindowSystem* bindings();

    /**
     * @brief Why the bindings are unavailable (empty if available or not yet probed)
     */
    QString unavailableReason() const { return m_reason; }

    bool hasProbed() const { return m_probed; }

    /**
     * @brief Loader used by the default constructor
     */
    static Loader platformLoader();

private:
    void probe();

    Loader m_loader;
    bool m_probed = false;
    std::unique_ptr<IWindowSystem> m_bindings;
    QString m_reason;
};

} // namespace DeskPin
