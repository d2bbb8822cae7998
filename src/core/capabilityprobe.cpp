// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "capabilityprobe.h"
#include "interfaces.h"
#include "logging.h"
#include "platform.h"
#include <exception>

#ifdef DESKPIN_HAVE_WIN32_SHELL
#include "platform/win32windowsystem.h"
#endif

namespace DeskPin {

CapabilityProbe::CapabilityProbe()
    : CapabilityProbe(platformLoader())
{
}

CapabilityProbe::CapabilityProbe(Loader loader)
    : m_loader(std::move(loader))
{
}

CapabilityProbe::~CapabilityProbe() = default;

CapabilityProbe::Loader CapabilityProbe::platformLoader()
{
    return [](QString* reason) -> std::unique_ptr<IWindowSystem> {
        if (!Platform::isDesktopShellSession()) {
            *reason = QStringLiteral("desktop shell hierarchy not supported on platform '%1'")
                          .arg(Platform::windowingPlatform());
            return nullptr;
        }
#ifdef DESKPIN_HAVE_WIN32_SHELL
        return Win32WindowSystem::load(reason);
#else
        return nullptr;
#endif
    };
}

bool CapabilityProbe::isAvailable()
{
    if (!m_probed) {
        probe();
    }
    return m_bindings != nullptr;
}

IWindowSystem* CapabilityProbe::bindings()
{
    return isAvailable() ? m_bindings.get() : nullptr;
}

void CapabilityProbe::probe()
{
    m_probed = true;

    if (!m_loader) {
        m_reason = QStringLiteral("no binding loader");
        qCWarning(lcProbe) << "Desktop attach unavailable:" << m_reason;
        return;
    }

    QString reason;
    try {
        m_bindings = m_loader(&reason);
    } catch (const std::exception& e) {
        m_bindings.reset();
        reason = QString::fromLocal8Bit(e.what());
    }

    if (m_bindings) {
        m_reason.clear();
        qCInfo(lcProbe) << "Desktop shell bindings loaded";
        return;
    }

    m_reason = reason.isEmpty() ? QStringLiteral("bindings could not be loaded") : reason;
    qCWarning(lcProbe) << "Desktop attach unavailable:" << m_reason;
}

} // namespace DeskPin
