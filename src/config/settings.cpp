// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "settings.h"
#include "configdefaults.h"
#include "../core/constants.h"
#include "../core/logging.h"
#include <KConfigGroup>
#include <KSharedConfig>

namespace DeskPin {

namespace {
const QString ZOrderGroup = QStringLiteral("ZOrder");
constexpr const char* SweepIntervalKey = "SweepIntervalMs";
constexpr const char* SiblingSearchDepthKey = "SiblingSearchDepth";
} // anonymous namespace

// Clamped int setter: clamp value, then apply if changed
#define SETTINGS_SETTER_CLAMPED(name, member, signal, minVal, maxVal) \
    void Settings::set##name(int value) \
    { \
        value = qBound(minVal, value, maxVal); \
        if (member != value) { \
            member = value; \
            Q_EMIT signal(); \
            Q_EMIT settingsChanged(); \
        } \
    }

Settings::Settings(const QString& configName, QObject* parent)
    : QObject(parent)
    , m_configName(configName)
    , m_sweepIntervalMs(ConfigDefaults::sweepIntervalMs())
    , m_siblingSearchDepth(ConfigDefaults::siblingSearchDepth())
{
}

Settings::~Settings() = default;

SETTINGS_SETTER_CLAMPED(SweepIntervalMs, m_sweepIntervalMs, sweepIntervalMsChanged, Defaults::MinSweepIntervalMs,
                        Defaults::MaxSweepIntervalMs)
SETTINGS_SETTER_CLAMPED(SiblingSearchDepth, m_siblingSearchDepth, siblingSearchDepthChanged,
                        Defaults::MinSiblingSearchDepth, Defaults::MaxSiblingSearchDepth)

ZOrderConfig Settings::zOrderConfig() const
{
    ZOrderConfig config;
    config.sweepIntervalMs = m_sweepIntervalMs;
    config.siblingSearchDepth = m_siblingSearchDepth;
    return config;
}

int Settings::readValidatedInt(const KConfigGroup& group, const char* key, int defaultValue, int min, int max,
                               const char* settingName)
{
    int value = group.readEntry(QLatin1String(key), defaultValue);
    if (value < min || value > max) {
        qCWarning(lcConfig) << "Invalid" << settingName << ":" << value << "using default (must be" << min << "-"
                            << max << ")";
        value = defaultValue;
    }
    return value;
}

void Settings::load()
{
    auto config = KSharedConfig::openConfig(m_configName);

    // KSharedConfig caches in memory; pick up edits made by other processes
    config->reparseConfiguration();

    const KConfigGroup zOrder = config->group(ZOrderGroup);

    const int sweepInterval =
        readValidatedInt(zOrder, SweepIntervalKey, ConfigDefaults::sweepIntervalMs(), Defaults::MinSweepIntervalMs,
                         Defaults::MaxSweepIntervalMs, "sweep interval");
    const int searchDepth =
        readValidatedInt(zOrder, SiblingSearchDepthKey, ConfigDefaults::siblingSearchDepth(),
                         Defaults::MinSiblingSearchDepth, Defaults::MaxSiblingSearchDepth, "sibling search depth");

    setSweepIntervalMs(sweepInterval);
    setSiblingSearchDepth(searchDepth);

    qCInfo(lcConfig) << "Settings loaded from" << m_configName << "- sweep interval:" << m_sweepIntervalMs
                     << "ms, sibling search depth:" << m_siblingSearchDepth;
}

void Settings::save()
{
    auto config = KSharedConfig::openConfig(m_configName);
    KConfigGroup zOrder = config->group(ZOrderGroup);

    zOrder.writeEntry(QLatin1String(SweepIntervalKey), m_sweepIntervalMs);
    zOrder.writeEntry(QLatin1String(SiblingSearchDepthKey), m_siblingSearchDepth);

    if (!config->sync()) {
        qCWarning(lcConfig) << "Failed to write" << m_configName;
        return;
    }
    qCDebug(lcConfig) << "Settings saved to" << m_configName;
}

void Settings::reset()
{
    setSweepIntervalMs(ConfigDefaults::sweepIntervalMs());
    setSiblingSearchDepth(ConfigDefaults::siblingSearchDepth());
}

} // namespace DeskPin
