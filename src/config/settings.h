// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "deskpin_export.h"
#include "../core/types.h"
#include <QObject>
#include <QString>

class KConfigGroup;

namespace DeskPin {

/**
 * @brief User settings for DeskPin
 *
 * Reads and writes the [ZOrder] group of deskpinrc through KConfig. Values
 * outside their valid range fall back to the .kcfg default with a warning.
 *
 * Note: This class does NOT use the singleton pattern. Create instances
 * where needed and pass via dependency injection.
 */
class DESKPIN_EXPORT Settings : public QObject
{
    Q_OBJECT

    Q_PROPERTY(int sweepIntervalMs READ sweepIntervalMs WRITE setSweepIntervalMs NOTIFY sweepIntervalMsChanged)
    Q_PROPERTY(
        int siblingSearchDepth READ siblingSearchDepth WRITE setSiblingSearchDepth NOTIFY siblingSearchDepthChanged)

public:
    /**
     * @param configName KConfig file name, "deskpinrc" unless overridden (tests)
     */
    explicit Settings(const QString& configName = QStringLiteral("deskpinrc"), QObject* parent = nullptr);
    ~Settings() override;

    int sweepIntervalMs() const { return m_sweepIntervalMs; }
    void setSweepIntervalMs(int value);

    int siblingSearchDepth() const { return m_siblingSearchDepth; }
    void setSiblingSearchDepth(int value);

    /**
     * @brief Current values as the struct ZOrderManager consumes
     */
    ZOrderConfig zOrderConfig() const;

    void load();
    void save();
    void reset();

    QString configName() const { return m_configName; }

Q_SIGNALS:
    void settingsChanged();
    void sweepIntervalMsChanged();
    void siblingSearchDepthChanged();

private:
    static int readValidatedInt(const KConfigGroup& group, const char* key, int defaultValue, int min, int max,
                                const char* settingName);

    QString m_configName;
    int m_sweepIntervalMs;
    int m_siblingSearchDepth;
};

} // namespace DeskPin
