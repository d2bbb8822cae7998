// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <QColor>
#include <QRasterWindow>
#include <QString>

namespace DeskPin {

/**
 * @brief Frameless colored window used by deskpin-demo
 */
class PinnedWindow : public QRasterWindow
{
    Q_OBJECT

public:
    PinnedWindow(const QString& label, const QColor& color);

    QString label() const { return m_label; }

protected:
    void paintEvent(QPaintEvent* event) override;

private:
    QString m_label;
    QColor m_color;
};

} // namespace DeskPin
