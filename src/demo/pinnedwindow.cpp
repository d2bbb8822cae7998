// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "pinnedwindow.h"
#include <QPainter>

namespace DeskPin {

PinnedWindow::PinnedWindow(const QString& label, const QColor& color)
    : m_label(label)
    , m_color(color)
{
    setFlags(Qt::FramelessWindowHint | Qt::Tool);
    setTitle(label);
}

void PinnedWindow::paintEvent(QPaintEvent* /*event*/)
{
    QPainter painter(this);
    painter.fillRect(QRect(QPoint(0, 0), size()), m_color);
    painter.setPen(Qt::white);
    painter.drawText(QRect(QPoint(0, 0), size()), Qt::AlignCenter, m_label);
}

} // namespace DeskPin
